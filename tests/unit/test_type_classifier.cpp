// File: tests/unit/test_type_classifier.cpp
// Purpose: Verify Java parameter types map to the fixed marshalling categories
//          and native pointer types.
// Key invariants: Unknown types fall back to object handles; the pointer type
//                 table never changes.
// Links: src/frontends/java/TypeClassifier.cpp

#include <gtest/gtest.h>

#include "frontends/java/TypeClassifier.hpp"

#include <string_view>
#include <utility>

using namespace jnigen::frontends::java;

TEST(TypeClassifier, PrimitivesArePlainOldData)
{
    for (std::string_view name : {"boolean", "byte", "char", "short", "int", "long", "float", "double"})
    {
        const ArgumentType type = classify(name);
        EXPECT_TRUE(type.isPlainOldData()) << name;
        EXPECT_FALSE(type.needsMarshalling()) << name;
        EXPECT_TRUE(pointerCType(type).empty()) << name;
    }
}

TEST(TypeClassifier, ArrayPointerTable)
{
    const std::pair<std::string_view, std::string_view> table[] = {
        {"boolean[]", "bool*"},
        {"byte[]", "char*"},
        {"char[]", "unsigned short*"},
        {"short[]", "short*"},
        {"int[]", "int*"},
        {"long[]", "long long*"},
        {"float[]", "float*"},
        {"double[]", "double*"},
    };
    for (const auto &[declared, pointer] : table)
    {
        const ArgumentType type = classify(declared);
        EXPECT_TRUE(type.isArray()) << declared;
        EXPECT_EQ(pointerCType(type), pointer) << declared;
    }
}

TEST(TypeClassifier, BufferPointerTable)
{
    const std::pair<std::string_view, std::string_view> table[] = {
        {"Buffer", "unsigned char*"},
        {"ByteBuffer", "char*"},
        {"CharBuffer", "unsigned short*"},
        {"ShortBuffer", "short*"},
        {"IntBuffer", "int*"},
        {"LongBuffer", "long long*"},
        {"FloatBuffer", "float*"},
        {"DoubleBuffer", "double*"},
    };
    for (const auto &[declared, pointer] : table)
    {
        const ArgumentType type = classify(declared);
        EXPECT_TRUE(type.isBuffer()) << declared;
        EXPECT_EQ(pointerCType(type), pointer) << declared;
    }
}

TEST(TypeClassifier, StringsInAnySpelling)
{
    EXPECT_TRUE(classify("String").isString());
    EXPECT_TRUE(classify("java.lang.String").isString());
    EXPECT_EQ(pointerCType(classify("String")), "char*");
}

TEST(TypeClassifier, QualifiedBuffersAndWhitespace)
{
    EXPECT_TRUE(classify("java.nio.FloatBuffer").isBuffer());
    EXPECT_TRUE(classify("int [ ]").isArray());
    EXPECT_EQ(classify("int [ ]").declared, "int[]");
}

TEST(TypeClassifier, VarargsBehaveLikeArrays)
{
    const ArgumentType type = classify("float...");
    EXPECT_TRUE(type.isArray());
    EXPECT_EQ(pointerCType(type), "float*");
}

TEST(TypeClassifier, EverythingElseIsAnObjectHandle)
{
    for (std::string_view name : {"Object", "int[][]", "String[]", "java.util.List<String>", "Integer",
                                  "com.example.Buffer2", "MappedByteBuffer"})
    {
        const ArgumentType type = classify(name);
        EXPECT_TRUE(type.isObject()) << name;
        EXPECT_FALSE(type.needsMarshalling()) << name;
    }
}

TEST(TypeClassifier, KindNames)
{
    EXPECT_EQ(kindName(ArgumentKind::Array), "array");
    EXPECT_EQ(kindName(ArgumentKind::PlainOldData), "pod");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
