// File: tests/codegen/test_code_emitter.cpp
// Purpose: Verify the emitted JNI glue: function heads, acquisition and
//          release ordering, line markers and the inner/outer decomposition.
// Key invariants: Acquisition runs buffers, strings, arrays; release runs
//                 arrays, strings; buffers are never released.
// Links: src/codegen/jni/CodeEmitter.cpp

#include <gtest/gtest.h>

#include "codegen/jni/CodeEmitter.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace jnigen::codegen::jni;
using namespace jnigen::frontends::java;
using jnigen::frontends::jni::LowLevelSignature;

namespace
{
struct Param
{
    std::string type;
    std::string name;
    std::string cType;
};

MatchedDeclaration makeMatched(bool isStatic,
                               const std::string &method,
                               const std::vector<Param> &params,
                               const std::string &code,
                               uint32_t line,
                               const std::string &ret = "void")
{
    MatchedDeclaration m;
    m.declaration.className = "Foo";
    m.declaration.methodName = method;
    m.declaration.isStatic = isStatic;
    m.declaration.embeddedCode = code;
    m.declaration.startLine = line;
    m.declaration.endLine = line;
    m.signature.functionName = "Java_Foo_" + method;
    m.signature.returnCType = ret;
    m.signature.headerLine = "JNIEXPORT " + ret + " JNICALL " + m.signature.functionName;
    m.signature.argumentCTypes = {"JNIEnv *", isStatic ? "jclass" : "jobject"};
    for (const auto &p : params)
    {
        m.declaration.arguments.push_back(Argument{p.name, classify(p.type)});
        m.signature.argumentCTypes.push_back(p.cType);
    }
    return m;
}

std::string emitOne(const MatchedDeclaration &m)
{
    std::ostringstream os;
    CodeEmitter().emitMethod(os, m);
    return os.str();
}

std::size_t countOf(const std::string &text, const std::string &needle)
{
    std::size_t n = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size()))
        ++n;
    return n;
}
} // namespace

TEST(CodeEmitter, ArrayArgumentWithoutReturnStaysInline)
{
    const auto m = makeMatched(true,
                               "scale",
                               {{"int[]", "data", "jintArray"}, {"int", "len", "jint"}},
                               "for(int i=0;i<len;i++) data[i]*=2;",
                               5);
    ASSERT_FALSE(needsDecomposition(m.declaration));
    const std::string expected =
        "JNIEXPORT void JNICALL Java_Foo_scale(JNIEnv* env, jclass clazz, jintArray obj_data, "
        "jint len) {\n"
        "\tint* data = (int*)env->GetPrimitiveArrayCritical(obj_data, 0);\n"
        "\n"
        "\n//@line:5\n"
        "for(int i=0;i<len;i++) data[i]*=2;\n"
        "\n"
        "\tenv->ReleasePrimitiveArrayCritical(obj_data, data, 0);\n"
        "\n"
        "}\n\n";
    EXPECT_EQ(emitOne(m), expected);
}

TEST(CodeEmitter, InstanceStringWithReturnIsDecomposed)
{
    const auto m =
        makeMatched(false, "first", {{"String", "s", "jstring"}}, "\n\treturn s[0];\n", 8, "jint");
    ASSERT_TRUE(needsDecomposition(m.declaration));

    const std::string expected =
        "static inline jint wrapped_Java_Foo_first\n"
        "(JNIEnv* env, jobject object, jstring obj_s, char* s) {\n"
        "\n//@line:8\n"
        "\n\treturn s[0];\n"
        "\n"
        "}\n\n"
        "JNIEXPORT jint JNICALL Java_Foo_first(JNIEnv* env, jobject object, jstring obj_s) {\n"
        "\tchar* s = (char*)env->GetStringUTFChars(obj_s, 0);\n"
        "\n"
        "\tjint JNI_returnValue = wrapped_Java_Foo_first(env, object, obj_s, s);\n\n"
        "\tenv->ReleaseStringUTFChars(obj_s, s);\n"
        "\n"
        "\treturn JNI_returnValue;\n"
        "}\n\n";
    EXPECT_EQ(emitOne(m), expected);
}

TEST(CodeEmitter, VoidDecompositionHasNoCapture)
{
    const auto m =
        makeMatched(true, "fill", {{"int[]", "a", "jintArray"}}, "if (!a) return; a[0] = 1;", 4);
    const std::string out = emitOne(m);
    EXPECT_NE(out.find("\twrapped_Java_Foo_fill(env, clazz, obj_a, a);\n\n"), std::string::npos);
    EXPECT_EQ(out.find("JNI_returnValue"), std::string::npos);
    EXPECT_TRUE(out.ends_with("\tenv->ReleasePrimitiveArrayCritical(obj_a, a, 0);\n\n}\n\n"));
}

TEST(CodeEmitter, DecompositionTrigger)
{
    EXPECT_FALSE(needsDecomposition(
        makeMatched(true, "f", {{"int", "x", "jint"}}, "return x;", 1, "jint").declaration));
    EXPECT_FALSE(needsDecomposition(
        makeMatched(true, "g", {{"int[]", "a", "jintArray"}}, "a[0] = 0;", 1).declaration));
    EXPECT_TRUE(needsDecomposition(
        makeMatched(true, "h", {{"ByteBuffer", "b", "jobject"}}, "returnCode(b);", 1).declaration));
}

TEST(CodeEmitter, AcquisitionAndReleaseOrdering)
{
    const auto m = makeMatched(true,
                               "mix",
                               {{"int[]", "a", "jintArray"},
                                {"String", "s", "jstring"},
                                {"ByteBuffer", "b", "jobject"},
                                {"double[]", "d", "jdoubleArray"},
                                {"Object", "o", "jobject"}},
                               "use(a, s, b, d, o);",
                               2);
    const std::string out = emitOne(m);

    const auto buf = out.find("char* b = (char*)env->GetDirectBufferAddress(obj_b);");
    const auto str = out.find("char* s = (char*)env->GetStringUTFChars(obj_s, 0);");
    const auto arrA = out.find("int* a = (int*)env->GetPrimitiveArrayCritical(obj_a, 0);");
    const auto arrD = out.find("double* d = (double*)env->GetPrimitiveArrayCritical(obj_d, 0);");
    ASSERT_NE(buf, std::string::npos);
    ASSERT_NE(str, std::string::npos);
    ASSERT_NE(arrA, std::string::npos);
    ASSERT_NE(arrD, std::string::npos);
    EXPECT_LT(buf, str);
    EXPECT_LT(str, arrA);
    EXPECT_LT(arrA, arrD);

    const auto relA = out.find("env->ReleasePrimitiveArrayCritical(obj_a, a, 0);");
    const auto relD = out.find("env->ReleasePrimitiveArrayCritical(obj_d, d, 0);");
    const auto relS = out.find("env->ReleaseStringUTFChars(obj_s, s);");
    ASSERT_NE(relS, std::string::npos);
    EXPECT_LT(relA, relD);
    EXPECT_LT(relD, relS);

    EXPECT_EQ(countOf(out, "env->Get"), 4u);
    EXPECT_EQ(countOf(out, "env->Release"), 3u);
    EXPECT_EQ(out.find("obj_o"), std::string::npos);
    EXPECT_NE(out.find("jobject o)"), std::string::npos);
}

TEST(CodeEmitter, NoArgumentsSignature)
{
    const auto m = makeMatched(true, "ping", {}, " puts(\"x\"); ", 3);
    const std::string expected = "JNIEXPORT void JNICALL Java_Foo_ping(JNIEnv* env, jclass clazz) {\n"
                                 "\n"
                                 "\n//@line:3\n puts(\"x\"); \n"
                                 "\n"
                                 "}\n\n";
    EXPECT_EQ(emitOne(m), expected);
}

TEST(CodeEmitter, UnitKeepsSegmentOrderAndStripsCarriageReturns)
{
    MatchedSegmentList segments;
    segments.emplace_back(RawBlock{"\r\n#include <x.h>\r\n", 2});
    segments.emplace_back(makeMatched(true, "ping", {}, "p();", 6));
    segments.emplace_back(RawBlock{"static int y;", 11});

    const std::string out = CodeEmitter().emit(segments, "Foo.h");
    EXPECT_TRUE(out.starts_with("#include <Foo.h>\n\n//@line:2\n\n#include <x.h>\n"));
    EXPECT_EQ(out.find('\r'), std::string::npos);

    const auto marker2 = out.find("//@line:2\n");
    const auto marker6 = out.find("//@line:6\n");
    const auto marker11 = out.find("//@line:11\nstatic int y;");
    EXPECT_LT(marker2, marker6);
    EXPECT_LT(marker6, marker11);
    EXPECT_NE(marker11, std::string::npos);
}

TEST(CodeEmitter, EmptyUnitIsJustTheInclude)
{
    EXPECT_EQ(CodeEmitter().emit({}, "com.example.Empty.h"), "#include <com.example.Empty.h>\n");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
