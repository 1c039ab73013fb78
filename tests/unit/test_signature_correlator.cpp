// File: tests/unit/test_signature_correlator.cpp
// Purpose: Verify declarations pair with JNI prototypes by mangled name and
//          argument count, and that a missing prototype fails the file.
// Key invariants: argumentCTypes.size() - 2 == arguments.size() for every match.
// Links: src/codegen/jni/SignatureCorrelator.cpp

#include <gtest/gtest.h>

#include "codegen/jni/SignatureCorrelator.hpp"

#include <string>
#include <vector>

using namespace jnigen::codegen::jni;
using namespace jnigen::frontends::java;
using jnigen::frontends::jni::LowLevelSignature;

namespace
{
Declaration makeDecl(std::string cls, std::string method, std::vector<std::string> types, uint32_t line = 1)
{
    Declaration decl;
    decl.className = std::move(cls);
    decl.methodName = std::move(method);
    decl.isStatic = true;
    int n = 0;
    for (const auto &t : types)
        decl.arguments.push_back(Argument{"a" + std::to_string(n++), classify(t)});
    decl.startLine = line;
    decl.endLine = line;
    return decl;
}

LowLevelSignature makeSig(std::string name, std::vector<std::string> args, std::string ret = "void")
{
    LowLevelSignature sig;
    sig.functionName = name;
    sig.returnCType = ret;
    sig.headerLine = "JNIEXPORT " + ret + " JNICALL " + name;
    sig.argumentCTypes = {"JNIEnv *", "jclass"};
    sig.argumentCTypes.insert(sig.argumentCTypes.end(), args.begin(), args.end());
    return sig;
}
} // namespace

TEST(SignatureCorrelator, OverloadsResolveByArgumentCount)
{
    const std::vector<LowLevelSignature> sigs = {
        makeSig("Java_com_example_Class_foo__II", {"jint", "jint"}),
        makeSig("Java_com_example_Class_foo__I", {"jint"}),
    };
    SegmentList segments;
    segments.emplace_back(makeDecl("Class", "foo", {"int"}));
    segments.emplace_back(makeDecl("Class", "foo", {"int", "int"}));

    auto matched = correlate(segments, sigs);
    ASSERT_TRUE(matched.hasValue()) << matched.error().message;
    ASSERT_EQ(matched.value().size(), 2u);
    const auto &one = std::get<MatchedDeclaration>(matched.value()[0]);
    const auto &two = std::get<MatchedDeclaration>(matched.value()[1]);
    EXPECT_EQ(one.signature.functionName, "Java_com_example_Class_foo__I");
    EXPECT_EQ(two.signature.functionName, "Java_com_example_Class_foo__II");
    EXPECT_EQ(one.signature.argumentCTypes.size() - 2, one.declaration.arguments.size());
    EXPECT_EQ(two.signature.argumentCTypes.size() - 2, two.declaration.arguments.size());
}

TEST(SignatureCorrelator, EqualArityTakesFirstInHeaderOrder)
{
    const std::vector<LowLevelSignature> sigs = {
        makeSig("Java_A_f__I", {"jint"}),
        makeSig("Java_A_f__F", {"jfloat"}),
    };
    const Declaration decl = makeDecl("A", "f", {"float"});
    const LowLevelSignature *sig = findSignature(decl, sigs);
    ASSERT_NE(sig, nullptr);
    EXPECT_EQ(sig->functionName, "Java_A_f__I");
}

TEST(SignatureCorrelator, LongerMethodNameWithSamePrefixDoesNotMatch)
{
    const std::vector<LowLevelSignature> sigs = {
        makeSig("Java_Foo_getAll", {"jint"}, "jint"),
        makeSig("Java_Foo_get", {"jint"}, "jint"),
    };
    SegmentList segments;
    segments.emplace_back(makeDecl("Foo", "getAll", {"int"}, 2));
    segments.emplace_back(makeDecl("Foo", "get", {"int"}, 3));

    auto matched = correlate(segments, sigs);
    ASSERT_TRUE(matched.hasValue()) << matched.error().message;
    ASSERT_EQ(matched.value().size(), 2u);
    EXPECT_EQ(std::get<MatchedDeclaration>(matched.value()[0]).signature.functionName,
              "Java_Foo_getAll");
    EXPECT_EQ(std::get<MatchedDeclaration>(matched.value()[1]).signature.functionName,
              "Java_Foo_get");
}

TEST(SignatureCorrelator, TokenMustEndNameOrPrecedeOverloadSuffix)
{
    const std::vector<LowLevelSignature> sigs = {
        makeSig("Java_p_Foo_get_1all", {"jint"}),
        makeSig("Java_p_SubFoo_get", {"jint"}),
    };
    EXPECT_EQ(findSignature(makeDecl("Foo", "get", {"int"}), sigs), nullptr);

    const std::vector<LowLevelSignature> overloaded = {makeSig("Java_p_Foo_get__I", {"jint"})};
    const LowLevelSignature *sig = findSignature(makeDecl("Foo", "get", {"int"}), overloaded);
    ASSERT_NE(sig, nullptr);
    EXPECT_EQ(sig->functionName, "Java_p_Foo_get__I");
}

TEST(SignatureCorrelator, NestedClassesUseMangledToken)
{
    const std::vector<LowLevelSignature> sigs = {
        makeSig("Java_pkg_Outer_00024Inner_do_1it", {}),
    };
    EXPECT_NE(findSignature(makeDecl("Outer$Inner", "do_it", {}), sigs), nullptr);
    EXPECT_EQ(findSignature(makeDecl("Outer", "do_it", {}), sigs), nullptr);
}

TEST(SignatureCorrelator, RawBlocksPassThroughInOrder)
{
    const std::vector<LowLevelSignature> sigs = {makeSig("Java_A_g", {})};
    SegmentList segments;
    segments.emplace_back(RawBlock{"#include <a.h>", 2});
    segments.emplace_back(makeDecl("A", "g", {}));
    segments.emplace_back(RawBlock{"static int x;", 9});

    auto matched = correlate(segments, sigs);
    ASSERT_TRUE(matched.hasValue());
    ASSERT_EQ(matched.value().size(), 3u);
    EXPECT_TRUE(std::holds_alternative<RawBlock>(matched.value()[0]));
    EXPECT_TRUE(std::holds_alternative<MatchedDeclaration>(matched.value()[1]));
    EXPECT_EQ(std::get<RawBlock>(matched.value()[2]).startLine, 9u);
}

TEST(SignatureCorrelator, MissingSignatureIsFatal)
{
    const std::vector<LowLevelSignature> sigs = {makeSig("Java_A_g", {"jint"})};
    SegmentList segments;
    segments.emplace_back(makeDecl("A", "g", {}, 12));

    auto matched = correlate(segments, sigs, 3);
    ASSERT_FALSE(matched.hasValue());
    EXPECT_EQ(matched.error().loc.file_id, 3u);
    EXPECT_EQ(matched.error().loc.line, 12u);
    EXPECT_EQ(matched.error().message.rfind("no matching signature for 'A#g'", 0), 0u);
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
