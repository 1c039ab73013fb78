// File: tests/codegen/test_generator.cpp
// Purpose: Run the whole one-file pipeline on a Java source and its javah
//          header, and check failures leave the output empty.
// Key invariants: output is empty unless every stage succeeded.
// Links: src/codegen/jni/Generator.cpp

#include <gtest/gtest.h>

#include "jnigen/Generator.hpp"

#include <sstream>
#include <string>

using jnigen::generateUnit;
using jnigen::UnitInput;
using jnigen::UnitResult;
using jnigen::support::Options;
using jnigen::support::SourceManager;

namespace
{
constexpr std::string_view kJava = "package com.example;\n"                                      // 1
                                   "\n"                                                          // 2
                                   "public class Native {\n"                                     // 3
                                   "    /*JNI\n"                                                 // 4
                                   "    #include <string.h>\n"                                   // 5
                                   "    */\n"                                                    // 6
                                   "    public static native int length(String s); /*\n"         // 7
                                   "        return strlen(s);\n"                                 // 8
                                   "    */\n"                                                    // 9
                                   "    public static native void clear(int[] a, int n); /*\n"   // 10
                                   "        memset(a, 0, n * sizeof(int));\n"                    // 11
                                   "    */\n"                                                    // 12
                                   "}\n";

constexpr std::string_view kHeader =
    "#include <jni.h>\n"
    "JNIEXPORT jint JNICALL Java_com_example_Native_length\n"
    "  (JNIEnv *, jclass, jstring);\n"
    "JNIEXPORT void JNICALL Java_com_example_Native_clear\n"
    "  (JNIEnv *, jclass, jintArray, jint);\n";

UnitInput makeInput(std::string_view java, std::string_view header)
{
    UnitInput input;
    input.javaSource = java;
    input.javaPath = "src/com/example/Native.java";
    input.headerSource = header;
    input.headerPath = "jni/com.example.Native.h";
    return input;
}
} // namespace

TEST(Generator, ProducesUnitForMatchedSources)
{
    SourceManager sm;
    const UnitResult result = generateUnit(makeInput(kJava, kHeader), Options{}, sm);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.rawBlockCount, 1u);
    EXPECT_EQ(result.declarationCount, 2u);

    const std::string &out = result.output;
    EXPECT_TRUE(out.starts_with("#include <com.example.Native.h>\n\n//@line:4\n"));
    EXPECT_NE(out.find("static inline jint wrapped_Java_com_example_Native_length\n"
                       "(JNIEnv* env, jclass clazz, jstring obj_s, char* s) {\n"),
              std::string::npos);
    EXPECT_NE(out.find("JNIEXPORT void JNICALL Java_com_example_Native_clear(JNIEnv* env, jclass "
                       "clazz, jintArray obj_a, jint n) {\n"),
              std::string::npos);
    EXPECT_NE(out.find("//@line:10\n"), std::string::npos);
    EXPECT_EQ(out.find("wrapped_Java_com_example_Native_clear"), std::string::npos);
    EXPECT_EQ(sm.getPath(result.javaFileId), "src/com/example/Native.java");
}

TEST(Generator, MissingPrototypeFailsWithoutOutput)
{
    constexpr std::string_view header = "JNIEXPORT jint JNICALL Java_com_example_Native_length\n"
                                        "  (JNIEnv *, jclass, jstring);\n";
    SourceManager sm;
    const UnitResult result = generateUnit(makeInput(kJava, header), Options{}, sm);
    EXPECT_FALSE(result.succeeded());
    EXPECT_TRUE(result.output.empty());

    std::ostringstream os;
    result.diagnostics.printAll(os, &sm);
    EXPECT_NE(os.str().find("src/com/example/Native.java:10: error: no matching signature for "
                            "'Native#clear'"),
              std::string::npos);
}

TEST(Generator, MalformedHeaderIsReportedAgainstHeader)
{
    SourceManager sm;
    const UnitResult result =
        generateUnit(makeInput(kJava, "JNIEXPORT void JNICALL Java_X_y;\n"), Options{}, sm);
    ASSERT_EQ(result.diagnostics.errorCount(), 1u);
    EXPECT_EQ(result.diagnostics.diagnostics()[0].loc.file_id, result.headerFileId);
    EXPECT_TRUE(result.output.empty());
}

TEST(Generator, BaseNameAcceptsBothSeparators)
{
    EXPECT_EQ(jnigen::baseName("jni/Foo.h"), "Foo.h");
    EXPECT_EQ(jnigen::baseName("jni\\sub\\Foo.h"), "Foo.h");
    EXPECT_EQ(jnigen::baseName("Foo.h"), "Foo.h");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
