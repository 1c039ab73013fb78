// File: tests/tools/test_manifest.cpp
// Purpose: Verify jnigen.project parsing, path resolution and error reporting.
// Key invariants: Errors are prefixed "<manifest>:<line>: "; relative
//                 directories resolve against the manifest's directory.
// Links: src/tools/common/project_loader.cpp

#include <gtest/gtest.h>

#include "tools/common/project_loader.hpp"

#include <filesystem>
#include <string>

using namespace jnigen::tools::common;

namespace
{
std::string native(const std::string &generic)
{
    return std::filesystem::path(generic).lexically_normal().string();
}
} // namespace

TEST(Manifest, DefaultsWithoutBaseDir)
{
    auto config = parseManifestText("", "jnigen.project", "");
    ASSERT_TRUE(config.hasValue());
    EXPECT_EQ(config.value().sourceDir, "src");
    EXPECT_EQ(config.value().classpath, "bin");
    EXPECT_EQ(config.value().jniDir, "jni");
    EXPECT_EQ(config.value().headerTool, HeaderTool::Javah);
    EXPECT_FALSE(config.value().trace);
}

TEST(Manifest, ParsesAllDirectives)
{
    constexpr std::string_view text = "# project layout\n"
                                      "sources   java/src\n"
                                      "classpath build/classes\n"
                                      "jni       native\n"
                                      "\n"
                                      "include   **/*.java\n"
                                      "exclude   **/test/**\n"
                                      "exclude   legacy/\n"
                                      "header-tool javac\n"
                                      "jdk-include /opt/jdk/include\n"
                                      "trace     yes\n";
    auto config = parseManifestText(text, "proj/jnigen.project", "proj");
    ASSERT_TRUE(config.hasValue()) << config.error().message;
    const GeneratorConfig &c = config.value();
    EXPECT_EQ(c.sourceDir, native("proj/java/src"));
    EXPECT_EQ(c.classpath, native("proj/build/classes"));
    EXPECT_EQ(c.jniDir, native("proj/native"));
    EXPECT_EQ(c.includes, std::vector<std::string>{"**/*.java"});
    EXPECT_EQ(c.excludes, (std::vector<std::string>{"**/test/**", "legacy/"}));
    EXPECT_EQ(c.headerTool, HeaderTool::Javac);
    EXPECT_EQ(c.jdkInclude, native("/opt/jdk/include"));
    EXPECT_TRUE(c.trace);
}

TEST(Manifest, DefaultsResolveAgainstManifestDir)
{
    auto config = parseManifestText("header-tool none\n", "proj/jnigen.project", "proj");
    ASSERT_TRUE(config.hasValue());
    EXPECT_EQ(config.value().sourceDir, native("proj/src"));
    EXPECT_EQ(config.value().jniDir, native("proj/jni"));
    EXPECT_EQ(config.value().headerTool, HeaderTool::None);
}

TEST(Manifest, ReportsErrorsWithLine)
{
    auto dup = parseManifestText("jni a\njni b\n", "m.project", "");
    ASSERT_FALSE(dup.hasValue());
    EXPECT_EQ(dup.error().message, "m.project:2: duplicate directive 'jni'");

    auto unknown = parseManifestText("\n\noutput x\n", "m.project", "");
    ASSERT_FALSE(unknown.hasValue());
    EXPECT_EQ(unknown.error().message, "m.project:3: unknown directive 'output'");

    auto missing = parseManifestText("sources\n", "m.project", "");
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().message, "m.project:1: directive missing value: 'sources'");

    auto tool = parseManifestText("header-tool javadoc\n", "m.project", "");
    ASSERT_FALSE(tool.hasValue());
    EXPECT_EQ(tool.error().message,
              "m.project:1: invalid header tool 'javadoc'; expected javah, javac or none");

    auto flag = parseManifestText("trace maybe\n", "m.project", "");
    ASSERT_FALSE(flag.hasValue());
    EXPECT_EQ(flag.error().message.rfind("m.project:1: invalid value 'maybe'", 0), 0u);
}

TEST(Manifest, HeaderToolNamesRoundTrip)
{
    for (HeaderTool tool : {HeaderTool::Javah, HeaderTool::Javac, HeaderTool::None})
    {
        auto parsed = parseHeaderTool(headerToolName(tool));
        ASSERT_TRUE(parsed.hasValue());
        EXPECT_EQ(parsed.value(), tool);
    }
}

TEST(Manifest, MissingFileIsAnError)
{
    auto config = parseManifest("/nonexistent/dir/jnigen.project");
    ASSERT_FALSE(config.hasValue());
    EXPECT_EQ(config.error().message, "cannot open manifest: /nonexistent/dir/jnigen.project");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
