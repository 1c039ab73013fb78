// File: tests/unit/test_support.cpp
// Purpose: Verify diagnostic formatting, engine counters, Expected results
//          and the trace switch.
// Key invariants: Diagnostics without a registered path print no location.
// Links: src/support/diagnostics.cpp, src/support/diag_expected.cpp,
//        src/support/trace.cpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "support/trace.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

using namespace jnigen::support;

TEST(Diagnostics, PrintsPathAndLine)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("src/./com/Foo.java");
    DiagnosticEngine de;
    de.report(makeError({id, 12, 0}, "parse error: missing method name"));
    de.report(makeWarning({id, 3, 5}, "native method 'Foo#bar' has no embedded code; skipped"));

    std::ostringstream os;
    de.printAll(os, &sm);
    EXPECT_EQ(os.str(),
              "src/com/Foo.java:12: error: parse error: missing method name\n"
              "src/com/Foo.java:3:5: warning: native method 'Foo#bar' has no embedded code; "
              "skipped\n");
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.diagnostics().size(), 2u);
}

TEST(Diagnostics, UnknownFileHasNoLeadingColon)
{
    SourceManager sm;
    std::ostringstream os;
    printDiag(makeError({42, 2, 7}, "missing path context"), os, &sm);
    EXPECT_EQ(os.str(), "error: missing path context\n");
}

TEST(Diagnostics, SourceManagerReusesIds)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("jni/Foo.h");
    EXPECT_EQ(sm.addFile("jni/../jni/Foo.h"), a);
    EXPECT_NE(sm.addFile("jni/Bar.h"), a);
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_EQ(sm.fileCount(), 2u);
}

TEST(Diagnostics, PrintsSourceLineWhenTextIsKnown)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("Foo.java");
    sm.setSource(id, "class Foo {\r\n    native void f(int a;\r\n}\r\n");
    EXPECT_EQ(sm.lineText(id, 2), "    native void f(int a;");
    EXPECT_TRUE(sm.lineText(id, 9).empty());

    std::ostringstream os;
    printDiag(makeError({id, 2, 5}, "parse error: unbalanced parentheses"), os, &sm);
    EXPECT_EQ(os.str(),
              "Foo.java:2:5: error: parse error: unbalanced parentheses\n"
              "        native void f(int a;\n"
              "        ^\n");

    std::ostringstream noColumn;
    printDiag(makeWarning({id, 1, 0}, "note this"), noColumn, &sm);
    EXPECT_EQ(noColumn.str(), "Foo.java:1: warning: note this\n    class Foo {\n");
}

TEST(Expected, ValueAndError)
{
    Expected<int> ok(7);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 7);

    Expected<int> err(makeError({}, "boom"));
    ASSERT_FALSE(err);
    EXPECT_EQ(err.error().message, "boom");
    EXPECT_EQ(err.error().severity, Severity::Error);

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({}, "nope"));
    EXPECT_FALSE(failed.hasValue());
}

TEST(Trace, WritesPrefixedLineWhenEnabled)
{
    Options opts;
    opts.trace = true;
    std::ostringstream os;
    trace(opts, "segments Foo.java: 1 raw, 2 native", os);
    EXPECT_EQ(os.str(), "[jnigen] segments Foo.java: 1 raw, 2 native\n");
}

TEST(Trace, SilentByDefault)
{
    const char *env = std::getenv(kTraceEnvVar);
    if (env != nullptr && *env != '\0')
        GTEST_SKIP() << kTraceEnvVar << " is set in the test environment";
    std::ostringstream os;
    trace(Options{}, "hidden", os);
    EXPECT_TRUE(os.str().empty());
    EXPECT_FALSE(isTraceEnabled(Options{}));
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
