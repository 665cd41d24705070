//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the support layer: diagnostics, source paths and results.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/result.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace nikl::support;

TEST(NiklSupport, PrintDiagWithResolvedPath)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("scripts/../main.nk");

    std::ostringstream os;
    printDiag(makeError({id, 2, 5}, "msg", "N2001"), os, &sm);
    EXPECT_EQ(os.str(), "main.nk:2:5: error[N2001]: msg\n");
}

TEST(NiklSupport, PrintDiagWithoutLocation)
{
    std::ostringstream os;
    printDiag(makeError({}, "boom", "N1001"), os);
    printDiag(makeError({}, "plain"), os);
    EXPECT_EQ(os.str(), "error[N1001]: boom\nerror: plain\n");
}

TEST(NiklSupport, SourceManagerIds)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("a.nk");
    const uint32_t b = sm.addFile("dir/b.nk");

    EXPECT_NE(a, 0u);
    EXPECT_NE(a, b);
    EXPECT_EQ(sm.addFile("./a.nk"), a);
    EXPECT_EQ(sm.getPath(b), "dir/b.nk");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
}

TEST(NiklSupport, DiagnosticEngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report({Severity::Error, "first", {}, "N2001"});
    engine.report({Severity::Warning, "careful", {}, {}});
    engine.report({Severity::Note, "fyi", {}, {}});

    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.warningCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 3u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "error[N2001]: first\nwarning: careful\nnote: fyi\n");
}

TEST(NiklSupport, ExpectedHoldsValueOrDiag)
{
    Expected<int> good = 7;
    ASSERT_TRUE(good.hasValue());
    EXPECT_EQ(good.value(), 7);

    Expected<int> bad = makeError({}, "nope", "N1003");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "N1003");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
}

TEST(NiklSupport, ResultHoldsValueOrMessage)
{
    auto ok = Result<std::string>::success("fine");
    ASSERT_TRUE(ok.isOk());
    EXPECT_EQ(ok.value(), "fine");

    auto failed = Result<int>::error("broken");
    ASSERT_FALSE(failed.isOk());
    EXPECT_EQ(failed.error(), "broken");

    EXPECT_TRUE(Result<void>::success().isOk());
    EXPECT_EQ(Result<void>::error("void failure").error(), "void failure");
}
