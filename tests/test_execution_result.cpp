#include <gtest/gtest.h>
#include "sandbox/execution_result.h"

using namespace codemend;
using namespace codemend::sandbox;

TEST(ExecutionResultTest, DefaultIsNotARun) {
    ExecutionResult r;
    EXPECT_FALSE(r.success());
    EXPECT_EQ(r.exitCode(), -1);
    EXPECT_TRUE(r.hasErrors());
}

TEST(ExecutionResultTest, SuccessRequiresZeroExitAndNoErrors) {
    ExecutionResult ok(0, "out", "", std::chrono::milliseconds(5), {}, {});
    EXPECT_TRUE(ok.success());
    EXPECT_FALSE(ok.hasErrors());
    EXPECT_EQ(ok.failureKind(), ErrorCode::OK);

    ExecutionResult badExit(2, "", "", std::chrono::milliseconds(5), {}, {});
    EXPECT_FALSE(badExit.success());
    EXPECT_EQ(badExit.failureKind(), ErrorCode::NON_ZERO_EXIT);

    ExecutionResult classified(0, "", "NameError: x", std::chrono::milliseconds(5), {"NameError: x"}, {});
    EXPECT_FALSE(classified.success());
    EXPECT_TRUE(classified.hasErrors());
    EXPECT_EQ(classified.failureKind(), ErrorCode::CLASSIFIED_RUNTIME_ERROR);
}

TEST(ExecutionResultTest, WarningsDoNotFailARun) {
    ExecutionResult r(0, "", "DeprecationWarning: old", std::chrono::milliseconds(1), {}, {"DeprecationWarning: old"});
    EXPECT_TRUE(r.success());
    ASSERT_EQ(r.warnings().size(), 1u);
}

TEST(ExecutionResultTest, ErrorSummaryFormat) {
    ExecutionResult ok(0, "", "", std::chrono::milliseconds(1), {}, {});
    EXPECT_EQ(ok.errorSummary(), "No errors");

    ExecutionResult r(1, "", "boom", std::chrono::milliseconds(1), {"a", "b", "c", "d"}, {});
    EXPECT_EQ(r.errorSummary(), "Exit code: 1 | Stderr: boom | Errors: a, b, c");

    ExecutionResult exitOnly(3, "", "", std::chrono::milliseconds(1), {}, {});
    EXPECT_EQ(exitOnly.errorSummary(), "Exit code: 3");
}

TEST(ExecutionResultTest, ErrorSummaryTruncatesStderr) {
    std::string longErr(800, 'x');
    ExecutionResult r(1, "", longErr, std::chrono::milliseconds(1), {}, {});
    EXPECT_EQ(r.errorSummary(), "Exit code: 1 | Stderr: " + std::string(500, 'x'));
    EXPECT_EQ(r.stderrText().size(), 800u);
}

TEST(ExecutionResultTest, FailureFactory) {
    auto r = ExecutionResult::failure(ErrorCode::TIMEOUT, "Timeout after 100ms", "partial", "late",
                                      std::chrono::milliseconds(100));
    EXPECT_FALSE(r.success());
    EXPECT_EQ(r.exitCode(), -1);
    EXPECT_TRUE(r.timedOut());
    EXPECT_EQ(r.failureKind(), ErrorCode::TIMEOUT);
    ASSERT_EQ(r.errors().size(), 1u);
    EXPECT_EQ(r.errors()[0], "Timeout after 100ms");
    EXPECT_EQ(r.stdoutText(), "partial");
}

TEST(ExecutionResultTest, StderrExcerpt) {
    std::string err(1500, 'e');
    ExecutionResult r(1, "", err, std::chrono::milliseconds(1), {}, {});
    EXPECT_EQ(r.stderrExcerpt().size(), 1000u);
    EXPECT_EQ(r.stderrExcerpt(10), std::string(10, 'e'));
}

TEST(ExecutionResultTest, StderrExcerptKeepsWholeCharacters) {
    std::string text = std::string(999, 'a') + "\xc3\xa9" + "\nRuntimeError: boom\n";
    ExecutionResult r(1, "", text, std::chrono::milliseconds(1), {"RuntimeError: boom"}, {});
    std::string excerpt = r.stderrExcerpt(1000);
    EXPECT_EQ(excerpt, std::string(999, 'a'));
    EXPECT_EQ(r.stderrExcerpt(1001), std::string(999, 'a') + "\xc3\xa9");
}
