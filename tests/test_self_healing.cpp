#include <gtest/gtest.h>
#include "core/self_healing.h"
#include "utils/logger.h"
#include <algorithm>

using namespace codemend;
using namespace codemend::core;

namespace {

sandbox::ExecutionResult failed(const std::string& stderrText) {
    return sandbox::ExecutionResult(1, "", stderrText, std::chrono::milliseconds(1), {"NameError: x"}, {});
}

}

class SelfHealingTest : public ::testing::Test {
protected:
    void SetUp() override {
        files = {{"main.py", "print(x)"}, {"ok.py", "print(1)"}};
        state = ExecutionState(2);
        state.recordResult("main.py", failed("NameError: x"));
        state.recordResult("ok.py", sandbox::ExecutionResult(0, "1\n", "", std::chrono::milliseconds(1), {}, {}));
    }

    FileSet files;
    ExecutionState state;
};

TEST(CodeFenceTest, StripsTaggedAndBareFences) {
    EXPECT_EQ(stripCodeFences("```python\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(stripCodeFences("```\nprint(2)\n```\n"), "print(2)");
    EXPECT_EQ(stripCodeFences("Here you go:\n```py\nx = 1\ny = 2\n```\nDone."), "x = 1\ny = 2");
    EXPECT_EQ(stripCodeFences("  plain code\n"), "plain code");
    EXPECT_EQ(stripCodeFences("```python\nunterminated\n"), "unterminated");
}

TEST(CodeFenceTest, FenceOnlyRepliesAreEmpty) {
    EXPECT_EQ(stripCodeFences("```"), "");
    EXPECT_EQ(stripCodeFences("```python\n```"), "");
    EXPECT_EQ(stripCodeFences("   \n"), "");
}

TEST_F(SelfHealingTest, AppliesFixAndConsumesAttempt) {
    RepairRequest seen;
    FunctionRepairCapability capability([&seen](const RepairRequest& req) {
        seen = req;
        return std::string("```python\nx = 1\nprint(x)\n```");
    });
    SelfHealingLoop loop(capability);

    EXPECT_EQ(loop.repair(files, state), 1u);
    EXPECT_EQ(files.at("main.py"), "x = 1\nprint(x)");
    EXPECT_EQ(files.at("ok.py"), "print(1)");
    EXPECT_EQ(state.fixAttempts.at("main.py"), 1);
    EXPECT_EQ(state.statusOf("main.py"), FileStatus::REPAIRED);
    // Only a re-execution clears the error entry.
    EXPECT_EQ(state.errors.count("main.py"), 1u);

    EXPECT_EQ(seen.path, "main.py");
    EXPECT_EQ(seen.code, "print(x)");
    EXPECT_EQ(seen.errors, std::vector<std::string>{"NameError: x"});
    EXPECT_EQ(seen.stderrExcerpt, "NameError: x");
    EXPECT_EQ(seen.attempt, 1);
    EXPECT_EQ(seen.maxAttempts, 2);
    ASSERT_EQ(state.repairs.size(), 1u);
    EXPECT_TRUE(state.repairs[0].applied);
}

TEST_F(SelfHealingTest, EmptyReplyStillConsumesAttempt) {
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string("```\n```"); });
    SelfHealingLoop loop(capability);

    loop.repair(files, state);
    EXPECT_EQ(files.at("main.py"), "print(x)");
    EXPECT_EQ(state.fixAttempts.at("main.py"), 1);
    ASSERT_EQ(state.repairs.size(), 1u);
    EXPECT_FALSE(state.repairs[0].applied);
    EXPECT_EQ(state.repairs[0].code, ErrorCode::REPAIR_FAILED);
}

TEST_F(SelfHealingTest, ThrowingCapabilityCountsAsFailedRepair) {
    FunctionRepairCapability capability([](const RepairRequest&) -> std::string {
        throw std::runtime_error("model offline");
    });
    SelfHealingLoop loop(capability);

    EXPECT_NO_THROW(loop.repair(files, state));
    EXPECT_EQ(state.fixAttempts.at("main.py"), 1);
    EXPECT_NE(state.repairs[0].message.find("model offline"), std::string::npos);
}

TEST_F(SelfHealingTest, CapIsCheckedBeforeRepairing) {
    int calls = 0;
    FunctionRepairCapability capability([&calls](const RepairRequest&) {
        calls++;
        return std::string();
    });
    SelfHealingLoop loop(capability);

    loop.repair(files, state);
    loop.repair(files, state);
    EXPECT_EQ(loop.repair(files, state), 0u);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(state.fixAttempts.at("main.py"), 2);
    EXPECT_FALSE(state.needsRevision());
}

TEST_F(SelfHealingTest, LogsAttemptsAndCap) {
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string(); });
    SelfHealingLoop loop(capability);

    utils::Logger::setConsole(false);
    utils::Logger::clearRecent();
    loop.repair(files, state);
    loop.repair(files, state);
    loop.repair(files, state);
    auto entries = utils::Logger::recent();
    utils::Logger::setConsole(true);

    auto logged = [&entries](const std::string& text) {
        return std::any_of(entries.begin(), entries.end(),
                           [&text](const utils::LogEntry& e) { return e.message == text; });
    };
    EXPECT_TRUE(logged("Fixing main.py (attempt 1/2)"));
    EXPECT_TRUE(logged("Fixing main.py (attempt 2/2)"));
    EXPECT_TRUE(logged("Max fix attempts reached for main.py"));
}

TEST_F(SelfHealingTest, StderrExcerptIsBounded) {
    state.recordResult("main.py", failed(std::string(5000, 'e')));
    std::string excerpt;
    FunctionRepairCapability capability([&excerpt](const RepairRequest& req) {
        excerpt = req.stderrExcerpt;
        return std::string();
    });
    SelfHealingLoop loop(capability);
    loop.repair(files, state);
    EXPECT_EQ(excerpt.size(), SelfHealingLoop::kStderrExcerptChars);
}

TEST_F(SelfHealingTest, NeverAddsFiles) {
    state.recordResult("ghost.py", failed("NameError: ghost"));
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string("fixed"); });
    SelfHealingLoop loop(capability);
    loop.repair(files, state);
    EXPECT_EQ(files.size(), 2u);
    EXPECT_EQ(files.count("ghost.py"), 0u);
}

TEST(ExecutionStateTest, RejectsNonPositiveCap) {
    EXPECT_THROW(ExecutionState(0), EngineError);
    EXPECT_THROW(ExecutionState(-1), EngineError);
    EXPECT_NO_THROW(ExecutionState(1));
}

TEST(ExecutionStateTest, ExhaustedAfterCap) {
    ExecutionState state(1);
    auto bad = sandbox::ExecutionResult(1, "", "", std::chrono::milliseconds(1), {}, {});
    state.recordResult("main.py", bad);
    EXPECT_EQ(state.statusOf("main.py"), FileStatus::NEEDS_REPAIR);
    state.recordRepair("main.py", false, ErrorCode::REPAIR_FAILED, "no reply");
    state.recordResult("main.py", bad);
    EXPECT_EQ(state.statusOf("main.py"), FileStatus::EXHAUSTED);
    EXPECT_FALSE(state.needsRevision());
    EXPECT_EQ(state.failedFiles(), std::vector<std::string>{"main.py"});
}
