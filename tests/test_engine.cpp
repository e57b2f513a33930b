#include <gtest/gtest.h>
#include "core/engine.h"
#include "test_support.h"
#include <filesystem>

using namespace codemend;
using namespace codemend::core;
using codemend::test::FakeBackend;
using codemend::test::makeFakeRunner;

class HealingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = makeFakeRunner(backend);
    }

    FakeBackend* backend = nullptr;
    std::unique_ptr<sandbox::SandboxRunner> runner;
};

// A missing module is reported, the repair supplies the code inline and the
// second run passes.
TEST_F(HealingEngineTest, MissingDependencyRepairedInOneCycle) {
    int repairs = 0;
    FunctionRepairCapability capability([&repairs](const RepairRequest& req) {
        repairs++;
        EXPECT_NE(req.errors.front().find("Traceback"), std::string::npos);
        return std::string("```python\ndef get(url):\n    return url\nprint(get('x'))\n```");
    });
    HealingEngine engine(*runner, capability);

    EngineOptions options;
    options.maxFixAttempts = 3;
    auto outcome = engine.runAndHeal({{"main.py", "import requests  # MISSING"}}, {}, options);

    EXPECT_EQ(repairs, 1);
    EXPECT_EQ(backend->calls.load(), 2);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_FALSE(outcome.state.needsRevision());
    EXPECT_TRUE(outcome.state.errors.empty());
    EXPECT_EQ(outcome.state.fixAttempts.at("main.py"), 1);
    EXPECT_EQ(outcome.state.statusOf("main.py"), FileStatus::DONE);
    EXPECT_EQ(outcome.files.at("main.py"), "def get(url):\n    return url\nprint(get('x'))");
}

// The repair drops the __main__ guard; the repaired file must still be run
// again rather than sitting in REPAIRED with a stale error.
TEST_F(HealingEngineTest, RepairedFileRerunsWithoutEntryMarker) {
    int repairs = 0;
    FunctionRepairCapability capability([&repairs](const RepairRequest&) {
        repairs++;
        return std::string("print('fixed')");
    });
    HealingEngine engine(*runner, capability);

    FileSet files = {
        {"a.py", "if __name__ == '__main__':\n    print('a')\n"},
        {"b.py", "if __name__ == '__main__':\n    FAIL\n"},
    };
    EngineOptions options;
    options.maxFixAttempts = 3;
    auto outcome = engine.runAndHeal(files, {}, options);

    EXPECT_EQ(repairs, 1);
    EXPECT_EQ(backend->calls.load(), 3);
    std::vector<std::string> expected = {"a.py", "b.py", "b.py"};
    EXPECT_EQ(backend->invokedPaths(), expected);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.state.statusOf("b.py"), FileStatus::DONE);
    EXPECT_EQ(outcome.state.attemptsOf("b.py"), 1);
}

// A permanent failure is retried exactly up to the cap, then left failing.
TEST_F(HealingEngineTest, PermanentFailureExhaustsAttempts) {
    int repairs = 0;
    FunctionRepairCapability capability([&repairs](const RepairRequest& req) {
        repairs++;
        return req.code + "\n# still FAIL";
    });
    HealingEngine engine(*runner, capability);

    EngineOptions options;
    options.maxFixAttempts = 2;
    auto outcome = engine.runAndHeal({{"main.py", "FAIL"}}, {}, options);

    EXPECT_EQ(repairs, 2);
    EXPECT_EQ(backend->calls.load(), 3);
    EXPECT_EQ(outcome.state.fixAttempts.at("main.py"), 2);
    EXPECT_EQ(outcome.state.errors.count("main.py"), 1u);
    EXPECT_FALSE(outcome.state.needsRevision());
    EXPECT_EQ(outcome.state.statusOf("main.py"), FileStatus::EXHAUSTED);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.failedFiles(), std::vector<std::string>{"main.py"});
}

TEST_F(HealingEngineTest, DisabledExecutionMakesNoSandboxCalls) {
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string("x"); });
    HealingEngine engine(*runner, capability);

    EngineOptions options;
    options.executionEnabled = false;
    auto outcome = engine.runAndHeal({{"main.py", "FAIL"}}, {}, options);

    EXPECT_EQ(backend->calls.load(), 0);
    EXPECT_TRUE(outcome.state.results.empty());
    EXPECT_TRUE(outcome.state.errors.empty());
    EXPECT_EQ(outcome.files.at("main.py"), "FAIL");
}

TEST_F(HealingEngineTest, HealingDisabledRunsOnce) {
    int repairs = 0;
    FunctionRepairCapability capability([&repairs](const RepairRequest&) {
        repairs++;
        return std::string("ok");
    });
    HealingEngine engine(*runner, capability);

    EngineOptions options;
    options.selfHealingEnabled = false;
    auto outcome = engine.runAndHeal({{"main.py", "FAIL"}}, {}, options);

    EXPECT_EQ(repairs, 0);
    EXPECT_EQ(backend->calls.load(), 1);
    EXPECT_TRUE(outcome.state.needsRevision());
    EXPECT_FALSE(outcome.succeeded());
}

TEST_F(HealingEngineTest, AttemptsNeverExceedCap) {
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string(); });
    HealingEngine engine(*runner, capability);

    FileSet files = {{"a/main.py", "FAIL"}, {"b/main.py", "MISSING"}, {"c/main.py", "ok"}};
    EngineOptions options;
    options.maxFixAttempts = 3;
    auto outcome = engine.runAndHeal(files, {}, options);

    for (const auto& [path, attempts] : outcome.state.fixAttempts) {
        EXPECT_LE(attempts, 3) << path;
    }
    EXPECT_EQ(outcome.state.fixAttempts.at("a/main.py"), 3);
    EXPECT_EQ(outcome.state.fixAttempts.at("b/main.py"), 3);
    EXPECT_EQ(outcome.state.statusOf("c/main.py"), FileStatus::DONE);
    EXPECT_EQ(outcome.state.repairs.size(), 6u);
}

TEST_F(HealingEngineTest, UnavailableSandboxStopsTheRun) {
    FakeBackend* down = nullptr;
    auto offline = makeFakeRunner(down, false);
    int repairs = 0;
    FunctionRepairCapability capability([&repairs](const RepairRequest&) {
        repairs++;
        return std::string("x");
    });
    HealingEngine engine(*offline, capability);

    auto outcome = engine.runAndHeal({{"main.py", "print(1)"}}, {});
    EXPECT_TRUE(outcome.state.hasFatal());
    EXPECT_EQ(outcome.state.fatal.code, ErrorCode::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(repairs, 0);
    EXPECT_EQ(down->calls.load(), 0);
    EXPECT_FALSE(outcome.succeeded());
}

TEST_F(HealingEngineTest, ContractViolationsThrow) {
    FunctionRepairCapability capability(nullptr);
    HealingEngine engine(*runner, capability);

    EngineOptions zero;
    zero.maxFixAttempts = 0;
    EXPECT_THROW(engine.runAndHeal({{"main.py", "x"}}, {}, zero), EngineError);
    EXPECT_THROW(engine.runAndHeal({{"/tmp/main.py", "x"}}, {}), EngineError);
    EXPECT_THROW(engine.runAndHeal({{"pkg/../../main.py", "x"}}, {}), EngineError);
    EXPECT_EQ(backend->calls.load(), 0);
}

TEST_F(HealingEngineTest, ParallelWorkersGiveSameOutcome) {
    FunctionRepairCapability capability([](const RepairRequest&) { return std::string("fixed"); });
    FileSet files;
    for (int i = 0; i < 6; i++) {
        files["svc" + std::to_string(i) + "/main.py"] = (i % 2) ? "FAIL" : "ok";
    }

    HealingEngine sequentialEngine(*runner, capability);
    auto sequential = sequentialEngine.runAndHeal(files, {});

    FakeBackend* parallelBackend = nullptr;
    auto parallelRunner = makeFakeRunner(parallelBackend);
    HealingEngine parallelEngine(*parallelRunner, capability);
    EngineOptions options;
    options.workerThreads = 3;
    auto parallel = parallelEngine.runAndHeal(files, {}, options);

    EXPECT_TRUE(sequential.succeeded());
    EXPECT_TRUE(parallel.succeeded());
    EXPECT_EQ(sequential.files, parallel.files);
    EXPECT_EQ(sequential.state.fixAttempts, parallel.state.fixAttempts);
    EXPECT_EQ(backend->calls.load(), parallelBackend->calls.load());
}

TEST_F(HealingEngineTest, CancellationStopsHealing) {
    utils::CancellationToken cancel;
    int repairs = 0;
    FunctionRepairCapability capability([&repairs, &cancel](const RepairRequest&) {
        repairs++;
        cancel.cancel();
        return std::string("FAIL again");
    });
    HealingEngine engine(*runner, capability);

    auto outcome = engine.runAndHeal({{"main.py", "FAIL"}}, {}, EngineOptions(), &cancel);
    EXPECT_EQ(repairs, 1);
    EXPECT_EQ(backend->calls.load(), 1);
    EXPECT_TRUE(outcome.state.cancelled);
    EXPECT_FALSE(outcome.succeeded());
}

TEST(HealingEngineShellTest, RealSandboxRoundTrip) {
    auto workRoot = std::filesystem::temp_directory_path() / "codemend_engine_test";
    std::filesystem::create_directories(workRoot);
    sandbox::SandboxConfig config = test::shellConfig();
    config.workRoot = workRoot.string();
    sandbox::SandboxRunner runner(config);
    ASSERT_TRUE(runner.isAvailable());

    std::vector<std::string> seenErrors;
    FunctionRepairCapability capability([&seenErrors](const RepairRequest& req) {
        seenErrors = req.errors;
        return std::string("```sh\necho repaired\n```");
    });
    HealingEngine engine(runner, capability);

    FileSet files = {{"main.sh", "echo 'NameError: name greet is not defined' >&2\nexit 1\n"}};
    auto outcome = engine.runAndHeal(files, {});

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.files.at("main.sh"), "echo repaired");
    EXPECT_EQ(outcome.state.results.at("main.sh").stdoutText(), "repaired\n");
    EXPECT_EQ(seenErrors, std::vector<std::string>{"NameError: name greet is not defined"});

    std::error_code ec;
    std::filesystem::remove_all(workRoot, ec);
}
