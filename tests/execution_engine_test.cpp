#include "codebox/core/execution_engine.hpp"
#include "codebox/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

#include <unistd.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "mock_isolation_runtime.hpp"

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StartsWith;

using codebox::testing::Exited;
using codebox::testing::MockIsolationRuntime;
using codebox::testing::TimedOut;
using namespace codebox::core;     // NOLINT
using namespace codebox::runtime;  // NOLINT
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("codebox_engine_test_" + std::to_string(::getpid()));
        fs::create_directories(root_);
        config_.workspace_root = root_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    bool RootIsEmpty() const {
        return fs::is_empty(root_);
    }

    ExecutionEngine MakeEngine() {
        return ExecutionEngine(registry_, runtime_, config_);
    }

    LanguageRegistry registry_ = LanguageRegistry::Builtin();
    MockIsolationRuntime runtime_;
    ExecutionEngine::Config config_;
    fs::path root_;
};

ExecutionRequest Request(const std::string& language, const std::string& code) {
    ExecutionRequest request;
    request.language = language;
    request.code = code;
    return request;
}

TEST_F(ExecutionEngineTest, CompletedRunWithEphemeralDefaults) {
    IsolationSpec seen;
    std::chrono::milliseconds seen_timeout{0};
    std::string source_on_disk;

    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds timeout) {
            seen = spec;
            seen_timeout = timeout;
            std::ifstream in(*spec.workspace / "main.py");
            std::stringstream content;
            content << in.rdbuf();
            source_on_disk = content.str();
            return Exited(0, "2\n");
        }));

    auto engine = MakeEngine();
    auto result = engine.ExecuteEphemeral(Request("python", "print(1+1)"));

    EXPECT_EQ(result.outcome, ExecutionOutcome::COMPLETED);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_EQ(result.language, "python");
    EXPECT_EQ(result.execution_time, 5ms);

    EXPECT_EQ(source_on_disk, "print(1+1)");
    EXPECT_EQ(seen_timeout, 30s);
    EXPECT_EQ(seen.image, "python:3.11-alpine");
    EXPECT_THAT(seen.command, ElementsAre("python", "main.py"));
    EXPECT_EQ(seen.memory_limit_mb, 512u);
    EXPECT_DOUBLE_EQ(seen.cpu_limit, 1.0);
    EXPECT_EQ(seen.network_mode, NetworkMode::NONE);
    EXPECT_TRUE(seen.unprivileged_user);
    EXPECT_EQ(seen.user, "1000:1000");
    EXPECT_EQ(seen.mount_point, "/workspace");
    EXPECT_EQ(seen.working_dir, "/workspace");
    EXPECT_EQ(seen.environment.at("HOME"), "/tmp");
    EXPECT_EQ(seen.name, "codebox-run-" + result.execution_id);

    EXPECT_TRUE(RootIsEmpty());
}

TEST_F(ExecutionEngineTest, NonZeroExitIsRuntimeError) {
    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Return(Exited(1, "", "Traceback\n")));

    auto engine = MakeEngine();
    auto result = engine.ExecuteEphemeral(Request("python", "raise SystemExit(1)"));

    EXPECT_EQ(result.outcome, ExecutionOutcome::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stderr_output, "Traceback\n");
    EXPECT_TRUE(RootIsEmpty());
}

TEST_F(ExecutionEngineTest, TimeoutIsAResultWithPartialOutput) {
    EXPECT_CALL(runtime_, Run(_, std::chrono::milliseconds(1000)))
        .WillOnce(Return(TimedOut("partial\n")));

    auto engine = MakeEngine();
    auto request = Request("bash", "echo partial; sleep 60");
    request.timeout = 1s;
    auto result = engine.ExecuteEphemeral(request);

    EXPECT_EQ(result.outcome, ExecutionOutcome::TIMED_OUT);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(result.stdout_output, "partial\n");
    EXPECT_EQ(ExecutionOutcomeToString(result.outcome), "timed-out");
    EXPECT_TRUE(RootIsEmpty());
}

TEST_F(ExecutionEngineTest, WorkspaceRemovedWhenRuntimeThrows) {
    fs::path workspace;
    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds) -> RunOutcome {
            workspace = *spec.workspace;
            throw SandboxError(ErrorKind::IMAGE_UNAVAILABLE, "pull access denied");
        }));

    auto engine = MakeEngine();
    try {
        engine.ExecuteEphemeral(Request("python", "print(1)"));
        FAIL() << "expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IMAGE_UNAVAILABLE);
    }

    EXPECT_FALSE(workspace.empty());
    EXPECT_FALSE(fs::exists(workspace));
    EXPECT_TRUE(RootIsEmpty());
}

TEST_F(ExecutionEngineTest, UnsupportedLanguageNeverTouchesRuntime) {
    EXPECT_CALL(runtime_, Run(_, _)).Times(0);

    auto engine = MakeEngine();
    try {
        engine.ExecuteEphemeral(Request("cobol", "DISPLAY 'HI'."));
        FAIL() << "expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNSUPPORTED_LANGUAGE);
    }
    EXPECT_TRUE(RootIsEmpty());
}

TEST_F(ExecutionEngineTest, InvalidRequestsAreRejectedBeforeRuntime) {
    EXPECT_CALL(runtime_, Run(_, _)).Times(0);
    auto engine = MakeEngine();

    auto zero = Request("python", "print(1)");
    zero.timeout = 0ms;
    EXPECT_THROW(engine.ExecuteEphemeral(zero), SandboxError);

    auto negative = Request("python", "print(1)");
    negative.timeout = -5s;
    EXPECT_THROW(engine.ExecuteEphemeral(negative), SandboxError);

    auto huge = Request("python", "print(1)");
    huge.timeout = std::chrono::hours(24);
    EXPECT_THROW(engine.ExecuteEphemeral(huge), SandboxError);

    auto blank_dependency = Request("python", "print(1)");
    blank_dependency.dependencies = {"requests", "  "};
    try {
        engine.ExecuteEphemeral(blank_dependency);
        FAIL() << "expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_REQUEST);
    }
}

TEST_F(ExecutionEngineTest, TimeoutFromSecondsValidatesBeforeConverting) {
    auto engine = MakeEngine();

    EXPECT_EQ(engine.TimeoutFromSeconds(5), 5s);
    EXPECT_EQ(engine.TimeoutFromSeconds(1.5), 1500ms);
    EXPECT_EQ(engine.TimeoutFromSeconds(0.0004), 1ms);
    EXPECT_EQ(engine.TimeoutFromSeconds(600), 600s);

    for (double seconds : {0.0, -1.0, 600.001, 1e300, std::numeric_limits<double>::infinity(),
                           std::numeric_limits<double>::quiet_NaN()}) {
        try {
            engine.TimeoutFromSeconds(seconds);
            ADD_FAILURE() << "accepted " << seconds;
        } catch (const SandboxError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::INVALID_REQUEST);
        }
    }
}

TEST_F(ExecutionEngineTest, DependenciesComposeInstallThenRun) {
    IsolationSpec seen;
    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds) {
            seen = spec;
            return Exited(0);
        }));

    auto engine = MakeEngine();
    auto request = Request("javascript", "require('lodash')");
    request.dependencies = {"lodash"};
    engine.ExecuteEphemeral(request);

    ASSERT_EQ(seen.command.size(), 3u);
    EXPECT_EQ(seen.command[0], "sh");
    EXPECT_EQ(seen.command[1], "-c");
    EXPECT_EQ(seen.command[2], "npm install --no-audit --no-fund lodash && node main.js");
    EXPECT_EQ(seen.network_mode, NetworkMode::NONE);
}

TEST_F(ExecutionEngineTest, DependencyInstallMayUseNetworkWhenAllowed) {
    config_.allow_network_for_dependencies = true;
    IsolationSpec seen;
    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds) {
            seen = spec;
            return Exited(0);
        }));

    auto engine = MakeEngine();
    auto request = Request("python", "import requests");
    request.dependencies = {"requests"};
    engine.ExecuteEphemeral(request);

    EXPECT_EQ(seen.network_mode, NetworkMode::ISOLATED);
}

TEST_F(ExecutionEngineTest, DependenciesIgnoredWithoutInstaller) {
    IsolationSpec seen;
    EXPECT_CALL(runtime_, Run(_, _)).WillOnce(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds) {
            seen = spec;
            return Exited(0);
        }));

    auto engine = MakeEngine();
    auto request = Request("bash", "echo hi");
    request.dependencies = {"curl"};
    engine.ExecuteEphemeral(request);

    EXPECT_THAT(seen.command, ElementsAre("sh", "main.sh"));
}

TEST_F(ExecutionEngineTest, ComposeCommandQuotesRunTokens) {
    auto registry = LanguageRegistry::Builtin();
    auto command = ExecutionEngine::ComposeCommand(registry.Resolve("go"), {"github.com/google/uuid"});

    ASSERT_EQ(command.size(), 3u);
    EXPECT_THAT(command[2], StartsWith("go mod init sandbox && go get github.com/google/uuid && "));
    EXPECT_THAT(command[2], HasSubstr("go run main.go"));
}

TEST_F(ExecutionEngineTest, ConcurrentExecutionsUseDistinctWorkspaces) {
    constexpr int kThreads = 8;

    std::mutex mutex;
    std::set<fs::path> workspaces;
    std::set<std::string> names;

    EXPECT_CALL(runtime_, Run(_, _)).Times(kThreads).WillRepeatedly(Invoke(
        [&](const IsolationSpec& spec, std::chrono::milliseconds) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                workspaces.insert(*spec.workspace);
                names.insert(spec.name);
            }
            std::this_thread::sleep_for(20ms);
            return Exited(0);
        }));

    auto engine = MakeEngine();
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&engine]() {
            engine.ExecuteEphemeral(Request("python", "print(1)"));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(workspaces.size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(names.size(), static_cast<std::size_t>(kThreads));
    EXPECT_TRUE(RootIsEmpty());
}

}  // namespace
