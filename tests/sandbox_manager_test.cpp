#include "codebox/core/sandbox_manager.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/utils/id_utils.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <set>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "mock_isolation_runtime.hpp"

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Return;

using codebox::testing::Exited;
using codebox::testing::MockIsolationRuntime;
using codebox::testing::TimedOut;
using namespace codebox::core;     // NOLINT
using namespace codebox::runtime;  // NOLINT
using namespace std::chrono_literals;

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(runtime_, Inspect(_)).WillByDefault(Return(EnvironmentState::RUNNING));
        ON_CALL(runtime_, Exec(_, _, _)).WillByDefault(Return(Exited(0)));
    }

    std::vector<std::string> ListedIds() {
        std::vector<std::string> ids;
        for (const auto& row : manager_.ListSandboxes()) {
            ids.push_back(row.id);
        }
        return ids;
    }

    LanguageRegistry registry_ = LanguageRegistry::Builtin();
    NiceMock<MockIsolationRuntime> runtime_;
    SandboxManager manager_{registry_, runtime_, SandboxManager::Config{}};
};

ErrorKind KindOf(const std::function<void()>& call) {
    try {
        call();
    } catch (const SandboxError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SandboxError";
    return ErrorKind::INTERNAL;
}

TEST_F(SandboxManagerTest, CreateStartsPersistentContainer) {
    IsolationSpec seen;
    EXPECT_CALL(runtime_, EnsureNetwork("codebox-net")).Times(1);
    EXPECT_CALL(runtime_, StartDetached(_)).WillOnce(Invoke(
        [&](const IsolationSpec& spec) { seen = spec; }));

    auto sandbox = manager_.CreateSandbox("javascript", std::string("s1"), {});

    EXPECT_EQ(sandbox.id, "s1");
    EXPECT_EQ(sandbox.language, "javascript");
    EXPECT_EQ(sandbox.status, SandboxStatus::RUNNING);
    EXPECT_EQ(sandbox.environment_name, "sandbox-s1");

    EXPECT_EQ(seen.name, "sandbox-s1");
    EXPECT_EQ(seen.image, "node:18-alpine");
    EXPECT_EQ(seen.memory_limit_mb, 1024u);
    EXPECT_DOUBLE_EQ(seen.cpu_limit, 2.0);
    EXPECT_EQ(seen.network_mode, NetworkMode::ISOLATED);
    EXPECT_EQ(seen.network_name, "codebox-net");
    EXPECT_THAT(seen.command, ElementsAre("tail", "-f", "/dev/null"));
    EXPECT_FALSE(seen.workspace.has_value());
}

TEST_F(SandboxManagerTest, NetworkEnsuredOnlyOnce) {
    EXPECT_CALL(runtime_, EnsureNetwork(_)).Times(1);

    manager_.CreateSandbox("python", std::string("a"), {});
    manager_.CreateSandbox("python", std::string("b"), {});
}

TEST_F(SandboxManagerTest, DuplicateNameConflicts) {
    EXPECT_CALL(runtime_, StartDetached(_)).Times(1);

    manager_.CreateSandbox("javascript", std::string("s1"), {});

    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("javascript", std::string("s1"), {}); }),
              ErrorKind::SANDBOX_NAME_CONFLICT);
    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("python", std::string("s1"), {}); }),
              ErrorKind::SANDBOX_NAME_CONFLICT);
}

TEST_F(SandboxManagerTest, GeneratedIdsAreUniqueUuids) {
    std::set<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        auto sandbox = manager_.CreateSandbox("bash", std::nullopt, {});
        EXPECT_TRUE(codebox::utils::IsUUID(sandbox.id));
        ids.insert(sandbox.id);
    }
    EXPECT_EQ(ids.size(), 20u);
}

TEST_F(SandboxManagerTest, EmptyNameGeneratesId) {
    auto sandbox = manager_.CreateSandbox("python", std::string(""), {});
    EXPECT_TRUE(codebox::utils::IsUUID(sandbox.id));
    EXPECT_EQ(sandbox.environment_name, "sandbox-" + sandbox.id);
}

TEST_F(SandboxManagerTest, InvalidNameRejectedBeforeRuntime) {
    EXPECT_CALL(runtime_, StartDetached(_)).Times(0);

    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("python", std::string("bad name"), {}); }),
              ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("python", std::string("../x"), {}); }),
              ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("cobol", std::string("ok"), {}); }),
              ErrorKind::UNSUPPORTED_LANGUAGE);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST_F(SandboxManagerTest, NameValidation) {
    EXPECT_TRUE(SandboxManager::IsValidName("s1"));
    EXPECT_TRUE(SandboxManager::IsValidName("my_box.v2-test"));
    EXPECT_FALSE(SandboxManager::IsValidName("-leading"));
    EXPECT_FALSE(SandboxManager::IsValidName("has/slash"));
    EXPECT_FALSE(SandboxManager::IsValidName(std::string(129, 'a')));
}

TEST_F(SandboxManagerTest, StartFailureDropsRecord) {
    EXPECT_CALL(runtime_, StartDetached(_))
        .WillOnce(Invoke([](const IsolationSpec&) {
            throw SandboxError(ErrorKind::IMAGE_UNAVAILABLE, "pull access denied");
        }))
        .WillOnce(Return());

    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("python", std::string("s1"), {}); }),
              ErrorKind::IMAGE_UNAVAILABLE);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());

    EXPECT_NO_THROW(manager_.CreateSandbox("python", std::string("s1"), {}));
}

TEST_F(SandboxManagerTest, InstallsDependenciesInsideContainer) {
    EXPECT_CALL(runtime_, Exec("sandbox-s2",
                               ElementsAre("sh", "-c", "pip install --user --no-cache-dir requests"),
                               std::chrono::milliseconds(300000)))
        .WillOnce(Return(Exited(0)));

    auto sandbox = manager_.CreateSandbox("python", std::string("s2"), {"requests"});
    EXPECT_THAT(sandbox.dependencies, ElementsAre("requests"));
}

TEST_F(SandboxManagerTest, NoInstallWithoutDependenciesOrInstaller) {
    EXPECT_CALL(runtime_, Exec(_, _, _)).Times(0);

    manager_.CreateSandbox("python", std::string("a"), {});
    manager_.CreateSandbox("bash", std::string("b"), {"curl"});
}

TEST_F(SandboxManagerTest, FailedInstallRollsBack) {
    EXPECT_CALL(runtime_, Exec(_, _, _))
        .WillOnce(Return(Exited(1, "", "ERROR: No matching distribution found for nope")));
    EXPECT_CALL(runtime_, Remove("sandbox-s3")).Times(1);

    try {
        manager_.CreateSandbox("python", std::string("s3"), {"nope"});
        FAIL() << "expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DEPENDENCY_INSTALL_FAILURE);
        EXPECT_THAT(e.what(), HasSubstr("No matching distribution"));
    }

    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
    EXPECT_EQ(KindOf([&] { manager_.DeleteSandbox("s3"); }), ErrorKind::SANDBOX_NOT_FOUND);
}

TEST_F(SandboxManagerTest, TimedOutInstallRollsBack) {
    EXPECT_CALL(runtime_, Exec(_, _, _)).WillOnce(Return(TimedOut()));
    EXPECT_CALL(runtime_, Remove("sandbox-s4")).Times(1);

    EXPECT_EQ(KindOf([&] { manager_.CreateSandbox("javascript", std::string("s4"), {"lodash"}); }),
              ErrorKind::DEPENDENCY_INSTALL_FAILURE);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST_F(SandboxManagerTest, ListIsOrderedByCreation) {
    manager_.CreateSandbox("python", std::string("zeta"), {});
    manager_.CreateSandbox("python", std::string("alpha"), {});
    manager_.CreateSandbox("go", std::string("mid"), {});

    EXPECT_THAT(ListedIds(), ElementsAre("zeta", "alpha", "mid"));

    auto rows = manager_.ListSandboxes();
    EXPECT_EQ(rows[2].language, "go");
    EXPECT_EQ(rows[0].status, SandboxStatus::RUNNING);
    EXPECT_GE(rows[0].age.count(), 0);
    EXPECT_LE(rows[0].created_at, rows[1].created_at);
}

TEST_F(SandboxManagerTest, ListReportsExitedContainersAsStopped) {
    manager_.CreateSandbox("python", std::string("s1"), {});

    EXPECT_CALL(runtime_, Inspect("sandbox-s1"))
        .WillOnce(Return(EnvironmentState::EXITED))
        .WillOnce(Return(std::nullopt))
        .WillOnce(Return(EnvironmentState::RUNNING));

    EXPECT_EQ(manager_.ListSandboxes().at(0).status, SandboxStatus::STOPPED);
    EXPECT_EQ(manager_.ListSandboxes().at(0).status, SandboxStatus::STOPPED);
    EXPECT_EQ(manager_.ListSandboxes().at(0).status, SandboxStatus::RUNNING);
}

TEST_F(SandboxManagerTest, ListSurvivesUnreachableEngine) {
    manager_.CreateSandbox("python", std::string("s1"), {});

    EXPECT_CALL(runtime_, Inspect(_)).WillOnce(Invoke([](const std::string&) {
        return std::optional<EnvironmentState>();
    })).WillOnce(Invoke([](const std::string&) -> std::optional<EnvironmentState> {
        throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE, "daemon down");
    }));

    EXPECT_EQ(manager_.ListSandboxes().at(0).status, SandboxStatus::STOPPED);
    auto rows = manager_.ListSandboxes();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].status, SandboxStatus::STOPPED);
}

TEST_F(SandboxManagerTest, DeleteRemovesContainerAndRecord) {
    manager_.CreateSandbox("python", std::string("s2"), {});
    EXPECT_CALL(runtime_, Remove("sandbox-s2")).Times(1);

    auto deleted = manager_.DeleteSandbox("s2");

    EXPECT_EQ(deleted.id, "s2");
    EXPECT_EQ(deleted.status, SandboxStatus::DELETED);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST_F(SandboxManagerTest, DeleteUnknownOrTwiceIsNotFound) {
    EXPECT_EQ(KindOf([&] { manager_.DeleteSandbox("does-not-exist"); }),
              ErrorKind::SANDBOX_NOT_FOUND);

    manager_.CreateSandbox("python", std::string("once"), {});
    manager_.DeleteSandbox("once");
    EXPECT_EQ(KindOf([&] { manager_.DeleteSandbox("once"); }), ErrorKind::SANDBOX_NOT_FOUND);
}

TEST_F(SandboxManagerTest, DeletedNameCanBeReused) {
    manager_.CreateSandbox("python", std::string("s1"), {});
    manager_.DeleteSandbox("s1");

    auto again = manager_.CreateSandbox("javascript", std::string("s1"), {});
    EXPECT_EQ(again.language, "javascript");
    EXPECT_THAT(ListedIds(), ElementsAre("s1"));
}

TEST_F(SandboxManagerTest, FailedRemoveKeepsRecord) {
    manager_.CreateSandbox("python", std::string("s1"), {});
    EXPECT_CALL(runtime_, Remove("sandbox-s1"))
        .WillOnce(Invoke([](const std::string&) {
            throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE, "daemon down");
        }))
        .WillOnce(Return());

    EXPECT_EQ(KindOf([&] { manager_.DeleteSandbox("s1"); }), ErrorKind::RUNTIME_UNAVAILABLE);
    EXPECT_THAT(ListedIds(), ElementsAre("s1"));
    EXPECT_NO_THROW(manager_.DeleteSandbox("s1"));
}

TEST_F(SandboxManagerTest, DeleteWaitsForInFlightInstall) {
    std::atomic<bool> install_started{false};
    std::atomic<bool> install_finished{false};
    std::atomic<bool> removed_after_install{false};

    EXPECT_CALL(runtime_, Exec(_, _, _)).WillOnce(Invoke(
        [&](const std::string&, const std::vector<std::string>&, std::chrono::milliseconds) {
            install_started = true;
            std::this_thread::sleep_for(200ms);
            install_finished = true;
            return Exited(0);
        }));
    EXPECT_CALL(runtime_, Remove("sandbox-slow")).WillOnce(Invoke([&](const std::string&) {
        removed_after_install = install_finished.load();
    }));

    std::thread creator([&] {
        manager_.CreateSandbox("python", std::string("slow"), {"requests"});
    });
    while (!install_started) {
        std::this_thread::sleep_for(5ms);
    }

    auto deleted = manager_.DeleteSandbox("slow");
    creator.join();

    EXPECT_EQ(deleted.status, SandboxStatus::DELETED);
    EXPECT_TRUE(removed_after_install);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST_F(SandboxManagerTest, ConcurrentCreateAndDeleteOnDistinctIds) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            std::string id = "box" + std::to_string(i);
            try {
                manager_.CreateSandbox("bash", id, {});
                manager_.ListSandboxes();
                manager_.DeleteSandbox(id);
            } catch (const SandboxError&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST_F(SandboxManagerTest, ConcurrentCreateSameNameHasOneWinner) {
    constexpr int kThreads = 8;
    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            try {
                manager_.CreateSandbox("python", std::string("shared"), {});
                ++created;
            } catch (const SandboxError& e) {
                if (e.kind() == ErrorKind::SANDBOX_NAME_CONFLICT) {
                    ++conflicts;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(conflicts.load(), kThreads - 1);
    EXPECT_THAT(ListedIds(), ElementsAre("shared"));
}

TEST_F(SandboxManagerTest, ShutdownRemovesRemainingSandboxes) {
    manager_.CreateSandbox("python", std::string("a"), {});
    manager_.CreateSandbox("python", std::string("b"), {});

    EXPECT_CALL(runtime_, Remove("sandbox-a")).Times(1);
    EXPECT_CALL(runtime_, Remove("sandbox-b")).Times(1);

    manager_.Shutdown();
    EXPECT_THAT(manager_.ListSandboxes(), IsEmpty());
}

TEST(SandboxManagerConfigTest, ShutdownKeepsSandboxesWhenCleanupDisabled) {
    auto registry = LanguageRegistry::Builtin();
    NiceMock<MockIsolationRuntime> runtime;
    ON_CALL(runtime, Inspect(_)).WillByDefault(Return(EnvironmentState::RUNNING));
    EXPECT_CALL(runtime, Remove(_)).Times(0);

    SandboxManager::Config config;
    config.cleanup_on_shutdown = false;
    SandboxManager manager(registry, runtime, config);

    manager.CreateSandbox("python", std::string("keep"), {});
    manager.Shutdown();
    EXPECT_EQ(manager.ListSandboxes().size(), 1u);
}

TEST(SandboxStatusTest, WireNames) {
    EXPECT_EQ(SandboxStatusToString(SandboxStatus::CREATED), "created");
    EXPECT_EQ(SandboxStatusToString(SandboxStatus::RUNNING), "running");
    EXPECT_EQ(SandboxStatusToString(SandboxStatus::STOPPED), "stopped");
    EXPECT_EQ(SandboxStatusToString(SandboxStatus::DELETED), "deleted");
}

}  // namespace
