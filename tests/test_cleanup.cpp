#include <gtest/gtest.h>

#include "ferry/cleanup.hpp"
#include "ferry/host.hpp"
#include "ferry/retry.hpp"
#include "ferry/transport.hpp"
#include "testing.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

using ferry::CleanupCoordinator;
using ferry::EndpointRole;
using ferry::PathKind;

TEST(CleanupContainmentTest, AcceptsPathsStrictlyBelowBase) {
    const std::string base = "/tmp/migrate-docker-objects";
    EXPECT_TRUE(CleanupCoordinator::IsContained(base + "/a.tar", base));
    EXPECT_TRUE(CleanupCoordinator::IsContained(base + "/chunks/", base));
    EXPECT_TRUE(CleanupCoordinator::IsContained(base + "/x/../a.tar", base));
    EXPECT_TRUE(CleanupCoordinator::IsContained(base + "/a.tar", base + "/"));
}

TEST(CleanupContainmentTest, RejectsSiblingPrefixAndEscapes) {
    const std::string base = "/tmp/migrate-docker-objects";
    EXPECT_FALSE(CleanupCoordinator::IsContained("/tmp/migrate-docker-objects-evil/a.tar", base));
    EXPECT_FALSE(CleanupCoordinator::IsContained(base + "/../etc/passwd", base));
    EXPECT_FALSE(CleanupCoordinator::IsContained("/etc/passwd", base));
}

TEST(CleanupContainmentTest, RejectsBaseItselfAndRelativePaths) {
    const std::string base = "/tmp/migrate-docker-objects";
    EXPECT_FALSE(CleanupCoordinator::IsContained(base, base));
    EXPECT_FALSE(CleanupCoordinator::IsContained(base + "/", base));
    EXPECT_FALSE(CleanupCoordinator::IsContained(base + "/.", base));
    EXPECT_FALSE(CleanupCoordinator::IsContained("a.tar", base));
    EXPECT_FALSE(CleanupCoordinator::IsContained("/tmp/a.tar", "tmp"));
    EXPECT_FALSE(CleanupCoordinator::IsContained("", base));
}

class CleanupFixture : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.name = "app:latest";
        cfg_.source.host = "alice@src";
        cfg_.destination.host = "bob@dst";
        cfg_.source.tmp_path = tmp_.Sub("src");
        cfg_.destination.tmp_path = tmp_.Sub("dst");
        cfg_.workdir = tmp_.Sub("work");
        for (const auto& d : {cfg_.source.tmp_path, cfg_.destination.tmp_path, cfg_.workdir}) {
            fs::create_directories(d);
        }
    }

    std::string MakeFile(const std::string& dir, const std::string& name) {
        const std::string p = dir + "/" + name;
        testutil::WriteBytes(p, testutil::PatternBytes(16));
        return p;
    }

    std::string MakeDir(const std::string& dir, const std::string& name) {
        const std::string p = dir + "/" + name;
        fs::create_directories(p);
        testutil::WriteBytes(p + "/chunk_0000", testutil::PatternBytes(4));
        return p;
    }

    void Build(std::unique_ptr<ferry::Host> source = nullptr) {
        source_ = source ? std::move(source) : std::make_unique<ferry::LocalHost>(runner_);
        transport_ = std::make_unique<ferry::EndpointTransport>(*source_, destination_, local_, retrier_);
        cleanup_ = std::make_unique<CleanupCoordinator>(cfg_, *transport_, &prompt_);
    }

    testutil::TemporaryDirectory tmp_;
    ferry::TransferConfig cfg_;
    testutil::FakeRunner runner_;
    testutil::ScriptedPrompt prompt_;
    ferry::Retrier retrier_{ferry::RetryPolicy{1, std::chrono::seconds(0)}, [](std::chrono::seconds) {}};

    std::unique_ptr<ferry::Host> source_;
    ferry::LocalHost destination_{runner_};
    ferry::LocalHost local_{runner_};
    std::unique_ptr<ferry::EndpointTransport> transport_;
    std::unique_ptr<CleanupCoordinator> cleanup_;
    ferry::ArtifactRegistry registry_;
};

TEST_F(CleanupFixture, AlwaysDeletesEverythingInRoleOrder) {
    cfg_.delete_policy = ferry::DeletePolicy::Always;
    Build();

    const auto src_file = MakeFile(cfg_.source.tmp_path, "a.tar");
    const auto src_dir = MakeDir(cfg_.source.tmp_path, "chunks");
    const auto local_dir = MakeDir(cfg_.workdir, "chunks");
    const auto dst_dir = MakeDir(cfg_.destination.tmp_path, "chunks");
    const auto dst_file = MakeFile(cfg_.destination.tmp_path, "a.tar");

    registry_.Register(EndpointRole::Source, PathKind::File, src_file);
    registry_.Register(EndpointRole::Source, PathKind::ChunkDir, src_dir);
    registry_.Register(EndpointRole::Local, PathKind::ChunkDir, local_dir);
    registry_.Register(EndpointRole::Destination, PathKind::ChunkDir, dst_dir);
    registry_.Register(EndpointRole::Destination, PathKind::File, dst_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    EXPECT_TRUE(report.ran);
    EXPECT_TRUE(prompt_.questions.empty());
    ASSERT_EQ(report.deleted.size(), 5u);
    EXPECT_EQ(report.deleted[0].path, local_dir);
    EXPECT_EQ(report.deleted[1].path, src_file);
    EXPECT_EQ(report.deleted[2].path, src_dir);
    EXPECT_EQ(report.deleted[3].path, dst_file);
    EXPECT_EQ(report.deleted[4].path, dst_dir);

    for (const auto& p : {src_file, src_dir, local_dir, dst_dir, dst_file}) {
        EXPECT_FALSE(fs::exists(p)) << p;
    }
    // Base directories are never removed.
    EXPECT_TRUE(fs::exists(cfg_.source.tmp_path));
    EXPECT_TRUE(fs::exists(cfg_.workdir));
}

TEST_F(CleanupFixture, RefusesPathsOutsideBaseAndContinues) {
    cfg_.delete_policy = ferry::DeletePolicy::Always;
    Build();

    fs::create_directories(tmp_.Sub("src-evil"));
    const auto outside = MakeFile(tmp_.Sub("src-evil"), "a.tar");
    const auto inside = MakeFile(cfg_.destination.tmp_path, "a.tar");
    registry_.Register(EndpointRole::Source, PathKind::File, outside);
    registry_.Register(EndpointRole::Destination, PathKind::File, inside);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    ASSERT_EQ(report.refused.size(), 1u);
    EXPECT_EQ(report.refused[0].path, outside);
    EXPECT_TRUE(fs::exists(outside));
    ASSERT_EQ(report.deleted.size(), 1u);
    EXPECT_FALSE(fs::exists(inside));
}

TEST_F(CleanupFixture, DeletionFailureIsReportedAndOthersStillRun) {
    cfg_.delete_policy = ferry::DeletePolicy::Always;
    testutil::FakeRunner remote_runner;
    remote_runner.results = {ferry::Result::Fail(255, "ssh: connection refused")};
    Build(std::make_unique<ferry::RemoteHost>(remote_runner, "alice@src", 22));

    const auto src_file = cfg_.source.tmp_path + "/a.tar";
    const auto local_file = MakeFile(cfg_.workdir, "a.tar");
    const auto dst_file = MakeFile(cfg_.destination.tmp_path, "a.tar");
    registry_.Register(EndpointRole::Source, PathKind::File, src_file);
    registry_.Register(EndpointRole::Local, PathKind::File, local_file);
    registry_.Register(EndpointRole::Destination, PathKind::File, dst_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].path, src_file);
    EXPECT_EQ(report.deleted.size(), 2u);
    EXPECT_FALSE(fs::exists(local_file));
    EXPECT_FALSE(fs::exists(dst_file));

    ASSERT_EQ(remote_runner.calls.size(), 1u);
    EXPECT_EQ(remote_runner.calls[0].back(), "rm -f -- " + src_file);
}

TEST_F(CleanupFixture, AskDeclinedLeavesEverything) {
    Build();
    prompt_.answers = {false};
    const auto local_file = MakeFile(cfg_.workdir, "a.tar");
    registry_.Register(EndpointRole::Local, PathKind::File, local_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    EXPECT_FALSE(report.ran);
    ASSERT_EQ(prompt_.questions.size(), 1u);
    EXPECT_TRUE(testutil::Contains(prompt_.questions[0], "delete temporary artifacts"));
    EXPECT_TRUE(fs::exists(local_file));
}

TEST_F(CleanupFixture, AskAcceptedDeletes) {
    Build();
    prompt_.answers = {true};
    const auto local_file = MakeFile(cfg_.workdir, "a.tar");
    registry_.Register(EndpointRole::Local, PathKind::File, local_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    EXPECT_TRUE(report.ran);
    EXPECT_FALSE(fs::exists(local_file));
}

TEST_F(CleanupFixture, NeverPolicyDoesNotPrompt) {
    cfg_.delete_policy = ferry::DeletePolicy::Never;
    Build();
    const auto local_file = MakeFile(cfg_.workdir, "a.tar");
    registry_.Register(EndpointRole::Local, PathKind::File, local_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);

    EXPECT_FALSE(report.ran);
    EXPECT_TRUE(prompt_.questions.empty());
    EXPECT_TRUE(fs::exists(local_file));
}

TEST_F(CleanupFixture, EscalationTriggerSkipsThePolicy) {
    cfg_.delete_policy = ferry::DeletePolicy::Never;
    Build();
    const auto local_file = MakeFile(cfg_.workdir, "a.tar");
    registry_.Register(EndpointRole::Local, PathKind::File, local_file);

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Escalation);

    EXPECT_TRUE(report.ran);
    EXPECT_TRUE(prompt_.questions.empty());
    EXPECT_FALSE(fs::exists(local_file));
}

TEST_F(CleanupFixture, EmptyRegistryIsANoOp) {
    Build();
    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);
    EXPECT_FALSE(report.ran);
    EXPECT_TRUE(prompt_.questions.empty());
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(CleanupFixture, MissingPathCountsAsDeleted) {
    cfg_.delete_policy = ferry::DeletePolicy::Always;
    Build();
    registry_.Register(EndpointRole::Local, PathKind::File, cfg_.workdir + "/gone.tar");

    auto report = cleanup_->Run(registry_, ferry::CleanupTrigger::Completion);
    EXPECT_EQ(report.deleted.size(), 1u);
    EXPECT_TRUE(report.failed.empty());
}

} // namespace
