#include <gtest/gtest.h>

#include "ferry/report.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>

namespace {

std::string Capture(const std::function<void(std::FILE*)>& fn) {
    std::FILE* f = std::tmpfile();
    if (!f) throw std::runtime_error("tmpfile failed");
    fn(f);
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    std::fclose(f);
    return out;
}

class ReportFixture : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.kind = ferry::ArtifactKind::Volume;
        cfg_.name = "data";
        cfg_.source.host = "alice@src";
        cfg_.destination.host = "bob@dst";
        cfg_.destination.port = 2200;
        cfg_.workdir = "/home/alice/work";
        cfg_.chunk_size_bytes = 2 * ferry::kGiB;
        state_.timestamp = "20240102030405";
        state_.sanitized_name = "data";

        registry_.Register(ferry::EndpointRole::Source, ferry::PathKind::File, "/tmp/migrate-docker-objects/v.tar.xz");
        registry_.Register(ferry::EndpointRole::Source, ferry::PathKind::ChunkDir, "/tmp/migrate-docker-objects/c");
        registry_.Register(ferry::EndpointRole::Local, ferry::PathKind::ChunkDir, "/home/alice/work/c");
        registry_.Register(ferry::EndpointRole::Destination, ferry::PathKind::File, "/tmp/migrate-docker-objects/v.tar.xz");
    }

    ferry::TransferConfig cfg_;
    ferry::TransferState state_;
    ferry::ArtifactRegistry registry_;
};

TEST_F(ReportFixture, BannerShowsResolvedSettings) {
    const auto text = Capture([&](std::FILE* f) { ferry::PrintConfigBanner(cfg_, f); });
    EXPECT_TRUE(testutil::Contains(text, "Mode          : volume"));
    EXPECT_TRUE(testutil::Contains(text, "Dest host     : bob@dst (port 2200)"));
    EXPECT_TRUE(testutil::Contains(text, "Chunk size    : 2 GiB (2147483648 bytes)"));
    EXPECT_TRUE(testutil::Contains(text, "Auto delete   : ask"));
}

TEST_F(ReportFixture, SummaryQualifiesRemotePaths) {
    const auto text = Capture([&](std::FILE* f) { ferry::PrintSummary(cfg_, registry_, f); });
    EXPECT_TRUE(testutil::Contains(text, "On SOURCE host (alice@src):"));
    EXPECT_TRUE(testutil::Contains(text, "FILE: alice@src:/tmp/migrate-docker-objects/v.tar.xz"));
    EXPECT_TRUE(testutil::Contains(text, "CHUNK DIR: alice@src:/tmp/migrate-docker-objects/c"));
    EXPECT_TRUE(testutil::Contains(text, "FILE: bob@dst:/tmp/migrate-docker-objects/v.tar.xz"));
    EXPECT_TRUE(testutil::Contains(text, "CHUNK DIR: /home/alice/work/c"));
    EXPECT_FALSE(testutil::Contains(text, "alice@src:/home"));
}

TEST_F(ReportFixture, LocalSourceIsShownUnqualified) {
    cfg_.source.local = true;
    const auto text = Capture([&](std::FILE* f) { ferry::PrintCreatedPaths(cfg_, registry_, f); });
    EXPECT_TRUE(testutil::Contains(text, "On SOURCE (local machine):"));
    EXPECT_TRUE(testutil::Contains(text, "FILE: /tmp/migrate-docker-objects/v.tar.xz"));
}

TEST_F(ReportFixture, JsonReportListsRecordsAndCleanup) {
    ferry::RunReport run;
    run.outcome = ferry::RunOutcome::Failed;
    run.error = "Command failed after 2 attempt(s): docker load -i x";
    ferry::CleanupReport cleanup;
    cleanup.ran = true;
    cleanup.deleted.push_back(registry_.All()[0]);
    cleanup.refused.push_back(registry_.All()[2]);
    run.cleanup = cleanup;

    const auto j = nlohmann::json::parse(ferry::RenderJsonReport(cfg_, state_, registry_, run));

    EXPECT_EQ(j.at("outcome").get<std::string>(), "failed");
    EXPECT_EQ(j.at("name").get<std::string>(), "data");
    EXPECT_EQ(j.at("timestamp").get<std::string>(), "20240102030405");
    EXPECT_EQ(j.at("error").get<std::string>(), run.error);
    EXPECT_EQ(j.at("chunk_size_bytes").get<std::uint64_t>(), 2 * ferry::kGiB);

    const auto& records = j.at("records");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[1].at("kind").get<std::string>(), "chunk-dir");
    EXPECT_EQ(records[3].at("role").get<std::string>(), "destination");
    EXPECT_EQ(records[3].at("order").get<std::size_t>(), 3u);

    EXPECT_TRUE(j.at("cleanup").at("ran").get<bool>());
    EXPECT_EQ(j.at("cleanup").at("deleted").size(), 1u);
    EXPECT_EQ(j.at("cleanup").at("refused")[0].at("path").get<std::string>(), "/home/alice/work/c");
}

TEST_F(ReportFixture, SuccessfulReportOmitsErrorAndCleanup) {
    ferry::RunReport run;
    const auto j = nlohmann::json::parse(ferry::RenderJsonReport(cfg_, state_, registry_, run));
    EXPECT_EQ(j.at("outcome").get<std::string>(), "success");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("cleanup"));
}

} // namespace
