#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "conclave/run_artifact.hpp"

using namespace conclave;
using namespace std::chrono_literals;

namespace {

PipelineRun finished_run() {
    PipelineRun run;
    run.prompt = "Is 0.1 + 0.2 == 0.3?";
    run.started_at = std::chrono::system_clock::from_time_t(1700000000);
    run.stage = Stage::Done;
    run.initial.insert(ModelResponse::ok("model-a", "No.", 120ms));
    run.initial.insert(ModelResponse::failed("model-b", Error{ErrorCode::RequestTimeout, "late"}, 2000ms));

    DiscrepancySet discrepancies;
    discrepancies.discrepancies.push_back(
        Discrepancy{"rounding", "Rounding error", {"model-a"}, {"model-b"}, 0.75});
    discrepancies.consensus_reached = false;
    discrepancies.raw_output = "{...}";
    run.discrepancies = discrepancies;

    engine::DebateBrief brief;
    brief.model_id = "model-a";
    brief.has_initial_answer = true;
    brief.prompt = "Original Question: ...";
    run.debate_briefs.push_back(brief);
    run.debate_attempts.push_back(ModelResponse::ok("model-a", "Still no.", 90ms));

    DebateResponses debate;
    debate.insert(ModelResponse::ok("model-a", "Still no.", 90ms));
    run.debate = debate;

    run.synthesis = engine::Synthesis{"synth", "No, it is 0.30000000000000004.", 300ms};
    run.timings.fetch = 2000ms;
    run.timings.critique = 400ms;
    run.timings.debate = 90ms;
    run.timings.synthesis = 300ms;
    run.timings.total = 2790ms;
    return run;
}

} // namespace

TEST(RunArtifactTest, TimestampIsUtcIso8601) {
    EXPECT_EQ(format_timestamp(std::chrono::system_clock::from_time_t(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp(std::chrono::system_clock::from_time_t(1700000000)), "2023-11-14T22:13:20Z");
}

TEST(RunArtifactTest, CompletedRun) {
    auto j = run_to_json(finished_run());

    EXPECT_EQ(j["metadata"]["prompt"], "Is 0.1 + 0.2 == 0.3?");
    EXPECT_EQ(j["metadata"]["started_at"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(j["stage"], "done");
    EXPECT_TRUE(j["failed_at"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["timings"]["fetch_ms"], 2000);
    EXPECT_EQ(j["timings"]["total_ms"], 2790);

    ASSERT_EQ(j["initial_responses"].size(), 2u);
    EXPECT_EQ(j["initial_responses"][0]["model_id"], "model-a");
    EXPECT_EQ(j["initial_responses"][0]["success"], true);
    EXPECT_TRUE(j["initial_responses"][0]["error"].is_null());
    EXPECT_EQ(j["initial_responses"][1]["error"]["code"], 201);

    EXPECT_EQ(j["critic"]["consensus_reached"], false);
    EXPECT_EQ(j["critic"]["discrepancies"][0]["claim_id"], "rounding");
    EXPECT_DOUBLE_EQ(j["critic"]["discrepancies"][0]["confidence"].get<double>(), 0.75);
    EXPECT_EQ(j["critic"]["raw_output"], "{...}");
    EXPECT_TRUE(j["critic"]["error"].is_null());

    EXPECT_EQ(j["debate"]["briefs"][0]["model_id"], "model-a");
    EXPECT_EQ(j["debate"]["briefs"][0]["has_initial_answer"], true);
    EXPECT_EQ(j["debate"]["attempts"].size(), 1u);
    EXPECT_EQ(j["debate"]["responses"][0]["text"], "Still no.");
    EXPECT_TRUE(j["debate"]["agreement_substitutions"].empty());

    EXPECT_EQ(j["synthesis"]["model_id"], "synth");
    EXPECT_EQ(j["synthesis"]["elapsed_ms"], 300);
}

TEST(RunArtifactTest, FailedRunHasNullSections) {
    PipelineRun run;
    run.prompt = "Q?";
    run.stage = Stage::Failed;
    run.failed_at = Stage::Critiquing;
    run.error = Error{ErrorCode::CriticUnavailable, "Critic call failed", "[201] late"};
    run.initial.insert(ModelResponse::ok("model-a", "A", 10ms));

    auto j = run_to_json(run);
    EXPECT_EQ(j["stage"], "failed");
    EXPECT_EQ(j["failed_at"], "critiquing");
    EXPECT_EQ(j["error"]["code"], 302);
    EXPECT_EQ(j["error"]["context"], "[201] late");
    EXPECT_TRUE(j["critic"].is_null());
    EXPECT_TRUE(j["debate"].is_null());
    EXPECT_TRUE(j["synthesis"].is_null());
}

TEST(RunArtifactTest, WriteToFile) {
    const std::string path = ::testing::TempDir() + "conclave_artifact_test.json";
    auto result = write_run_artifact(finished_run(), path);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["stage"], "done");
    std::remove(path.c_str());
}

TEST(RunArtifactTest, WriteToMissingDirectoryFails) {
    auto result = write_run_artifact(finished_run(), "/nonexistent-dir/conclave/run.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ArtifactWriteFailed);
}

TEST(RunArtifactTest, TruncatedMultibyteContextIsReplaced) {
    // 300-byte cut through the two-byte "é"
    const std::string cut = (std::string(299, 'x') + "\xC3\xA9 tail").substr(0, 300);
    PipelineRun run = finished_run();
    run.initial.insert(ModelResponse::failed("model-c", Error{ErrorCode::HttpError, "HTTP 502", cut}, 50ms));

    const std::string path = ::testing::TempDir() + "conclave_artifact_utf8_test.json";
    auto result = write_run_artifact(run, path);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    auto j = nlohmann::json::parse(in);
    bool found = false;
    for (const auto& response : j["initial_responses"]) {
        if (response["model_id"] == "model-c") {
            found = true;
            EXPECT_EQ(response["error"]["context"], std::string(299, 'x') + "\xEF\xBF\xBD");
        }
    }
    EXPECT_TRUE(found);
    std::remove(path.c_str());
}
