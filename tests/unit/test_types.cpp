#include <gtest/gtest.h>
#include "conclave/types.hpp"

using namespace conclave;
using namespace std::chrono_literals;

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToString) {
    Error plain{ErrorCode::RequestTimeout, "Call timed out"};
    EXPECT_EQ(plain.to_string(), "[201] Call timed out");

    Error with_context{ErrorCode::HttpError, "HTTP 500", "upstream"};
    EXPECT_EQ(with_context.to_string(), "[202] HTTP 500 | Context: upstream");
}

TEST(ErrorTest, TransportFailureRange) {
    EXPECT_TRUE((Error{ErrorCode::TransportFailure, ""}).is_transport_failure());
    EXPECT_TRUE((Error{ErrorCode::GatewayShutdown, ""}).is_transport_failure());
    EXPECT_FALSE((Error{ErrorCode::CriticParseFailure, ""}).is_transport_failure());
    EXPECT_FALSE((Error{ErrorCode::InvalidConfig, ""}).is_transport_failure());
}

TEST(ErrorTest, Expected) {
    Expected<int> success = 42;
    EXPECT_TRUE(success.has_value());

    Expected<int> failure = tl::unexpected(Error{ErrorCode::SynthesisFailure, "boom"});
    ASSERT_FALSE(failure.has_value());
    EXPECT_EQ(failure.error().code, ErrorCode::SynthesisFailure);
}

// ============================================================================
// ModelResponse Tests
// ============================================================================

TEST(ModelResponseTest, FactoryMethods) {
    auto ok = ModelResponse::ok("model-a", "Answer", 120ms);
    EXPECT_EQ(ok.model_id, "model-a");
    EXPECT_TRUE(ok.success);
    EXPECT_FALSE(ok.error.has_value());
    EXPECT_EQ(ok.elapsed, 120ms);
    EXPECT_TRUE(ok.usable());

    auto failed = ModelResponse::failed("model-b", Error{ErrorCode::RequestTimeout, "late"}, 30000ms);
    EXPECT_FALSE(failed.success);
    EXPECT_TRUE(failed.text.empty());
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->code, ErrorCode::RequestTimeout);
    EXPECT_FALSE(failed.usable());
}

TEST(ModelResponseTest, BlankTextIsNotUsable) {
    auto blank = ModelResponse::ok("model-a", "  \n\t", 5ms);
    EXPECT_TRUE(blank.success);
    EXPECT_FALSE(blank.usable());
}

// ============================================================================
// ResponseSet Tests
// ============================================================================

TEST(ResponseSetTest, KeepsInsertionOrderAndRejectsDuplicates) {
    InitialResponses set;
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.insert(ModelResponse::ok("model-b", "B", 1ms)));
    EXPECT_TRUE(set.insert(ModelResponse::ok("model-a", "A", 1ms)));
    EXPECT_FALSE(set.insert(ModelResponse::ok("model-a", "again", 1ms)));

    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(set.model_ids(), (std::vector<std::string>{"model-b", "model-a"}));
    ASSERT_NE(set.find("model-a"), nullptr);
    EXPECT_EQ(set.find("model-a")->text, "A");
    EXPECT_EQ(set.find("model-z"), nullptr);
}

TEST(ResponseSetTest, UsableFiltersFailures) {
    InitialResponses set;
    set.insert(ModelResponse::ok("model-a", "A", 1ms));
    set.insert(ModelResponse::failed("model-b", Error{ErrorCode::HttpError, "HTTP 500"}, 1ms));
    set.insert(ModelResponse::ok("model-c", "", 1ms));

    EXPECT_EQ(set.usable_count(), 1u);
    auto usable = set.usable();
    ASSERT_EQ(usable.size(), 1u);
    EXPECT_EQ(usable[0].model_id, "model-a");
    EXPECT_TRUE(set.contains("model-b"));
}

// ============================================================================
// Claim Identifier Tests
// ============================================================================

TEST(ClaimIdTest, LowercasesAndDropsPunctuation) {
    EXPECT_EQ(make_claim_id("Hello, World!"), "hello-world");
    EXPECT_EQ(make_claim_id("  Spaced   out\tclaim  "), "spaced-out-claim");
    EXPECT_EQ(make_claim_id("0.1 + 0.2 != 0.3"), "01-02-03");
}

TEST(ClaimIdTest, TruncatesWithoutTrailingDash) {
    std::string claim;
    for (int i = 0; i < 12; ++i) {
        claim += "word ";
    }
    const auto id = make_claim_id(claim);
    EXPECT_LE(id.size(), 40u);
    EXPECT_NE(id.back(), '-');
    EXPECT_EQ(id.substr(0, 10), "word-word-");
}

TEST(ClaimIdTest, PunctuationOnlyIsEmpty) {
    EXPECT_EQ(make_claim_id("?!..."), "");
}

// ============================================================================
// DiscrepancySet Tests
// ============================================================================

namespace {

DiscrepancySet sample_discrepancies() {
    DiscrepancySet set;
    set.discrepancies.push_back(Discrepancy{"x", "Claim X", {"model-a"}, {"model-b", "model-c"}, std::nullopt});
    set.discrepancies.push_back(Discrepancy{"y", "Claim Y", {"model-a", "model-b"}, {"model-c"}, 0.5});
    set.consensus_reached = false;
    return set;
}

} // namespace

TEST(DiscrepancySetTest, MissedClaims) {
    auto set = sample_discrepancies();
    EXPECT_TRUE(set.missed_claims("model-a").empty());
    EXPECT_EQ(set.missed_claims("model-b"), (std::vector<std::string>{"Claim X"}));
    EXPECT_EQ(set.missed_claims("model-c"), (std::vector<std::string>{"Claim X", "Claim Y"}));
}

TEST(DiscrepancySetTest, MinorityClaims) {
    auto set = sample_discrepancies();
    // Claim X: asserted by 1, missing from 2; Claim Y: asserted by 2, missing from 1
    EXPECT_EQ(set.minority_claims("model-a"), (std::vector<std::string>{"Claim X"}));
    EXPECT_TRUE(set.minority_claims("model-b").empty());
    EXPECT_TRUE(set.minority_claims("model-c").empty());
}

TEST(DiscrepancySetTest, EqualityIgnoresRawOutput) {
    auto a = sample_discrepancies();
    auto b = sample_discrepancies();
    a.raw_output = "```json ...```";
    b.raw_output = "...";
    EXPECT_EQ(a, b);

    b.discrepancies.pop_back();
    EXPECT_NE(a, b);
}

// ============================================================================
// Stage Tests
// ============================================================================

TEST(StageTest, StageToString) {
    EXPECT_STREQ(stage_to_string(Stage::Fetching), "fetching");
    EXPECT_STREQ(stage_to_string(Stage::Critiquing), "critiquing");
    EXPECT_STREQ(stage_to_string(Stage::Debating), "debating");
    EXPECT_STREQ(stage_to_string(Stage::Synthesizing), "synthesizing");
    EXPECT_STREQ(stage_to_string(Stage::Done), "done");
    EXPECT_STREQ(stage_to_string(Stage::Failed), "failed");
}

TEST(StageTest, PolicyToString) {
    EXPECT_STREQ(critic_policy_to_string(CriticFailurePolicy::Abort), "abort");
    EXPECT_STREQ(critic_policy_to_string(CriticFailurePolicy::ContinueWithoutDiscrepancies), "continue");
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.models.size(), 3u);
    EXPECT_EQ(config.critic_model, "deepseek/deepseek-v3.2");
    EXPECT_EQ(config.synthesizer_model, "deepseek/deepseek-v3.2");
    EXPECT_FALSE(config.agreement_model.has_value());
    EXPECT_EQ(config.call_timeout, 30000ms);
    EXPECT_EQ(config.critic_failure_policy, CriticFailurePolicy::Abort);
    EXPECT_FALSE(config.flag_minority_claims);
    EXPECT_FALSE(config.on_stage.has_value());
    EXPECT_TRUE(config.validate().has_value());
}

TEST(ConfigTest, ValidationEmptyRoster) {
    Config config;
    config.models.clear();
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmptyModelRoster);
}

TEST(ConfigTest, ValidationDuplicateModel) {
    Config config;
    config.models = {"model-a", "model-b", "model-a"};
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DuplicateModelId);
    EXPECT_EQ(result.error().context, std::optional<std::string>("model-a"));
}

TEST(ConfigTest, ValidationBlankIdentifiers) {
    Config config;
    config.models = {"model-a", " "};
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidConfig);

    config = Config{};
    config.critic_model = "";
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidConfig);

    config = Config{};
    config.synthesizer_model = "";
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidConfig);

    config = Config{};
    config.agreement_model = "";
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, ValidationTimeout) {
    Config config;
    config.call_timeout = 0ms;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidTimeout);
}

TEST(ConfigTest, EqualityIgnoresCallbacks) {
    Config a;
    Config b;
    b.on_stage = [](Stage, const PipelineRun&) {};
    EXPECT_EQ(a, b);

    b.flag_minority_claims = true;
    EXPECT_NE(a, b);
}
