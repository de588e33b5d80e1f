#include <gtest/gtest.h>
#include "conclave/engine/debate.hpp"
#include "mocks/mock_gateway.hpp"

using namespace conclave;
using namespace conclave::engine;
using namespace conclave::testing;
using namespace std::chrono_literals;

class DebateTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<MockGateway>();
        initial.insert(ModelResponse::ok("model-a", "A initial", 10ms));
        initial.insert(ModelResponse::ok("model-b", "B initial", 10ms));
        initial.insert(ModelResponse::ok("model-c", "C initial", 10ms));

        discrepancies.discrepancies.push_back(
            Discrepancy{"x", "Claim X", {"model-a"}, {"model-b", "model-c"}, std::nullopt});
        discrepancies.discrepancies.push_back(
            Discrepancy{"y", "Claim Y", {"model-a", "model-b"}, {"model-c"}, std::nullopt});
        discrepancies.consensus_reached = false;
    }

    std::string prompt_for(const std::string& model) const {
        auto calls = gateway->calls_for(model);
        return calls.empty() ? std::string() : calls.front().prompt;
    }

    std::shared_ptr<MockGateway> gateway;
    InitialResponses initial;
    DiscrepancySet discrepancies;
};

// ============================================================================
// Planning
// ============================================================================

TEST_F(DebateTest, PlanAssignsMissedClaimsPerModel) {
    DebateOrchestrator debate(gateway, 500ms);
    auto briefs = debate.plan("Q?", initial, discrepancies);

    ASSERT_EQ(briefs.size(), 3u);
    EXPECT_EQ(briefs[0].model_id, "model-a");
    EXPECT_TRUE(briefs[0].missed_claims.empty());
    EXPECT_EQ(briefs[1].missed_claims, (std::vector<std::string>{"Claim X"}));
    EXPECT_EQ(briefs[2].missed_claims, (std::vector<std::string>{"Claim X", "Claim Y"}));
    for (const auto& brief : briefs) {
        EXPECT_TRUE(brief.contested_claims.empty());
        EXPECT_TRUE(brief.has_initial_answer);
    }
    EXPECT_EQ(gateway->call_count(), 0u);
}

TEST_F(DebateTest, PlanFlagsMinorityClaimsWhenEnabled) {
    DebateOrchestrator debate(gateway, 500ms, DebateOptions{true, std::nullopt});
    auto briefs = debate.plan("Q?", initial, discrepancies);

    EXPECT_EQ(briefs[0].contested_claims, (std::vector<std::string>{"Claim X"}));
    EXPECT_TRUE(briefs[1].contested_claims.empty());
    EXPECT_NE(briefs[0].prompt.find("most other models did not make"), std::string::npos);
    EXPECT_NE(briefs[0].prompt.find("- Claim X"), std::string::npos);
}

// ============================================================================
// Prompts
// ============================================================================

TEST_F(DebateTest, PromptQuotesQuestionAnswerAndMissedClaims) {
    DebateOrchestrator debate(gateway, 500ms);
    (void)debate.run("Is 0.1 + 0.2 == 0.3?", initial, discrepancies);

    const auto prompt = prompt_for("model-c");
    EXPECT_EQ(prompt.rfind("Original Question: Is 0.1 + 0.2 == 0.3?", 0), 0u);
    EXPECT_NE(prompt.find("Your Initial Response:\nC initial"), std::string::npos);
    EXPECT_NE(prompt.find("- Claim X\n- Claim Y\n"), std::string::npos);
    EXPECT_NE(prompt.find("did not include"), std::string::npos);
}

TEST_F(DebateTest, ModelWithNothingMissedIsStillQueried) {
    DebateOrchestrator debate(gateway, 500ms);
    (void)debate.run("Q?", initial, discrepancies);

    const auto prompt = prompt_for("model-a");
    ASSERT_FALSE(prompt.empty());
    EXPECT_NE(prompt.find("no significant discrepancies"), std::string::npos);
    EXPECT_EQ(prompt.find("did not include"), std::string::npos);
}

TEST_F(DebateTest, EmptyDiscrepanciesQueriesEveryModel) {
    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", initial, DiscrepancySet{});

    EXPECT_EQ(gateway->call_count(), 3u);
    EXPECT_EQ(round.responses.size(), 3u);
    for (const auto& model : initial.model_ids()) {
        EXPECT_NE(prompt_for(model).find("confirm or refine"), std::string::npos);
    }
}

// ============================================================================
// Collecting revisions
// ============================================================================

TEST_F(DebateTest, RevisedAnswersReplaceInitialOnes) {
    gateway->queue_response("model-a", "A revised");
    gateway->queue_response("model-b", "B revised");
    gateway->queue_response("model-c", "C revised");

    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", initial, discrepancies);

    ASSERT_EQ(round.responses.size(), 3u);
    EXPECT_EQ(round.responses.model_ids(), initial.model_ids());
    EXPECT_EQ(round.responses.find("model-b")->text, "B revised");
    EXPECT_FALSE(round.responses.find("model-b")->carried_over);
    EXPECT_EQ(round.attempts.size(), 3u);
    EXPECT_EQ(round.briefs.size(), 3u);
}

TEST_F(DebateTest, FailedDebateCallKeepsInitialAnswer) {
    gateway->queue_response("model-a", "A revised");
    gateway->queue_failure("model-b", Error{ErrorCode::RequestTimeout, "Request exceeded its deadline"});
    gateway->queue_response("model-c", "C revised");

    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", initial, discrepancies);

    ASSERT_EQ(round.responses.size(), 3u);
    const auto* b = round.responses.find("model-b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->text, "B initial");
    EXPECT_TRUE(b->carried_over);
    EXPECT_TRUE(b->usable());
    ASSERT_TRUE(b->error.has_value());
    EXPECT_EQ(b->error->code, ErrorCode::RequestTimeout);

    EXPECT_FALSE(round.attempts[1].success);
}

TEST_F(DebateTest, BlankDebateAnswerKeepsInitialAnswer) {
    gateway->queue_response("model-c", "   ");

    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", initial, discrepancies);

    const auto* c = round.responses.find("model-c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->text, "C initial");
    EXPECT_TRUE(c->carried_over);
    EXPECT_EQ(c->error->code, ErrorCode::EmptyResponse);
}

TEST_F(DebateTest, ModelWithoutInitialAnswerIsRequeried) {
    InitialResponses partial;
    partial.insert(ModelResponse::ok("model-a", "A initial", 10ms));
    partial.insert(ModelResponse::failed("model-b", Error{ErrorCode::HttpError, "HTTP 500"}, 10ms));
    gateway->queue_response("model-b", "B from scratch");

    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", partial, DiscrepancySet{});

    EXPECT_FALSE(round.briefs[1].has_initial_answer);
    EXPECT_NE(prompt_for("model-b").find("could not be retrieved"), std::string::npos);
    ASSERT_NE(round.responses.find("model-b"), nullptr);
    EXPECT_EQ(round.responses.find("model-b")->text, "B from scratch");
}

TEST_F(DebateTest, ModelWithNothingUsableIsDropped) {
    InitialResponses partial;
    partial.insert(ModelResponse::ok("model-a", "A initial", 10ms));
    partial.insert(ModelResponse::failed("model-b", Error{ErrorCode::HttpError, "HTTP 500"}, 10ms));
    gateway->set_failing("model-b", Error{ErrorCode::HttpError, "HTTP 500"});

    DebateOrchestrator debate(gateway, 500ms);
    auto round = debate.run("Q?", partial, DiscrepancySet{});

    EXPECT_EQ(round.responses.size(), 1u);
    EXPECT_FALSE(round.responses.contains("model-b"));
    EXPECT_EQ(round.attempts.size(), 2u);
}

// ============================================================================
// Agreement detection
// ============================================================================

TEST_F(DebateTest, AgreementAnswerReplacedByInitial) {
    gateway->queue_response("model-a", "I agree with my earlier answer.");
    gateway->queue_response("model-b", "B revised with new facts");
    gateway->queue_response("model-c", "C revised");
    gateway->queue_response("judge", "true");
    gateway->queue_response("judge", "false");
    gateway->queue_response("judge", "False.");

    DebateOrchestrator debate(gateway, 500ms, DebateOptions{false, std::string("judge")});
    auto round = debate.run("Q?", initial, discrepancies);

    EXPECT_EQ(round.agreement_substitutions, (std::vector<std::string>{"model-a"}));
    EXPECT_EQ(round.responses.find("model-a")->text, "A initial");
    EXPECT_TRUE(round.responses.find("model-a")->carried_over);
    EXPECT_EQ(round.responses.find("model-b")->text, "B revised with new facts");
    EXPECT_EQ(gateway->calls_for("judge").size(), 3u);
}

TEST_F(DebateTest, FailedClassificationKeepsDebateAnswer) {
    gateway->queue_response("model-a", "A revised");
    gateway->set_failing("judge", Error{ErrorCode::RequestTimeout, "late"});

    DebateOrchestrator debate(gateway, 500ms, DebateOptions{false, std::string("judge")});
    auto round = debate.run("Q?", initial, discrepancies);

    EXPECT_TRUE(round.agreement_substitutions.empty());
    EXPECT_EQ(round.responses.find("model-a")->text, "A revised");
}

TEST_F(DebateTest, AgreementVerdictNormalization) {
    EXPECT_TRUE(AgreementDetector::is_true("true"));
    EXPECT_TRUE(AgreementDetector::is_true(" True.\n"));
    EXPECT_TRUE(AgreementDetector::is_true("\"TRUE\""));
    EXPECT_FALSE(AgreementDetector::is_true("false"));
    EXPECT_FALSE(AgreementDetector::is_true("true, mostly"));
    EXPECT_FALSE(AgreementDetector::is_true(""));
}
