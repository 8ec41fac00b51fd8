/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <cmath>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include <gtest/gtest.h>

#include "common/mselect-errors.hpp"
#include "evaluators/simulated-evaluator.hpp"
#include "selection/model-selection.hpp"
#include "fake-evaluator.hpp"

/* Twelve models m00..m11. Both the proxy score and the accuracy at
 * every epoch grow with the model index, so m11 is the right answer. */
static shared_ptr<SimulatedEvaluator> make_ground_truth() {
  shared_ptr<SimulatedEvaluator> evaluator =
      make_shared<SimulatedEvaluator>(0.1, 1.0);
  for (int i = 0; i < 12; i++) {
    DoubleVec accuracies;
    for (int e = 1; e <= 3; e++) {
      accuracies.push_back(0.01 * i * e);
    }
    evaluator->add_model(
        Candidate((boost::format("m%02d") % i).str()), i, accuracies, false);
  }
  return evaluator;
}

static MselectConfig make_config() {
  MselectConfig config;
  config.coordinator_config.n_k_ratio = 2.0;
  config.coordinator_config.max_u = 3;
  config.refinement_config.policy = POLICY_SH;
  config.refinement_config.eta = 2;
  config.sampler_config.seed = 7;
  config.sampler_config.pool_source = POOL_FROM_EVALUATOR;
  return config;
}

TEST(ModelSelectionTest, PoolComesFromTheEvaluator) {
  ModelSelection selection(make_config(), make_ground_truth());
  ASSERT_EQ(12u, selection.pool().size());
  EXPECT_EQ("m00", selection.pool()[0].id);
  /* An unknown search space size defaults to the pool size */
  EXPECT_EQ(12, selection.config().coordinator_config.search_space_size);
  EXPECT_DOUBLE_EQ(0.1, selection.profile_filtering());
  EXPECT_DOUBLE_EQ(1.0, selection.profile_refinement());
}

TEST(ModelSelectionTest, EvaluatorWithoutPoolIsAConfigError) {
  shared_ptr<FakeEvaluator> evaluator = make_shared<FakeEvaluator>();
  EXPECT_THROW({
    ModelSelection selection(make_config(), evaluator);
  }, ConfigError);
}

TEST(ModelSelectionTest, PoolFromMlpSpace) {
  MselectConfig config = make_config();
  config.sampler_config.pool_source = POOL_FROM_MLP_SPACE;
  config.sampler_config.hidden_choices.push_back(8);
  config.sampler_config.hidden_choices.push_back(16);
  config.sampler_config.num_layers = 2;
  ModelSelection selection(config, make_shared<FakeEvaluator>());
  EXPECT_EQ(4u, selection.pool().size());
}

TEST(ModelSelectionTest, SelectsTheBestModelWithAGenerousBudget) {
  ModelSelection selection(make_config(), make_ground_truth());
  double budget = 1000.0;
  SelectionResult result = selection.select(budget, false);
  EXPECT_EQ(PLAN_OK, result.plan.status);
  EXPECT_EQ(12, result.plan.n);
  EXPECT_EQ(3, result.plan.u);
  EXPECT_LE(result.plan.k, result.plan.n);
  ASSERT_TRUE(result.found);
  EXPECT_EQ("m11", result.best_id);
  EXPECT_NEAR(0.33, result.best_performance, 1e-9);
  EXPECT_EQ(12, result.filtering.num_scored);
  EXPECT_LE(result.time_usage, budget);
  EXPECT_GT(result.time_usage, 0.0);
}

TEST(ModelSelectionTest, ChargedTimeStaysWithinTheBudget) {
  ModelSelection selection(make_config(), make_ground_truth());
  double budgets[] = {3.0, 5.0, 8.0, 13.0};
  for (int i = 0; i < 4; i++) {
    SelectionResult result = selection.select(budgets[i], false);
    EXPECT_EQ(PLAN_OK, result.plan.status);
    EXPECT_TRUE(result.found);
    /* Later calls hit the score cache and are charged less */
    EXPECT_LE(result.time_usage, budgets[i] + 1e-6);
  }
}

TEST(ModelSelectionTest, FilterOnlyPicksTheTopScore) {
  ModelSelection selection(make_config(), make_ground_truth());
  SelectionResult result = selection.select(100.0, true);
  EXPECT_TRUE(result.plan.filter_only);
  EXPECT_EQ(12, result.plan.n);
  EXPECT_EQ(1, result.plan.k);
  ASSERT_TRUE(result.found);
  EXPECT_EQ("m11", result.best_id);
  EXPECT_DOUBLE_EQ(11.0, result.best_performance);
  EXPECT_DOUBLE_EQ(0.0, result.refinement.budget_consumed);
  EXPECT_NEAR(1.2, result.time_usage, 1e-9);
}

TEST(ModelSelectionTest, TinyBudgetFallsBack) {
  ModelSelection selection(make_config(), make_ground_truth());
  SelectionResult result = selection.select(0.05, false);
  EXPECT_EQ(PLAN_INSUFFICIENT_BUDGET, result.plan.status);
  EXPECT_EQ(1, result.plan.n);
  EXPECT_EQ(1, result.plan.k);
  EXPECT_EQ(1, result.plan.u);
  EXPECT_TRUE(result.found);
}

TEST(ModelSelectionTest, FilterUsesTheScoreCache) {
  ModelSelection selection(make_config(), make_ground_truth());
  FilteringResult first = selection.filter(12, 3);
  EXPECT_EQ(12, first.num_scored);
  EXPECT_EQ(0, first.num_cache_hits);
  ASSERT_EQ(3u, first.top_k.size());
  EXPECT_EQ("m11", first.top_k[0].candidate.id);
  EXPECT_EQ("m10", first.top_k[1].candidate.id);
  EXPECT_EQ("m09", first.top_k[2].candidate.id);
  EXPECT_EQ(12u, selection.score_cache().size());

  FilteringResult second = selection.filter(12, 3);
  EXPECT_EQ(12, second.num_cache_hits);
  EXPECT_EQ("m11", second.top_k[0].candidate.id);
}

TEST(ModelSelectionTest, FilterIsDeterministicForASeed) {
  ModelSelection a(make_config(), make_ground_truth());
  ModelSelection b(make_config(), make_ground_truth());
  FilteringResult result_a = a.filter(5, 2);
  FilteringResult result_b = b.filter(5, 2);
  ASSERT_EQ(result_a.trace.size(), result_b.trace.size());
  for (size_t i = 0; i < result_a.trace.size(); i++) {
    EXPECT_EQ(result_a.trace[i].second, result_b.trace[i].second);
  }
  ASSERT_EQ(2u, result_a.top_k.size());
  EXPECT_EQ(result_a.top_k[0].candidate.id, result_b.top_k[0].candidate.id);
}

TEST(ModelSelectionTest, RefinesGivenIds) {
  ModelSelection selection(make_config(), make_ground_truth());
  vector<CandidateId> ids;
  ids.push_back("m03");
  ids.push_back("m07");
  RefinementResult result = selection.refine(2, ids, false);
  ASSERT_TRUE(result.found);
  EXPECT_EQ("m07", result.best.candidate.id);
  EXPECT_NEAR(0.14, result.best_metric, 1e-9);
  EXPECT_DOUBLE_EQ(4.0, result.budget_consumed);
}

TEST(ModelSelectionTest, RefineOnlyPhase1PicksTheBestScore) {
  ModelSelection selection(make_config(), make_ground_truth());
  selection.filter(12, 3);
  vector<CandidateId> ids;
  ids.push_back("m05");
  ids.push_back("m09");
  ids.push_back("m02");
  RefinementResult result = selection.refine(2, ids, true);
  ASSERT_TRUE(result.found);
  EXPECT_EQ("m09", result.best.candidate.id);
  EXPECT_DOUBLE_EQ(9.0, result.best_metric);
  EXPECT_DOUBLE_EQ(0.0, result.budget_consumed);
}

TEST(ModelSelectionTest, RefineOnlyPhase1RanksUnscoredIdsLast) {
  ModelSelection selection(make_config(), make_ground_truth());
  vector<CandidateId> ids;
  ids.push_back("m07");
  ids.push_back("m03");
  /* Nothing scored yet, so the tie falls back to id order */
  RefinementResult result = selection.refine(2, ids, true);
  ASSERT_TRUE(result.found);
  EXPECT_EQ("m03", result.best.candidate.id);
  EXPECT_TRUE(std::isinf(result.best_metric));
}

TEST(ModelSelectionTest, RefineRejectsBadInput) {
  ModelSelection selection(make_config(), make_ground_truth());
  vector<CandidateId> ids;
  EXPECT_THROW(selection.refine(2, ids, false), ConfigError);
  ids.push_back("nope");
  EXPECT_THROW(selection.refine(2, ids, false), ConfigError);
  ids[0] = "m01";
  EXPECT_THROW(selection.refine(0, ids, false), ConfigError);
}

TEST(ModelSelectionTest, CancelledSelectionScoresNothing) {
  ModelSelection selection(make_config(), make_ground_truth());
  CancelSignal cancel;
  cancel.cancel();
  SelectionResult result = selection.select(100.0, false, &cancel);
  EXPECT_TRUE(result.filtering.cancelled);
  EXPECT_EQ(0, result.filtering.num_scored);
  EXPECT_FALSE(result.found);
}
