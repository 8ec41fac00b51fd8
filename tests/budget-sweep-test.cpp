/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <set>
#include <sstream>
#include <string>

#include <boost/format.hpp>

#include <json/json.h>

#include <gtest/gtest.h>

#include "benchmark/budget-sweep.hpp"
#include "common/internal-config.hpp"
#include "common/mselect-errors.hpp"

/* Nine models whose accuracy grows with the index at every epoch,
 * so every policy should end up with b8 */
static shared_ptr<SimulatedEvaluator> make_ground_truth() {
  shared_ptr<SimulatedEvaluator> evaluator =
      make_shared<SimulatedEvaluator>(0.0, 1.0);
  for (int i = 0; i < 9; i++) {
    DoubleVec accuracies;
    for (int e = 1; e <= 4; e++) {
      accuracies.push_back(0.1 * i + 0.01 * e);
    }
    evaluator->add_model(
        Candidate((boost::format("b%d") % i).str()), i, accuracies, false);
  }
  return evaluator;
}

static MselectConfig make_config() {
  MselectConfig config;
  config.benchmark_config.policies.push_back(POLICY_SH);
  config.benchmark_config.policies.push_back(POLICY_UNIFORM);
  config.benchmark_config.num_repetitions = 2;
  config.benchmark_config.models_per_run = 9;
  config.benchmark_config.num_budget_steps = 5;
  config.benchmark_config.max_epochs_per_model = 4;
  config.benchmark_config.seed = 3;
  return config;
}

TEST(BudgetSweepTest, DefaultPolicies) {
  MselectConfig config = make_config();
  config.benchmark_config.policies.clear();
  BudgetSweep sweep(config, make_ground_truth());
  vector<string> policies = sweep.policies();
  ASSERT_EQ(3u, policies.size());
  EXPECT_EQ(POLICY_SH, policies[0]);
  EXPECT_EQ(POLICY_UNIFORM, policies[1]);
  EXPECT_EQ(POLICY_SR, policies[2]);
}

TEST(BudgetSweepTest, RejectsEmptyGroundTruth) {
  EXPECT_THROW({
    BudgetSweep sweep(make_config(), make_shared<SimulatedEvaluator>(0.0, 1.0));
  }, ConfigError);
  MselectConfig config = make_config();
  config.benchmark_config.num_budget_steps = 0;
  EXPECT_THROW({
    BudgetSweep sweep(config, make_ground_truth());
  }, ConfigError);
}

TEST(BudgetSweepTest, PoolsAreSeededPermutations) {
  MselectConfig config = make_config();
  config.benchmark_config.models_per_run = 5;
  BudgetSweep sweep(config, make_ground_truth());
  vector<Candidates> pools = sweep.sample_pools();
  vector<Candidates> again = sweep.sample_pools();
  ASSERT_EQ(2u, pools.size());
  for (size_t rep = 0; rep < pools.size(); rep++) {
    ASSERT_EQ(5u, pools[rep].size());
    std::set<CandidateId> ids;
    for (size_t i = 0; i < pools[rep].size(); i++) {
      ids.insert(pools[rep][i].id);
      EXPECT_EQ(again[rep][i].id, pools[rep][i].id);
    }
    EXPECT_EQ(5u, ids.size());
  }
}

TEST(BudgetSweepTest, UniformCurve) {
  BudgetSweep sweep(make_config(), make_ground_truth());
  vector<Candidates> pools = sweep.sample_pools();
  SweepCurve curve = sweep.run_policy(POLICY_UNIFORM, pools, NULL);
  ASSERT_EQ(2u, curve.time_used.size());
  ASSERT_EQ(2u, curve.acc_reached.size());
  for (size_t rep = 0; rep < 2; rep++) {
    /* Budgets 9, 14, 19, 24 and 29 afford u = 1, 1, 2, 2 and 3 */
    ASSERT_EQ(5u, curve.time_used[rep].size());
    EXPECT_DOUBLE_EQ(9.0, curve.time_used[rep][0]);
    EXPECT_DOUBLE_EQ(9.0, curve.time_used[rep][1]);
    EXPECT_DOUBLE_EQ(18.0, curve.time_used[rep][2]);
    EXPECT_DOUBLE_EQ(18.0, curve.time_used[rep][3]);
    EXPECT_DOUBLE_EQ(27.0, curve.time_used[rep][4]);
    ASSERT_EQ(5u, curve.acc_reached[rep].size());
    for (size_t i = 0; i < 5; i++) {
      EXPECT_NEAR(0.84, curve.acc_reached[rep][i], 1e-9);
    }
  }
}

TEST(BudgetSweepTest, SuccessiveHalvingStaysUnderFullTraining) {
  BudgetSweep sweep(make_config(), make_ground_truth());
  vector<Candidates> pools = sweep.sample_pools();
  SweepCurve curve = sweep.run_policy(POLICY_SH, pools, NULL);
  ASSERT_EQ(2u, curve.time_used.size());
  for (size_t rep = 0; rep < 2; rep++) {
    ASSERT_FALSE(curve.time_used[rep].empty());
    ASSERT_EQ(curve.time_used[rep].size(), curve.acc_reached[rep].size());
    for (size_t i = 0; i < curve.time_used[rep].size(); i++) {
      EXPECT_GT(curve.time_used[rep][i], 0.0);
      EXPECT_LE(curve.time_used[rep][i], 36.0);
      if (i > 0) {
        EXPECT_GE(curve.time_used[rep][i], curve.time_used[rep][i - 1]);
      }
      EXPECT_NEAR(0.84, curve.acc_reached[rep][i], 1e-9);
    }
  }
}

TEST(BudgetSweepTest, CancelledSweepIsEmpty) {
  BudgetSweep sweep(make_config(), make_ground_truth());
  CancelSignal cancel;
  cancel.cancel();
  SweepResults results = sweep.run(&cancel);
  ASSERT_EQ(2u, results.size());
  EXPECT_TRUE(results[POLICY_SH].time_used[0].empty());
}

TEST(BudgetSweepTest, WritesJsonResults) {
  BudgetSweep sweep(make_config(), make_ground_truth());
  SweepResults results = sweep.run();
  std::stringstream out;
  sweep.write_results(results, out);

  Json::CharReaderBuilder builder;
  Json::Value root;
  string errors;
  ASSERT_TRUE(Json::parseFromStream(builder, out, &root, &errors)) << errors;
  ASSERT_TRUE(root.isMember(POLICY_SH));
  ASSERT_TRUE(root.isMember(POLICY_UNIFORM));
  EXPECT_FALSE(root.isMember(POLICY_SR));
  const Json::Value& uniform = root[POLICY_UNIFORM];
  ASSERT_EQ(2u, uniform["time_used"].size());
  ASSERT_EQ(2u, uniform["acc_reached"].size());
  EXPECT_EQ(5u, uniform["time_used"][0].size());
  EXPECT_DOUBLE_EQ(27.0, uniform["time_used"][1][4].asDouble());
}
