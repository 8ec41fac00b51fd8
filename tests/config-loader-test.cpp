/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "common/config-loader.hpp"
#include "common/internal-config.hpp"
#include "common/mselect-errors.hpp"

static void load_from_string(const std::string& text, MselectConfig *config) {
  std::istringstream in(text);
  load_config(in, config);
}

TEST(ConfigLoaderTest, EmptyFileKeepsDefaults) {
  MselectConfig config;
  load_from_string("", &config);
  EXPECT_DOUBLE_EQ(10.0, config.coordinator_config.n_k_ratio);
  EXPECT_EQ(1, config.coordinator_config.min_u);
  EXPECT_EQ(200, config.coordinator_config.max_u);
  EXPECT_EQ(TIE_BREAK_DEEPER_TRAINING, config.coordinator_config.tie_break);
  EXPECT_EQ(POLICY_SH, config.refinement_config.policy);
  EXPECT_EQ(3, config.refinement_config.eta);
  EXPECT_EQ(SAMPLER_RANDOM, config.sampler_config.sampler);
  EXPECT_EQ(EVALUATOR_SIMULATED, config.evaluator_config.evaluator);
  EXPECT_TRUE(config.benchmark_config.policies.empty());
}

TEST(ConfigLoaderTest, ReadsSections) {
  MselectConfig config;
  load_from_string(
      "log_dir = /tmp/mselect-logs\n"
      "# comment lines are ignored\n"
      "[coordinator]\n"
      "n_k_ratio = 4.5\n"
      "max_u = 27\n"
      "tie_break = more_survivors\n"
      "[refinement]\n"
      "policy = sr\n"
      "num_workers = 4\n"
      "[sampler]\n"
      "sampler = grid\n"
      "seed = 42\n"
      "pool_source = mlp_space\n"
      "hidden_choices = 8, 16,32\n"
      "num_layers = 2\n"
      "[evaluator]\n"
      "ground_truth_file = /data/mlp.json\n"
      "train_time_per_epoch = 3.5\n"
      "[service]\n"
      "endpoint = tcp://*:9000\n"
      "[benchmark]\n"
      "policies = sh,uniform\n"
      "num_repetitions = 5\n",
      &config);
  EXPECT_EQ("/tmp/mselect-logs", config.log_dir);
  EXPECT_DOUBLE_EQ(4.5, config.coordinator_config.n_k_ratio);
  EXPECT_EQ(27, config.coordinator_config.max_u);
  EXPECT_EQ(TIE_BREAK_MORE_SURVIVORS, config.coordinator_config.tie_break);
  EXPECT_EQ(POLICY_SR, config.refinement_config.policy);
  EXPECT_EQ(4, config.refinement_config.num_workers);
  EXPECT_EQ(SAMPLER_GRID, config.sampler_config.sampler);
  EXPECT_EQ(42u, config.sampler_config.seed);
  ASSERT_EQ(3u, config.sampler_config.hidden_choices.size());
  EXPECT_EQ(8, config.sampler_config.hidden_choices[0]);
  EXPECT_EQ(16, config.sampler_config.hidden_choices[1]);
  EXPECT_EQ(32, config.sampler_config.hidden_choices[2]);
  EXPECT_EQ(2, config.sampler_config.num_layers);
  EXPECT_EQ("/data/mlp.json", config.evaluator_config.ground_truth_file);
  EXPECT_DOUBLE_EQ(3.5, config.evaluator_config.train_time_per_epoch);
  EXPECT_EQ("tcp://*:9000", config.service_config.endpoint);
  ASSERT_EQ(2u, config.benchmark_config.policies.size());
  EXPECT_EQ(POLICY_SH, config.benchmark_config.policies[0]);
  EXPECT_EQ(POLICY_UNIFORM, config.benchmark_config.policies[1]);
  EXPECT_EQ(5, config.benchmark_config.num_repetitions);
}

TEST(ConfigLoaderTest, RejectsUnknownKeys) {
  MselectConfig config;
  EXPECT_THROW(load_from_string("[coordinator]\nmax_v = 3\n", &config),
               ConfigError);
}

TEST(ConfigLoaderTest, RejectsBadValues) {
  MselectConfig config;
  EXPECT_THROW(load_from_string("[coordinator]\nmax_u = many\n", &config),
               ConfigError);
  EXPECT_THROW(
      load_from_string("[sampler]\npool_source = mlp_space\n"
                       "hidden_choices = 8,wide\n", &config),
      ConfigError);
}

TEST(ConfigLoaderTest, ValidatesRanges) {
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[coordinator]\nn_k_ratio = 0.5\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[coordinator]\nmin_u = 5\nmax_u = 4\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[refinement]\npolicy = bandit\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[refinement]\neta = 1\n", &config),
                 ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[coordinator]\ntie_break = coin\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[sampler]\npool_source = file\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[evaluator]\nevaluator = live\n",
                                  &config), ConfigError);
  }
  {
    MselectConfig config;
    EXPECT_THROW(load_from_string("[benchmark]\npolicies = sh,bogus\n",
                                  &config), ConfigError);
  }
}

TEST(ConfigLoaderTest, MissingFile) {
  MselectConfig config;
  EXPECT_THROW(load_config_file("/nonexistent/mselect.ini", &config),
               ConfigError);
}
