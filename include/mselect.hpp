#ifndef __mselect_hpp__
#define __mselect_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <string>
#include <vector>

#include "mselect-user-defined-types.hpp"

using std::string;
using std::vector;

#define TIE_BREAK_DEEPER_TRAINING   "deeper_training"
#define TIE_BREAK_MORE_SURVIVORS    "more_survivors"

struct CoordinatorConfig {
  double n_k_ratio;
      /* Filtering keeps at least n_k_ratio candidates per survivor */
  int min_u;
  int max_u;
  int max_k;
  int max_n;
      /* Ceiling on N when the search space size is unknown */
  int search_space_size;
      /* 0 means unknown */
  string tie_break;

  CoordinatorConfig() :
      n_k_ratio(10.0),
      min_u(1),
      max_u(200),
      max_k(512),
      max_n(1000000),
      search_space_size(0),
      tie_break(TIE_BREAK_DEEPER_TRAINING) {}
};

struct RefinementConfig {
  string policy;
      /* "sh", "sr" or "uniform" */
  int eta;
  int uniform_checkpoints;
  int num_workers;

  RefinementConfig() :
      policy("sh"),
      eta(3),
      uniform_checkpoints(1),
      num_workers(1) {}
};

struct FilteringConfig {
  int num_workers;
  int max_duplicate_draws;

  FilteringConfig() :
      num_workers(1),
      max_duplicate_draws(1000) {}
};

struct SamplerConfig {
  string sampler;
      /* "random" or "grid" */
  unsigned int seed;
  int with_replacement;
  int shuffle;
  string pool_source;
      /* "evaluator", "file" or "mlp_space" */
  string pool_file;
  vector<int> hidden_choices;
  int num_layers;
  int max_space_size;

  SamplerConfig() :
      sampler("random"),
      seed(0),
      with_replacement(0),
      shuffle(0),
      pool_source("evaluator"),
      num_layers(4),
      max_space_size(1000000) {}
};

struct EvaluatorConfig {
  string evaluator;
      /* "simulated" or "live" */
  string ground_truth_file;
  string score_cmd;
  string train_cmd;
  string work_dir;
  double score_time_per_model;
  double train_time_per_epoch;
      /* Used when the ground-truth file does not carry them */

  EvaluatorConfig() :
      evaluator("simulated"),
      work_dir("/tmp"),
      score_time_per_model(0.0),
      train_time_per_epoch(1.0) {}
};

struct ServiceConfig {
  string endpoint;

  ServiceConfig() :
      endpoint("tcp://*:8093") {}
};

struct BenchmarkConfig {
  vector<string> policies;
  int num_repetitions;
  int models_per_run;
  int num_budget_steps;
  int max_epochs_per_model;
  unsigned int seed;
  string result_file;

  BenchmarkConfig() :
      num_repetitions(3),
      models_per_run(500),
      num_budget_steps(30),
      max_epochs_per_model(200),
      seed(0) {}
};

struct MselectConfig {
  string log_dir;
  string output_dir;
  CoordinatorConfig coordinator_config;
  RefinementConfig refinement_config;
  FilteringConfig filtering_config;
  SamplerConfig sampler_config;
  EvaluatorConfig evaluator_config;
  ServiceConfig service_config;
  BenchmarkConfig benchmark_config;
};

#endif  // defined __mselect_hpp__
