/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <fstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "common/common-utils.hpp"
#include "common/mselect-errors.hpp"
#include "config-loader.hpp"

namespace po = boost::program_options;

using std::string;
using std::vector;

static vector<string> split_list(const string& list) {
  vector<string> items;
  if (boost::trim_copy(list).empty()) {
    return items;
  }
  vector<string> tokens;
  boost::split(tokens, list, boost::is_any_of(","));
  for (uint i = 0; i < tokens.size(); i++) {
    string token = boost::trim_copy(tokens[i]);
    if (!token.empty()) {
      items.push_back(token);
    }
  }
  return items;
}

static string join_ints(const vector<int>& values) {
  string joined;
  for (uint i = 0; i < values.size(); i++) {
    if (i) {
      joined += ",";
    }
    joined += boost::lexical_cast<string>(values[i]);
  }
  return joined;
}

void load_config(std::istream& config_in, MselectConfig *config_ptr) {
  CHECK(config_ptr);
  MselectConfig& config = *config_ptr;
  string hidden_choices = join_ints(config.sampler_config.hidden_choices);
  string policies = boost::algorithm::join(
      config.benchmark_config.policies, ",");

  po::options_description desc("Allowed options");
  desc.add_options()
    ("log_dir",
     po::value<string>(&(config.log_dir))
     ->default_value(config.log_dir),
     "")
    ("output_dir",
     po::value<string>(&(config.output_dir))
     ->default_value(config.output_dir),
     "")

    /* Coordinator configs */
    ("coordinator.n_k_ratio",
     po::value<double>(&(config.coordinator_config.n_k_ratio))
     ->default_value(config.coordinator_config.n_k_ratio),
     "")
    ("coordinator.min_u",
     po::value<int>(&(config.coordinator_config.min_u))
     ->default_value(config.coordinator_config.min_u),
     "")
    ("coordinator.max_u",
     po::value<int>(&(config.coordinator_config.max_u))
     ->default_value(config.coordinator_config.max_u),
     "")
    ("coordinator.max_k",
     po::value<int>(&(config.coordinator_config.max_k))
     ->default_value(config.coordinator_config.max_k),
     "")
    ("coordinator.max_n",
     po::value<int>(&(config.coordinator_config.max_n))
     ->default_value(config.coordinator_config.max_n),
     "")
    ("coordinator.search_space_size",
     po::value<int>(&(config.coordinator_config.search_space_size))
     ->default_value(config.coordinator_config.search_space_size),
     "")
    ("coordinator.tie_break",
     po::value<string>(&(config.coordinator_config.tie_break))
     ->default_value(config.coordinator_config.tie_break),
     "")

    /* Refinement configs */
    ("refinement.policy",
     po::value<string>(&(config.refinement_config.policy))
     ->default_value(config.refinement_config.policy),
     "")
    ("refinement.eta",
     po::value<int>(&(config.refinement_config.eta))
     ->default_value(config.refinement_config.eta),
     "")
    ("refinement.uniform_checkpoints",
     po::value<int>(&(config.refinement_config.uniform_checkpoints))
     ->default_value(config.refinement_config.uniform_checkpoints),
     "")
    ("refinement.num_workers",
     po::value<int>(&(config.refinement_config.num_workers))
     ->default_value(config.refinement_config.num_workers),
     "")

    /* Filtering configs */
    ("filtering.num_workers",
     po::value<int>(&(config.filtering_config.num_workers))
     ->default_value(config.filtering_config.num_workers),
     "")
    ("filtering.max_duplicate_draws",
     po::value<int>(&(config.filtering_config.max_duplicate_draws))
     ->default_value(config.filtering_config.max_duplicate_draws),
     "")

    /* Sampler configs */
    ("sampler.sampler",
     po::value<string>(&(config.sampler_config.sampler))
     ->default_value(config.sampler_config.sampler),
     "")
    ("sampler.seed",
     po::value<unsigned int>(&(config.sampler_config.seed))
     ->default_value(config.sampler_config.seed),
     "")
    ("sampler.with_replacement",
     po::value<int>(&(config.sampler_config.with_replacement))
     ->default_value(config.sampler_config.with_replacement),
     "")
    ("sampler.shuffle",
     po::value<int>(&(config.sampler_config.shuffle))
     ->default_value(config.sampler_config.shuffle),
     "")
    ("sampler.pool_source",
     po::value<string>(&(config.sampler_config.pool_source))
     ->default_value(config.sampler_config.pool_source),
     "")
    ("sampler.pool_file",
     po::value<string>(&(config.sampler_config.pool_file))
     ->default_value(config.sampler_config.pool_file),
     "")
    ("sampler.hidden_choices",
     po::value<string>(&hidden_choices)
     ->default_value(hidden_choices),
     "")
    ("sampler.num_layers",
     po::value<int>(&(config.sampler_config.num_layers))
     ->default_value(config.sampler_config.num_layers),
     "")
    ("sampler.max_space_size",
     po::value<int>(&(config.sampler_config.max_space_size))
     ->default_value(config.sampler_config.max_space_size),
     "")

    /* Evaluator configs */
    ("evaluator.evaluator",
     po::value<string>(&(config.evaluator_config.evaluator))
     ->default_value(config.evaluator_config.evaluator),
     "")
    ("evaluator.ground_truth_file",
     po::value<string>(&(config.evaluator_config.ground_truth_file))
     ->default_value(config.evaluator_config.ground_truth_file),
     "")
    ("evaluator.score_cmd",
     po::value<string>(&(config.evaluator_config.score_cmd))
     ->default_value(config.evaluator_config.score_cmd),
     "")
    ("evaluator.train_cmd",
     po::value<string>(&(config.evaluator_config.train_cmd))
     ->default_value(config.evaluator_config.train_cmd),
     "")
    ("evaluator.work_dir",
     po::value<string>(&(config.evaluator_config.work_dir))
     ->default_value(config.evaluator_config.work_dir),
     "")
    ("evaluator.score_time_per_model",
     po::value<double>(&(config.evaluator_config.score_time_per_model))
     ->default_value(config.evaluator_config.score_time_per_model),
     "")
    ("evaluator.train_time_per_epoch",
     po::value<double>(&(config.evaluator_config.train_time_per_epoch))
     ->default_value(config.evaluator_config.train_time_per_epoch),
     "")

    /* Service configs */
    ("service.endpoint",
     po::value<string>(&(config.service_config.endpoint))
     ->default_value(config.service_config.endpoint),
     "")

    /* Benchmark configs */
    ("benchmark.policies",
     po::value<string>(&policies)
     ->default_value(policies),
     "")
    ("benchmark.num_repetitions",
     po::value<int>(&(config.benchmark_config.num_repetitions))
     ->default_value(config.benchmark_config.num_repetitions),
     "")
    ("benchmark.models_per_run",
     po::value<int>(&(config.benchmark_config.models_per_run))
     ->default_value(config.benchmark_config.models_per_run),
     "")
    ("benchmark.num_budget_steps",
     po::value<int>(&(config.benchmark_config.num_budget_steps))
     ->default_value(config.benchmark_config.num_budget_steps),
     "")
    ("benchmark.max_epochs_per_model",
     po::value<int>(&(config.benchmark_config.max_epochs_per_model))
     ->default_value(config.benchmark_config.max_epochs_per_model),
     "")
    ("benchmark.seed",
     po::value<unsigned int>(&(config.benchmark_config.seed))
     ->default_value(config.benchmark_config.seed),
     "")
    ("benchmark.result_file",
     po::value<string>(&(config.benchmark_config.result_file))
     ->default_value(config.benchmark_config.result_file),
     "");

  try {
    po::variables_map vm;
    po::store(po::parse_config_file(config_in, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw ConfigError(string("bad configuration: ") + e.what());
  }

  config.sampler_config.hidden_choices.clear();
  vector<string> choices = split_list(hidden_choices);
  for (uint i = 0; i < choices.size(); i++) {
    try {
      config.sampler_config.hidden_choices.push_back(
          boost::lexical_cast<int>(choices[i]));
    } catch (const boost::bad_lexical_cast&) {
      throw ConfigError(
          "sampler.hidden_choices: not an integer: " + choices[i]);
    }
  }
  config.benchmark_config.policies = split_list(policies);

  validate_config(config);
}

void load_config_file(const string& path, MselectConfig *config_ptr) {
  std::ifstream config_in(path.c_str());
  if (!config_in) {
    throw ConfigError("cannot open config file " + path);
  }
  load_config(config_in, config_ptr);
  LOG(INFO) << "Loaded config file " << path;
}

static void require(bool condition, const string& message) {
  if (!condition) {
    throw ConfigError(message);
  }
}

static bool is_policy(const string& policy) {
  return policy == POLICY_SH || policy == POLICY_SR
      || policy == POLICY_UNIFORM;
}

void validate_config(const MselectConfig& config) {
  const CoordinatorConfig& coordinator_config = config.coordinator_config;
  require(coordinator_config.n_k_ratio >= 1.0,
      "coordinator.n_k_ratio must be >= 1");
  require(coordinator_config.min_u >= 1,
      "coordinator.min_u must be >= 1");
  require(coordinator_config.max_u >= coordinator_config.min_u,
      "coordinator.max_u must be >= coordinator.min_u");
  require(coordinator_config.max_k >= 1,
      "coordinator.max_k must be >= 1");
  require(coordinator_config.max_n >= 1,
      "coordinator.max_n must be >= 1");
  require(coordinator_config.search_space_size >= 0,
      "coordinator.search_space_size must be >= 0");
  require(coordinator_config.tie_break == TIE_BREAK_DEEPER_TRAINING
      || coordinator_config.tie_break == TIE_BREAK_MORE_SURVIVORS,
      "coordinator.tie_break must be " TIE_BREAK_DEEPER_TRAINING
      " or " TIE_BREAK_MORE_SURVIVORS);

  const RefinementConfig& refinement_config = config.refinement_config;
  require(is_policy(refinement_config.policy),
      "unknown refinement.policy " + refinement_config.policy);
  require(refinement_config.eta >= 2,
      "refinement.eta must be >= 2");
  require(refinement_config.uniform_checkpoints >= 1,
      "refinement.uniform_checkpoints must be >= 1");
  require(refinement_config.num_workers >= 1,
      "refinement.num_workers must be >= 1");

  require(config.filtering_config.num_workers >= 1,
      "filtering.num_workers must be >= 1");
  require(config.filtering_config.max_duplicate_draws >= 1,
      "filtering.max_duplicate_draws must be >= 1");

  const SamplerConfig& sampler_config = config.sampler_config;
  require(sampler_config.sampler == SAMPLER_RANDOM
      || sampler_config.sampler == SAMPLER_GRID,
      "unknown sampler.sampler " + sampler_config.sampler);
  require(sampler_config.pool_source == POOL_FROM_EVALUATOR
      || sampler_config.pool_source == POOL_FROM_FILE
      || sampler_config.pool_source == POOL_FROM_MLP_SPACE,
      "unknown sampler.pool_source " + sampler_config.pool_source);
  if (sampler_config.pool_source == POOL_FROM_FILE) {
    require(!sampler_config.pool_file.empty(),
        "sampler.pool_file is required when pool_source is file");
  }
  if (sampler_config.pool_source == POOL_FROM_MLP_SPACE) {
    require(!sampler_config.hidden_choices.empty(),
        "sampler.hidden_choices is required for the mlp space");
    require(sampler_config.num_layers >= 1,
        "sampler.num_layers must be >= 1");
  }
  require(sampler_config.max_space_size >= 1,
      "sampler.max_space_size must be >= 1");

  const EvaluatorConfig& evaluator_config = config.evaluator_config;
  require(evaluator_config.evaluator == EVALUATOR_SIMULATED
      || evaluator_config.evaluator == EVALUATOR_LIVE,
      "unknown evaluator.evaluator " + evaluator_config.evaluator);
  if (evaluator_config.evaluator == EVALUATOR_LIVE) {
    require(!evaluator_config.score_cmd.empty()
        && !evaluator_config.train_cmd.empty(),
        "evaluator.score_cmd and evaluator.train_cmd are required "
        "for the live evaluator");
  }
  require(evaluator_config.score_time_per_model >= 0.0,
      "evaluator.score_time_per_model must be >= 0");
  require(evaluator_config.train_time_per_epoch > 0.0,
      "evaluator.train_time_per_epoch must be > 0");

  const BenchmarkConfig& benchmark_config = config.benchmark_config;
  for (uint i = 0; i < benchmark_config.policies.size(); i++) {
    require(is_policy(benchmark_config.policies[i]),
        "unknown benchmark policy " + benchmark_config.policies[i]);
  }
  require(benchmark_config.num_repetitions >= 1,
      "benchmark.num_repetitions must be >= 1");
  require(benchmark_config.models_per_run >= 1,
      "benchmark.models_per_run must be >= 1");
  require(benchmark_config.num_budget_steps >= 1,
      "benchmark.num_budget_steps must be >= 1");
  require(benchmark_config.max_epochs_per_model >= 1,
      "benchmark.max_epochs_per_model must be >= 1");
}
