/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "common/mselect-errors.hpp"
#include "evaluators/evaluator.hpp"
#include "evaluators/simulated-evaluator.hpp"
#include "evaluators/live-evaluator.hpp"

shared_ptr<Evaluator> make_evaluator(const EvaluatorConfig& config) {
  if (config.evaluator == EVALUATOR_SIMULATED) {
    if (config.ground_truth_file.empty()) {
      throw ConfigError(
          "evaluator.ground_truth_file is required for the simulated "
          "evaluator");
    }
    shared_ptr<SimulatedEvaluator> evaluator =
        make_shared<SimulatedEvaluator>(
            config.score_time_per_model, config.train_time_per_epoch);
    evaluator->load_file(config.ground_truth_file);
    return evaluator;
  }
  if (config.evaluator == EVALUATOR_LIVE) {
    if (config.score_cmd.empty() || config.train_cmd.empty()) {
      throw ConfigError(
          "evaluator.score_cmd and evaluator.train_cmd are required "
          "for the live evaluator");
    }
    return make_shared<LiveEvaluator>(config);
  }
  throw ConfigError("unknown evaluator " + config.evaluator);
}
