/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/mselect-errors.hpp"
#include "simulated-evaluator.hpp"

using std::string;
using std::vector;

SimulatedEvaluator::SimulatedEvaluator(
    double score_time_per_model, double train_time_per_epoch)
    : score_time_per_model_(score_time_per_model),
      train_time_per_epoch_(train_time_per_epoch) {
}

void SimulatedEvaluator::insert(const GroundTruth& ground_truth) {
  const CandidateId& id = ground_truth.candidate.id;
  if (ground_truth_map_.count(id)) {
    throw ConfigError("duplicate model id in ground truth: " + id);
  }
  ground_truth_map_[id] = ground_truth;
  candidates_.push_back(ground_truth.candidate);
}

void SimulatedEvaluator::add_model(
    const Candidate& candidate, double score, const DoubleVec& accuracies,
    bool diverged) {
  GroundTruth ground_truth;
  ground_truth.candidate = candidate;
  ground_truth.score = score;
  ground_truth.has_score = true;
  ground_truth.accuracies = accuracies;
  ground_truth.diverged = diverged;
  insert(ground_truth);
}

void SimulatedEvaluator::add_unscored_model(
    const Candidate& candidate, const DoubleVec& accuracies) {
  GroundTruth ground_truth;
  ground_truth.candidate = candidate;
  ground_truth.accuracies = accuracies;
  insert(ground_truth);
}

void SimulatedEvaluator::load(std::istream& in) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors)) {
    throw ConfigError("cannot parse ground truth: " + errors);
  }
  if (!root.isObject() || !root["models"].isArray()) {
    throw ConfigError("ground truth must be an object with a models array");
  }
  if (root.isMember("score_time_per_model")) {
    score_time_per_model_ = root["score_time_per_model"].asDouble();
  }
  if (root.isMember("train_time_per_epoch")) {
    train_time_per_epoch_ = root["train_time_per_epoch"].asDouble();
  }

  const Json::Value& models = root["models"];
  for (Json::ArrayIndex i = 0; i < models.size(); i++) {
    const Json::Value& model = models[i];
    if (!model.isObject() || !model["id"].isString()) {
      throw ConfigError("ground truth model without a string id");
    }
    GroundTruth ground_truth;
    ground_truth.candidate.id = model["id"].asString();
    ground_truth.candidate.encoding =
        model.get("encoding", ground_truth.candidate.id).asString();
    if (model.isMember("score")) {
      ground_truth.score = model["score"].asDouble();
      ground_truth.has_score = true;
    }
    const Json::Value& accuracies = model["accuracy"];
    for (Json::ArrayIndex e = 0; e < accuracies.size(); e++) {
      /* null marks a diverged epoch */
      ground_truth.accuracies.push_back(accuracies[e].isNull() ?
          std::numeric_limits<double>::quiet_NaN() :
          accuracies[e].asDouble());
    }
    ground_truth.diverged = model.get("diverged", false).asBool();
    insert(ground_truth);
  }
  LOG(INFO) << "Simulated evaluator loaded " << candidates_.size()
            << " models, score_time_per_model = " << score_time_per_model_
            << ", train_time_per_epoch = " << train_time_per_epoch_;
}

void SimulatedEvaluator::load_file(const string& path) {
  std::ifstream in(path.c_str());
  if (!in) {
    throw ConfigError("cannot open ground truth file " + path);
  }
  load(in);
}

bool SimulatedEvaluator::score(const Candidate& candidate, double *score_ptr) {
  CHECK(score_ptr);
  GroundTruthMap::const_iterator it = ground_truth_map_.find(candidate.id);
  if (it == ground_truth_map_.end() || !it->second.has_score) {
    return false;
  }
  if (std::isnan(it->second.score)) {
    return false;
  }
  *score_ptr = it->second.score;
  return true;
}

bool SimulatedEvaluator::train_partial(
    const Candidate& candidate, double trained_units, double budget_units,
    TrainResult *result_ptr) {
  CHECK(result_ptr);
  CHECK_GE(trained_units, 0.0);
  CHECK_GE(budget_units, 0.0);
  GroundTruthMap::const_iterator it = ground_truth_map_.find(candidate.id);
  if (it == ground_truth_map_.end()) {
    return false;
  }
  const GroundTruth& ground_truth = it->second;
  if (ground_truth.diverged || ground_truth.accuracies.empty()) {
    return false;
  }

  double num_epochs = static_cast<double>(ground_truth.accuracies.size());
  double budget_used =
      std::max(0.0, std::min(budget_units, num_epochs - trained_units));
  int epoch = static_cast<int>(
      std::ceil(trained_units + budget_used - BUDGET_SLACK));
  epoch = std::max(1, std::min(epoch, static_cast<int>(num_epochs)));
  double metric = ground_truth.accuracies[epoch - 1];
  if (std::isnan(metric)) {
    return false;
  }
  result_ptr->metric = metric;
  result_ptr->budget_used = budget_used;
  return true;
}

bool SimulatedEvaluator::final_accuracy(
    const CandidateId& id, double *accuracy_ptr) const {
  CHECK(accuracy_ptr);
  GroundTruthMap::const_iterator it = ground_truth_map_.find(id);
  if (it == ground_truth_map_.end() || it->second.accuracies.empty()) {
    return false;
  }
  *accuracy_ptr = it->second.accuracies.back();
  return true;
}
