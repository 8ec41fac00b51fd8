/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>

#include <cctype>
#include <fstream>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include <tbb/tick_count.h>

#include "live-evaluator.hpp"

using std::string;
using std::vector;
using std::ifstream;

LiveEvaluator::LiveEvaluator(const EvaluatorConfig& config)
    : config_(config), next_call_(0) {
  CHECK(!config_.score_cmd.empty());
  CHECK(!config_.train_cmd.empty());
}

string LiveEvaluator::result_file(
    const string& kind, const CandidateId& id) {
  string safe_id = id;
  for (uint i = 0; i < safe_id.size(); i++) {
    if (!isalnum(static_cast<unsigned char>(safe_id[i]))
        && safe_id[i] != '-') {
      safe_id[i] = '_';
    }
  }
  unsigned long call = next_call_.fetch_add(1);
  return (boost::format("%s/mselect-%s-%s-%d-%d.out")
      % config_.work_dir % kind % safe_id % getpid() % call).str();
}

string LiveEvaluator::make_cmd(
    const string& cmd_template, const Candidate& candidate,
    const string& result_file, double trained_units,
    double budget_units) const {
  boost::format fmt(cmd_template);
  /* A template may use any subset of the arguments */
  fmt.exceptions(boost::io::all_error_bits
      ^ (boost::io::too_many_args_bit | boost::io::too_few_args_bit));
  const string& encoding =
      candidate.encoding.empty() ? candidate.id : candidate.encoding;
  fmt % candidate.id % encoding % result_file % trained_units % budget_units;
  return fmt.str();
}

bool LiveEvaluator::run_cmd(
    const string& cmd, const string& result_file, DoubleVec *values) const {
  CHECK(values);
  remove(result_file.c_str());
  int ret = system(cmd.c_str());
  if (ret) {
    LOG(WARNING) << "Command returned " << ret << ": " << cmd;
    return false;
  }
  ifstream fin(result_file.c_str());
  if (!fin) {
    LOG(WARNING) << "No result file " << result_file << " from: " << cmd;
    return false;
  }
  values->clear();
  double value;
  while (fin >> value) {
    values->push_back(value);
  }
  fin.close();
  remove(result_file.c_str());
  return true;
}

bool LiveEvaluator::score(const Candidate& candidate, double *score_ptr) {
  CHECK(score_ptr);
  string file = result_file("score", candidate.id);
  string cmd = make_cmd(config_.score_cmd, candidate, file, 0.0, 0.0);
  DoubleVec values;
  if (!run_cmd(cmd, file, &values) || values.size() < 1) {
    return false;
  }
  *score_ptr = values[0];
  return true;
}

bool LiveEvaluator::train_partial(
    const Candidate& candidate, double trained_units, double budget_units,
    TrainResult *result_ptr) {
  CHECK(result_ptr);
  string file = result_file("train", candidate.id);
  string cmd = make_cmd(
      config_.train_cmd, candidate, file, trained_units, budget_units);
  DoubleVec values;
  if (!run_cmd(cmd, file, &values) || values.size() < 1) {
    return false;
  }
  result_ptr->metric = values[0];
  result_ptr->budget_used = values.size() > 1 ? values[1] : budget_units;
  return true;
}

double LiveEvaluator::profile_score_time(const Candidate& probe) {
  tbb::tick_count tick_start = tbb::tick_count::now();
  double probe_score;
  if (!score(probe, &probe_score)) {
    LOG(WARNING) << "Profiling score of " << probe.id
                 << " failed, using configured score_time_per_model";
    return config_.score_time_per_model;
  }
  return (tbb::tick_count::now() - tick_start).seconds();
}

double LiveEvaluator::profile_train_time_per_epoch(const Candidate& probe) {
  tbb::tick_count tick_start = tbb::tick_count::now();
  TrainResult result;
  if (!train_partial(probe, 0.0, 1.0, &result) || result.budget_used <= 0.0) {
    LOG(WARNING) << "Profiling training of " << probe.id
                 << " failed, using configured train_time_per_epoch";
    return config_.train_time_per_epoch;
  }
  double seconds = (tbb::tick_count::now() - tick_start).seconds();
  return seconds / result.budget_used;
}
