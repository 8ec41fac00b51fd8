/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <cmath>
#include <fstream>

#include <boost/format.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/scoped_ptr.hpp>

#include <tbb/tick_count.h>

#include <json/json.h>

#include "common/mselect-errors.hpp"
#include "coordinator/coordinator.hpp"
#include "refinement/refinement-controller.hpp"
#include "samplers/candidate-pool.hpp"
#include "budget-sweep.hpp"

BudgetSweep::BudgetSweep(
    const MselectConfig& config, shared_ptr<SimulatedEvaluator> evaluator)
      : config_(config), evaluator_(evaluator) {
  CHECK(evaluator_);
  const BenchmarkConfig& benchmark_config = config_.benchmark_config;
  if (benchmark_config.num_repetitions < 1 ||
      benchmark_config.models_per_run < 1 ||
      benchmark_config.num_budget_steps < 1 ||
      benchmark_config.max_epochs_per_model < 1) {
    throw ConfigError(
        "benchmark repetitions, models, budget steps and epochs "
        "must be positive");
  }
  if (evaluator_->candidates().empty()) {
    throw ConfigError("the benchmark needs a non-empty ground truth");
  }
}

vector<string> BudgetSweep::policies() const {
  vector<string> policies = config_.benchmark_config.policies;
  if (policies.empty()) {
    policies.push_back(POLICY_SH);
    policies.push_back(POLICY_UNIFORM);
    policies.push_back(POLICY_SR);
  }
  return policies;
}

vector<Candidates> BudgetSweep::sample_pools() const {
  const BenchmarkConfig& benchmark_config = config_.benchmark_config;
  const Candidates& all_candidates = evaluator_->candidates();
  size_t pool_size = std::min<size_t>(
      benchmark_config.models_per_run, all_candidates.size());
  vector<Candidates> pools;
  for (int rep = 0; rep < benchmark_config.num_repetitions; rep++) {
    boost::random::mt19937 rng(benchmark_config.seed + rep);
    vector<size_t> order;
    make_order(all_candidates.size(), true, &rng, &order);
    Candidates pool;
    for (size_t i = 0; i < pool_size; i++) {
      pool.push_back(all_candidates[order[i]]);
    }
    pools.push_back(pool);
  }
  return pools;
}

SweepCurve BudgetSweep::run_policy(
    const string& policy, const vector<Candidates>& pools,
    const CancelSignal *cancel) {
  const BenchmarkConfig& benchmark_config = config_.benchmark_config;
  RefinementConfig refinement_config = config_.refinement_config;
  refinement_config.policy = policy;
  shared_ptr<RefinementController> controller =
      make_refinement_controller(refinement_config);
  CoordinatorConfig coordinator_config = config_.coordinator_config;
  coordinator_config.max_u = std::max(
      coordinator_config.min_u, benchmark_config.max_epochs_per_model);
  Coordinator coordinator(coordinator_config, controller);

  SweepCurve curve;
  for (size_t rep = 0; rep < pools.size(); rep++) {
    const Candidates& pool = pools[rep];
    CHECK(!pool.empty());
    int k = pool.size();
    double time_per_epoch =
        evaluator_->profile_train_time_per_epoch(pool[0]);
    long long min_time = static_cast<long long>(std::ceil(
        time_per_epoch * controller->predicted_cost(k, coordinator_config.min_u)
        - FLOOR_SLACK));
    long long full_time = safe_floor(
        static_cast<double>(k) * benchmark_config.max_epochs_per_model *
        time_per_epoch);
    long long step = std::max<long long>(
        1, (full_time - min_time) / benchmark_config.num_budget_steps);

    tbb::tick_count rep_start_tick = tbb::tick_count::now();
    DoubleVec time_each_run;
    DoubleVec acc_each_run;
    for (int i = 0; i < benchmark_config.num_budget_steps; i++) {
      long long budget = min_time + i * step;
      if (i > 0 && budget >= full_time) {
        break;
      }
      if (is_cancelled(cancel)) {
        break;
      }
      int u = coordinator.max_u_for_budget(k, budget, time_per_epoch);
      if (u == 0) {
        u = coordinator_config.min_u;
      }
      RefinementResult result =
          controller->refine(pool, u, evaluator_.get(), cancel);
      double accuracy = result.best_metric;
      if (result.found) {
        double final_accuracy;
        if (evaluator_->final_accuracy(
              result.best.candidate.id, &final_accuracy)) {
          accuracy = final_accuracy;
        }
      }
      time_each_run.push_back(result.budget_consumed * time_per_epoch);
      acc_each_run.push_back(accuracy);
      LOG(INFO) << policy << " rep " << rep << ": budget " << budget
                << ", u = " << u << ", k = " << k
                << ", consumed " << result.budget_consumed
                << " epochs, accuracy " << accuracy;
    }
    curve.time_used.push_back(time_each_run);
    curve.acc_reached.push_back(acc_each_run);
    LOG(INFO) << policy << " rep " << rep << " took "
              << (tbb::tick_count::now() - rep_start_tick).seconds() << " s";
  }
  return curve;
}

SweepResults BudgetSweep::run(const CancelSignal *cancel) {
  vector<Candidates> pools = sample_pools();
  vector<string> policy_names = policies();
  SweepResults results;
  for (size_t i = 0; i < policy_names.size(); i++) {
    LOG(INFO) << "Benchmarking " << policy_names[i];
    results[policy_names[i]] = run_policy(policy_names[i], pools, cancel);
  }
  return results;
}

static Json::Value matrix_to_json(const vector<DoubleVec>& matrix) {
  Json::Value rows(Json::arrayValue);
  for (size_t i = 0; i < matrix.size(); i++) {
    Json::Value row(Json::arrayValue);
    for (size_t j = 0; j < matrix[i].size(); j++) {
      if (std::isfinite(matrix[i][j])) {
        row.append(matrix[i][j]);
      } else {
        row.append(Json::Value(Json::nullValue));
      }
    }
    rows.append(row);
  }
  return rows;
}

void BudgetSweep::write_results(
    const SweepResults& results, std::ostream& out) const {
  Json::Value root(Json::objectValue);
  for (SweepResults::const_iterator it = results.begin();
       it != results.end(); it++) {
    Json::Value policy_result(Json::objectValue);
    policy_result["time_used"] = matrix_to_json(it->second.time_used);
    policy_result["acc_reached"] = matrix_to_json(it->second.acc_reached);
    root[it->first] = policy_result;
  }
  Json::StreamWriterBuilder builder;
  boost::scoped_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(root, &out);
  out << endl;
}

void BudgetSweep::write_results_file(
    const SweepResults& results, const string& path) const {
  std::ofstream out(path.c_str());
  if (!out) {
    throw ConfigError("cannot write benchmark results to " + path);
  }
  write_results(results, out);
  LOG(INFO) << "Benchmark results written to " << path;
}
