/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <tbb/tick_count.h>

#include <boost/format.hpp>

#include "common/mselect-errors.hpp"
#include "samplers/candidate-pool.hpp"
#include "samplers/candidate-sampler.hpp"
#include "model-selection.hpp"

ModelSelection::ModelSelection(const MselectConfig& config)
    : config_(config) {
  evaluator_ = make_evaluator(config_.evaluator_config);
  init();
}

ModelSelection::ModelSelection(
    const MselectConfig& config, shared_ptr<Evaluator> evaluator)
      : config_(config), evaluator_(evaluator) {
  CHECK(evaluator_);
  init();
}

void ModelSelection::init() {
  build_pool();
  if (config_.coordinator_config.search_space_size <= 0) {
    config_.coordinator_config.search_space_size = pool_.size();
  }
  controller_ = make_refinement_controller(config_.refinement_config);
  coordinator_ = make_shared<Coordinator>(
      config_.coordinator_config, controller_);
  filtering_driver_ = make_shared<FilteringDriver>(config_.filtering_config);
}

void ModelSelection::build_pool() {
  const SamplerConfig& sampler_config = config_.sampler_config;
  if (sampler_config.pool_source == POOL_FROM_EVALUATOR) {
    if (!evaluator_->list_candidates(&pool_)) {
      throw ConfigError(
          "the " + evaluator_->name() + " evaluator has no candidate pool, "
          "set sampler.pool_source to file or mlp_space");
    }
  } else if (sampler_config.pool_source == POOL_FROM_FILE) {
    load_candidate_pool_file(sampler_config.pool_file, &pool_);
  } else if (sampler_config.pool_source == POOL_FROM_MLP_SPACE) {
    enumerate_mlp_space(
        sampler_config.hidden_choices, sampler_config.num_layers,
        sampler_config.max_space_size, &pool_);
  } else {
    throw ConfigError("unknown pool source " + sampler_config.pool_source);
  }
  if (pool_.empty()) {
    throw ConfigError("the candidate pool is empty");
  }
  pool_index_.clear();
  for (size_t i = 0; i < pool_.size(); i++) {
    if (!pool_index_.insert(std::make_pair(pool_[i].id, i)).second) {
      throw ConfigError("duplicate candidate id " + pool_[i].id);
    }
  }
  LOG(INFO) << "Candidate pool of " << pool_.size() << " from "
            << sampler_config.pool_source;
}

const Candidate& ModelSelection::probe() const {
  CHECK(!pool_.empty());
  return pool_[0];
}

AllocationPlan ModelSelection::coordinate(
    double budget, double score_time_per_model,
    double train_time_per_epoch, bool only_phase1) const {
  return coordinator_->coordinate(
      budget, score_time_per_model, train_time_per_epoch, only_phase1);
}

FilteringResult ModelSelection::filter(
    int n, int k, const CancelSignal *cancel) {
  shared_ptr<CandidateSampler> sampler =
      make_sampler(config_.sampler_config, pool_);
  return filtering_driver_->filter(
      n, k, sampler.get(), evaluator_.get(), &score_cache_, cancel);
}

RefinementResult ModelSelection::pick_without_training(
    const Candidates& candidates) const {
  CHECK(!candidates.empty());
  /* Unscored or failed candidates rank last with the worst score */
  ScoredCandidates scored;
  for (size_t i = 0; i < candidates.size(); i++) {
    scored.push_back(ScoredCandidate(candidates[i]));
    CachedScore cached;
    if (score_cache_.lookup(candidates[i].id, &cached) && cached.ok) {
      scored.back().score = cached.score;
    }
  }
  rank_by_score(&scored);
  RefinementResult result;
  result.best = scored[0];
  result.best_metric = result.best.score;
  result.found = true;
  return result;
}

RefinementResult ModelSelection::refine(
    int u, const vector<CandidateId>& ids, bool only_phase1,
    const CancelSignal *cancel) {
  if (ids.empty()) {
    throw ConfigError("refinement needs a non-empty candidate list");
  }
  Candidates candidates;
  for (size_t i = 0; i < ids.size(); i++) {
    boost::unordered_map<CandidateId, size_t>::const_iterator it =
        pool_index_.find(ids[i]);
    if (it == pool_index_.end()) {
      throw ConfigError("unknown candidate id " + ids[i]);
    }
    candidates.push_back(pool_[it->second]);
  }
  if (only_phase1) {
    return pick_without_training(candidates);
  }
  return controller_->refine(candidates, u, evaluator_.get(), cancel);
}

RefinementResult ModelSelection::refine(
    const AllocationPlan& plan, const ScoredCandidates& top_k,
    const CancelSignal *cancel) {
  validate_plan(plan);
  Candidates candidates;
  for (size_t i = 0; i < top_k.size(); i++) {
    candidates.push_back(top_k[i].candidate);
  }
  if (candidates.empty()) {
    throw ConfigError("refinement needs a non-empty candidate list");
  }
  if (plan.filter_only) {
    return pick_without_training(candidates);
  }
  return controller_->refine(candidates, plan.u, evaluator_.get(), cancel);
}

SelectionResult ModelSelection::select(
    double budget, bool only_phase1, const CancelSignal *cancel) {
  tbb::tick_count select_start_tick = tbb::tick_count::now();
  SelectionResult result;
  double score_time = profile_filtering();
  double train_time = profile_refinement();
  result.plan = coordinate(budget, score_time, train_time, only_phase1);

  result.filtering = filter(result.plan.n, result.plan.k, cancel);
  int num_charged_scores =
      result.filtering.num_scored - result.filtering.num_cache_hits;
  result.time_usage = num_charged_scores * score_time;
  if (!result.filtering.top_k.empty()) {
    result.refinement = refine(result.plan, result.filtering.top_k, cancel);
    result.time_usage += result.refinement.budget_consumed * train_time;
    if (result.refinement.found) {
      result.found = true;
      result.best_id = result.refinement.best.candidate.id;
      result.best_performance = result.refinement.best_metric;
    }
  } else {
    LOG(WARNING) << "No candidate survived filtering";
  }
  result.wall_time = (tbb::tick_count::now() - select_start_tick).seconds();
  LOG(INFO) << "Selected " << (result.found ? result.best_id : "nothing")
            << " with performance " << result.best_performance
            << ", charged time " << result.time_usage
            << " of " << budget << ", wall time " << result.wall_time;
  return result;
}

double ModelSelection::profile_filtering() {
  double score_time = evaluator_->profile_score_time(probe());
  LOG(INFO) << "Score time per model: " << score_time;
  return score_time;
}

double ModelSelection::profile_refinement() {
  double train_time = evaluator_->profile_train_time_per_epoch(probe());
  LOG(INFO) << "Train time per epoch: " << train_time;
  return train_time;
}

SelectionResult ModelSelection::run_workload(
    const AllocationPlan& plan, const CancelSignal *cancel) {
  validate_plan(plan);
  tbb::tick_count workload_start_tick = tbb::tick_count::now();
  SelectionResult result;
  result.plan = plan;
  result.filtering = filter(plan.n, plan.k, cancel);
  if (!result.filtering.top_k.empty()) {
    result.refinement = refine(plan, result.filtering.top_k, cancel);
    if (result.refinement.found) {
      result.found = true;
      result.best_id = result.refinement.best.candidate.id;
      result.best_performance = result.refinement.best_metric;
    }
  } else {
    LOG(WARNING) << "No candidate survived filtering";
  }
  result.wall_time =
      (tbb::tick_count::now() - workload_start_tick).seconds();
  LOG(INFO) << "Workload n = " << plan.n << ", k = " << plan.k
            << ", u = " << plan.u << " picked "
            << (result.found ? result.best_id : "nothing")
            << " in " << result.wall_time << " s";
  return result;
}
