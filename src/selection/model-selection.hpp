#ifndef __model_selection_hpp__
#define __model_selection_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <vector>
#include <string>

#include <boost/shared_ptr.hpp>

#include "common/common-utils.hpp"
#include "common/cancel-signal.hpp"
#include "coordinator/coordinator.hpp"
#include "evaluators/evaluator.hpp"
#include "filtering/filtering-driver.hpp"
#include "filtering/score-cache.hpp"
#include "refinement/refinement-controller.hpp"

struct SelectionResult {
  AllocationPlan plan;
  FilteringResult filtering;
  RefinementResult refinement;
  CandidateId best_id;
  double best_performance;
  double time_usage;
      /* Charged time, scoring plus training at the profiled rates */
  double wall_time;
  bool found;
  SelectionResult()
      : best_performance(worst_metric()), time_usage(0.0), wall_time(0.0),
        found(false) {}
};

/* Composes coordinate, filter and refine over one evaluator and one
 * candidate pool. The score cache lives as long as this object. */
class ModelSelection {
  MselectConfig config_;
  shared_ptr<Evaluator> evaluator_;
  shared_ptr<RefinementController> controller_;
  shared_ptr<Coordinator> coordinator_;
  shared_ptr<FilteringDriver> filtering_driver_;
  ScoreCache score_cache_;
  Candidates pool_;
  boost::unordered_map<CandidateId, size_t> pool_index_;

 public:
  explicit ModelSelection(const MselectConfig& config);
  ModelSelection(
      const MselectConfig& config, shared_ptr<Evaluator> evaluator);

  AllocationPlan coordinate(
      double budget, double score_time_per_model,
      double train_time_per_epoch, bool only_phase1) const;
  FilteringResult filter(int n, int k, const CancelSignal *cancel = NULL);
  /* Refines candidates given by id, they must be in the pool. With
   * only_phase1 nothing is trained and the best filtering score wins. */
  RefinementResult refine(
      int u, const vector<CandidateId>& ids, bool only_phase1,
      const CancelSignal *cancel = NULL);
  /* Refines the filtering survivors according to the plan */
  RefinementResult refine(
      const AllocationPlan& plan, const ScoredCandidates& top_k,
      const CancelSignal *cancel = NULL);
  SelectionResult select(
      double budget, bool only_phase1, const CancelSignal *cancel = NULL);
  /* Filters and refines a fixed plan without profiling, time_usage
   * stays zero */
  SelectionResult run_workload(
      const AllocationPlan& plan, const CancelSignal *cancel = NULL);
  double profile_filtering();
  double profile_refinement();

  const Candidates& pool() const {
    return pool_;
  }
  const ScoreCache& score_cache() const {
    return score_cache_;
  }
  const MselectConfig& config() const {
    return config_;
  }

 private:
  void init();
  void build_pool();
  const Candidate& probe() const;
  RefinementResult pick_without_training(const Candidates& candidates) const;
};

#endif  // defined __model_selection_hpp__
