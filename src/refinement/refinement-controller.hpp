#ifndef __refinement_controller_hpp__
#define __refinement_controller_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <vector>
#include <string>

#include <boost/shared_ptr.hpp>

#include <tbb/tick_count.h>

#include <glog/logging.h>

#include "common/common-utils.hpp"
#include "common/cancel-signal.hpp"
#include "common/round-dispatcher.hpp"
#include "evaluators/evaluator.hpp"

struct RoundPlan {
  int cumulative_budget;
      /* Budget units every survivor has received after this round */
  int num_active;
      /* Candidates entering the round when nothing fails */
  int num_to_eliminate;
  RoundPlan() : cumulative_budget(0), num_active(0), num_to_eliminate(0) {}
  RoundPlan(int cumulative_budget, int num_active, int num_to_eliminate)
      : cumulative_budget(cumulative_budget), num_active(num_active),
        num_to_eliminate(num_to_eliminate) {}
};
typedef vector<RoundPlan> RoundPlans;

/* Diagnostics only */
struct RoundRecord {
  int round;
  int num_entering;
  int increment;
  vector<CandidateId> survivor_ids;
  RoundRecord() : round(0), num_entering(0), increment(0) {}
};
typedef vector<RoundRecord> RoundRecords;

struct RefinementResult {
  ScoredCandidate best;
  double best_metric;
  double budget_consumed;
  RoundRecords rounds;
  EvaluationFailures failures;
  bool cancelled;
  bool found;
      /* False when every candidate failed */
  RefinementResult()
      : best_metric(worst_metric()), budget_consumed(0.0),
        cancelled(false), found(false) {}
};

class RefinementController {
 protected:
  struct TrainOutcome {
    bool ok;
    TrainResult result;
    string message;
    TrainOutcome() : ok(false) {}
  };
  typedef vector<TrainOutcome> TrainOutcomes;

  RefinementConfig config_;

 public:
  explicit RefinementController(const RefinementConfig& config);
  virtual ~RefinementController() {}

  virtual string name() const = 0;

  /* The round structure for k candidates and u budget units each,
   * assuming no candidate fails. The last round ends at u. */
  RoundPlans round_plans(int k, int u) const;

  /* Budget units the round plans of (k, u) consume in total */
  long long predicted_cost(int k, int u) const;

  /* Trains the candidates round by round and returns the best one.
   * Throws ConfigError on an empty candidate list, duplicate ids
   * or u < 1. Evaluation failures are folded into the result. */
  RefinementResult refine(
      const Candidates& candidates, int u, Evaluator *evaluator,
      const CancelSignal *cancel);

 protected:
  /* Only called with k >= 2 */
  virtual RoundPlans make_round_plans(int k, int u) const = 0;
  /* How many of the num_entering candidates of a round survive it */
  virtual int survivors_after_round(
      const RoundPlan& round_plan, int num_entering) const;

 private:
  void train_one(
      const ScoredCandidates *active, TrainOutcomes *outcomes,
      Evaluator *evaluator, double trained_units, double budget_units,
      size_t idx);
};

/* Sorts by descending metric, ties by ascending id */
void rank_by_metric(ScoredCandidates *candidates);

shared_ptr<RefinementController> make_refinement_controller(
    const RefinementConfig& config);

#endif  // defined __refinement_controller_hpp__
