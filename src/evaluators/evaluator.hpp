#ifndef __evaluator_hpp__
#define __evaluator_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "common/common-utils.hpp"

/* Scores and trains candidates on behalf of the scheduler.
 * score() and train_partial() may be called concurrently for
 * different candidates of the same round. */
class Evaluator {
 public:
  virtual ~Evaluator() {}
  virtual string name() const = 0;
  /* Returns false if the candidate cannot be scored */
  virtual bool score(const Candidate& candidate, double *score_ptr) = 0;
  /* Continues training a candidate that already received trained_units
   * for budget_units more. Returns false on failure, e.g. divergence. */
  virtual bool train_partial(
      const Candidate& candidate, double trained_units, double budget_units,
      TrainResult *result_ptr) = 0;
  virtual double profile_score_time(const Candidate& probe) = 0;
  virtual double profile_train_time_per_epoch(const Candidate& probe) = 0;
  /* The candidates this evaluator knows about, if it has a fixed pool */
  virtual bool list_candidates(Candidates *pool_ptr) const {
    return false;
  }
};

shared_ptr<Evaluator> make_evaluator(const EvaluatorConfig& config);

#endif  // defined __evaluator_hpp__
