#ifndef __live_evaluator_hpp__
#define __live_evaluator_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/atomic.hpp>

#include "evaluators/evaluator.hpp"

/* Drives real scoring and training through external commands.
 * The command templates are boost::format strings:
 *   %1% candidate id, %2% encoding, %3% result file,
 *   %4% trained units, %5% budget units.
 * The score command writes one number to the result file,
 * the train command writes "metric budget_used". */
class LiveEvaluator : public Evaluator {
 public:
  explicit LiveEvaluator(const EvaluatorConfig& config);
  virtual string name() const {
    return EVALUATOR_LIVE;
  }
  virtual bool score(const Candidate& candidate, double *score_ptr);
  virtual bool train_partial(
      const Candidate& candidate, double trained_units, double budget_units,
      TrainResult *result_ptr);
  virtual double profile_score_time(const Candidate& probe);
  virtual double profile_train_time_per_epoch(const Candidate& probe);

 private:
  EvaluatorConfig config_;
  boost::atomic<unsigned long> next_call_;
      /* Numbers result files, sanitized ids may collide */

  string result_file(const string& kind, const CandidateId& id);
  string make_cmd(
      const string& cmd_template, const Candidate& candidate,
      const string& result_file, double trained_units,
      double budget_units) const;
  bool run_cmd(const string& cmd, const string& result_file,
      DoubleVec *values) const;
};

#endif  // defined __live_evaluator_hpp__
