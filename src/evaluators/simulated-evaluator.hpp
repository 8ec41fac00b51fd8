#ifndef __simulated_evaluator_hpp__
#define __simulated_evaluator_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <istream>

#include "evaluators/evaluator.hpp"

/* Looks up precomputed proxy scores and per-epoch accuracies,
 * used for reproducible benchmarking. Read-only once loaded. */
class SimulatedEvaluator : public Evaluator {
  struct GroundTruth {
    Candidate candidate;
    double score;
    bool has_score;
    DoubleVec accuracies;
        /* accuracies[e] is the accuracy after e + 1 epochs */
    bool diverged;
    GroundTruth() : score(0.0), has_score(false), diverged(false) {}
  };
  typedef boost::unordered_map<CandidateId, GroundTruth> GroundTruthMap;

 public:
  SimulatedEvaluator(double score_time_per_model, double train_time_per_epoch);
  virtual string name() const {
    return EVALUATOR_SIMULATED;
  }
  virtual bool score(const Candidate& candidate, double *score_ptr);
  virtual bool train_partial(
      const Candidate& candidate, double trained_units, double budget_units,
      TrainResult *result_ptr);
  virtual double profile_score_time(const Candidate& probe) {
    return score_time_per_model_;
  }
  virtual double profile_train_time_per_epoch(const Candidate& probe) {
    return train_time_per_epoch_;
  }
  virtual bool list_candidates(Candidates *pool_ptr) const {
    CHECK(pool_ptr);
    *pool_ptr = candidates_;
    return true;
  }

  void load(std::istream& in);
  void load_file(const string& path);
  void add_model(
      const Candidate& candidate, double score, const DoubleVec& accuracies,
      bool diverged);
  void add_unscored_model(
      const Candidate& candidate, const DoubleVec& accuracies);
  const Candidates& candidates() const {
    return candidates_;
  }
  bool final_accuracy(const CandidateId& id, double *accuracy_ptr) const;

 private:
  double score_time_per_model_;
  double train_time_per_epoch_;
  GroundTruthMap ground_truth_map_;
  Candidates candidates_;
      /* In load order */

  void insert(const GroundTruth& ground_truth);
};

#endif  // defined __simulated_evaluator_hpp__
