#ifndef __filtering_driver_hpp__
#define __filtering_driver_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "common/common-utils.hpp"
#include "common/cancel-signal.hpp"
#include "common/round-dispatcher.hpp"
#include "evaluators/evaluator.hpp"
#include "samplers/candidate-sampler.hpp"
#include "filtering/score-cache.hpp"

struct FilteringResult {
  ScoredCandidates top_k;
      /* Ranked by descending score, ties by ascending id */
  ExplorationTrace trace;
      /* In draw order, failed candidates carry -inf */
  int num_scored;
  int num_cache_hits;
  EvaluationFailures failures;
  bool sampler_exhausted;
  bool cancelled;
  FilteringResult()
      : num_scored(0), num_cache_hits(0),
        sampler_exhausted(false), cancelled(false) {}
};

class FilteringDriver {
  struct ScoreOutcome {
    double score;
    bool ok;
    bool cache_hit;
    string message;
    ScoreOutcome() : score(worst_metric()), ok(false), cache_hit(false) {}
  };
  typedef vector<ScoreOutcome> ScoreOutcomes;

  FilteringConfig config_;

 public:
  explicit FilteringDriver(const FilteringConfig& config);
  /* Scores up to n distinct candidates drawn from the sampler and keeps
   * the best k. The cache may be NULL, then a private one is used.
   * Throws ConfigError unless n >= k >= 1. */
  FilteringResult filter(
      int n, int k, CandidateSampler *sampler, Evaluator *evaluator,
      ScoreCache *cache, const CancelSignal *cancel);

 private:
  bool draw_batch(
      size_t batch_size, CandidateSampler *sampler,
      boost::unordered_set<CandidateId> *seen, int *duplicate_run,
      Candidates *batch);
  void score_one(
      const Candidates *batch, ScoreOutcomes *outcomes,
      Evaluator *evaluator, ScoreCache *cache, size_t idx);
};

/* Sorts by descending score, ties by ascending id */
void rank_by_score(ScoredCandidates *candidates);

/* running_best[m] is the best score among the first m + 1 entries */
DoubleVec trace_running_best(const ExplorationTrace& trace);

#endif  // defined __filtering_driver_hpp__
