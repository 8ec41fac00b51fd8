#ifndef __mselect_user_defined_types_hpp__
#define __mselect_user_defined_types_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include <utility>

using std::string;
using std::vector;

typedef string CandidateId;

struct Candidate {
  CandidateId id;
  string encoding;
      /* Opaque to the scheduler, only evaluators look into it */
  Candidate() {}
  explicit Candidate(const CandidateId& id) : id(id) {}
  Candidate(const CandidateId& id, const string& encoding)
      : id(id), encoding(encoding) {}
};
typedef vector<Candidate> Candidates;

struct ScoredCandidate {
  Candidate candidate;
  double score;
      /* Proxy score from the filtering phase */
  double metric;
      /* Latest metric from the refinement phase */
  double budget_used;
  bool failed;
  ScoredCandidate()
      : score(-std::numeric_limits<double>::infinity()),
        metric(-std::numeric_limits<double>::infinity()),
        budget_used(0.0), failed(false) {}
  explicit ScoredCandidate(const Candidate& candidate)
      : candidate(candidate),
        score(-std::numeric_limits<double>::infinity()),
        metric(-std::numeric_limits<double>::infinity()),
        budget_used(0.0), failed(false) {}
  ScoredCandidate(const Candidate& candidate, double score)
      : candidate(candidate), score(score),
        metric(-std::numeric_limits<double>::infinity()),
        budget_used(0.0), failed(false) {}
};
typedef vector<ScoredCandidate> ScoredCandidates;

enum PlanStatus {
  PLAN_OK,
  PLAN_INSUFFICIENT_BUDGET,
};

struct AllocationPlan {
  int n;
      /* Candidates to score in the filtering phase */
  int k;
      /* Survivors promoted into refinement */
  int u;
      /* Budget units per survivor */
  bool filter_only;
  PlanStatus status;
  AllocationPlan() : n(1), k(1), u(1), filter_only(false), status(PLAN_OK) {}
  AllocationPlan(int n, int k, int u)
      : n(n), k(k), u(u), filter_only(false), status(PLAN_OK) {}
};

struct TrainResult {
  double metric;
  double budget_used;
  TrainResult()
      : metric(-std::numeric_limits<double>::infinity()), budget_used(0.0) {}
  TrainResult(double metric, double budget_used)
      : metric(metric), budget_used(budget_used) {}
};

#define PHASE_FILTERING   "filtering"
#define PHASE_REFINEMENT  "refinement"

struct EvaluationFailure {
  CandidateId candidate_id;
  string phase;
  int round;
  string message;
  EvaluationFailure() : round(-1) {}
  EvaluationFailure(
      const CandidateId& candidate_id, const string& phase, int round,
      const string& message)
        : candidate_id(candidate_id), phase(phase), round(round),
          message(message) {}
};
typedef vector<EvaluationFailure> EvaluationFailures;

typedef std::pair<double, CandidateId> TraceEntry;
    /* (score, candidate_id) */
typedef vector<TraceEntry> ExplorationTrace;

#endif  // defined __mselect_user_defined_types_hpp__
