#ifndef __budget_sweep_hpp__
#define __budget_sweep_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "common/common-utils.hpp"
#include "common/cancel-signal.hpp"
#include "evaluators/simulated-evaluator.hpp"

struct SweepCurve {
  vector<DoubleVec> time_used;
  vector<DoubleVec> acc_reached;
      /* One row per repetition, one column per budget */
};
typedef std::map<string, SweepCurve> SweepResults;

/* Characterizes the accuracy-vs-time curve of the refinement policies:
 * for every repetition a fresh random pool is refined under a sweep of
 * budgets, from the least that affords u = 1 to full training. */
class BudgetSweep {
  MselectConfig config_;
  shared_ptr<SimulatedEvaluator> evaluator_;

 public:
  BudgetSweep(
      const MselectConfig& config, shared_ptr<SimulatedEvaluator> evaluator);

  SweepResults run(const CancelSignal *cancel = NULL);
  SweepCurve run_policy(
      const string& policy, const vector<Candidates>& pools,
      const CancelSignal *cancel);
  vector<Candidates> sample_pools() const;
  vector<string> policies() const;

  void write_results(const SweepResults& results, std::ostream& out) const;
  void write_results_file(
      const SweepResults& results, const string& path) const;
};

#endif  // defined __budget_sweep_hpp__
