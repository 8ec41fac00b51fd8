#ifndef __successive_halving_hpp__
#define __successive_halving_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "refinement/refinement-controller.hpp"

/* ceil(log_eta K) rounds, the cumulative budget per survivor grows by
 * eta each round and reaches U in the last one. After every round the
 * best ceil(active / eta) candidates survive. */
class SuccessiveHalving : public RefinementController {
  int eta_;

 public:
  explicit SuccessiveHalving(const RefinementConfig& config);
  virtual string name() const {
    return POLICY_SH;
  }
  int eta() const {
    return eta_;
  }

 protected:
  virtual RoundPlans make_round_plans(int k, int u) const;
  virtual int survivors_after_round(
      const RoundPlan& round_plan, int num_entering) const;
};

#endif  // defined __successive_halving_hpp__
