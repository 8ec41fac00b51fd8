#ifndef __successive_rejection_hpp__
#define __successive_rejection_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "refinement/refinement-controller.hpp"

/* K - 1 rounds, each rejecting exactly one candidate. The per-round
 * budgets follow the closed form of Audibert et al. and are fixed before
 * anything is trained, only the choice of whom to reject is online. */
class SuccessiveRejection : public RefinementController {
 public:
  explicit SuccessiveRejection(const RefinementConfig& config)
      : RefinementController(config) {}
  virtual string name() const {
    return POLICY_SR;
  }

 protected:
  virtual RoundPlans make_round_plans(int k, int u) const;
};

/* 1/2 + sum_{i = 2..k} 1/i */
double sr_log_bar(int k);

#endif  // defined __successive_rejection_hpp__
