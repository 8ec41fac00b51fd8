#ifndef __uniform_allocation_hpp__
#define __uniform_allocation_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "refinement/refinement-controller.hpp"

/* Baseline: every candidate is trained for U units, optionally in
 * evenly spaced checkpoints, and nobody is eliminated */
class UniformAllocation : public RefinementController {
  int num_checkpoints_;

 public:
  explicit UniformAllocation(const RefinementConfig& config);
  virtual string name() const {
    return POLICY_UNIFORM;
  }

 protected:
  virtual RoundPlans make_round_plans(int k, int u) const;
};

#endif  // defined __uniform_allocation_hpp__
