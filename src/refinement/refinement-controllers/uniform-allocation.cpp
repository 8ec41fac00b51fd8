/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/format.hpp>

#include "common/mselect-errors.hpp"
#include "uniform-allocation.hpp"

UniformAllocation::UniformAllocation(const RefinementConfig& config)
    : RefinementController(config),
      num_checkpoints_(config.uniform_checkpoints) {
  if (num_checkpoints_ < 1) {
    throw ConfigError((boost::format(
        "uniform allocation needs at least one checkpoint, got %1%")
        % num_checkpoints_).str());
  }
}

RoundPlans UniformAllocation::make_round_plans(int k, int u) const {
  RoundPlans plans;
  for (int r = 0; r < num_checkpoints_; r++) {
    long long scaled = static_cast<long long>(u) * (r + 1);
    int cumulative_budget = static_cast<int>(
        (scaled + num_checkpoints_ - 1) / num_checkpoints_);
    plans.push_back(RoundPlan(cumulative_budget, k, 0));
  }
  return plans;
}
