/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>

#include <boost/format.hpp>

#include "common/mselect-errors.hpp"
#include "successive-halving.hpp"

SuccessiveHalving::SuccessiveHalving(const RefinementConfig& config)
    : RefinementController(config), eta_(config.eta) {
  if (eta_ < 2) {
    throw ConfigError((boost::format(
        "successive halving needs eta >= 2, got %1%") % eta_).str());
  }
}

RoundPlans SuccessiveHalving::make_round_plans(int k, int u) const {
  int num_rounds = ceil_log(k, eta_);
  RoundPlans plans;
  int num_active = k;
  for (int r = 0; r < num_rounds; r++) {
    long long divisor = int_pow(eta_, num_rounds - 1 - r);
    int cumulative_budget = static_cast<int>((u + divisor - 1) / divisor);
    int num_survivors = std::max(1, ceil_div(num_active, eta_));
    plans.push_back(RoundPlan(
        cumulative_budget, num_active, num_active - num_survivors));
    num_active = num_survivors;
  }
  return plans;
}

int SuccessiveHalving::survivors_after_round(
    const RoundPlan& round_plan, int num_entering) const {
  return std::max(1, ceil_div(num_entering, eta_));
}
