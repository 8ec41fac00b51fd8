/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <cmath>

#include "successive-rejection.hpp"

double sr_log_bar(int k) {
  double log_bar = 0.5;
  for (int i = 2; i <= k; i++) {
    log_bar += 1.0 / i;
  }
  return log_bar;
}

RoundPlans SuccessiveRejection::make_round_plans(int k, int u) const {
  double log_bar = sr_log_bar(k);
  double total_budget = static_cast<double>(k) * u - k;
  RoundPlans plans;
  int prev_budget = 0;
  for (int j = 1; j < k; j++) {
    int num_active = k + 1 - j;
    double share = total_budget / (log_bar * num_active);
    /* Capped at u in double, the share may not fit an int */
    int n_j = u;
    if (share < u) {
      n_j = static_cast<int>(std::ceil(share - FLOOR_SLACK));
    }
    n_j = std::max(n_j, std::max(1, prev_budget));
    n_j = std::min(n_j, u);
    if (j == k - 1) {
      /* The last round absorbs the rounding surplus */
      n_j = u;
    }
    plans.push_back(RoundPlan(n_j, num_active, 1));
    prev_budget = n_j;
  }
  return plans;
}
