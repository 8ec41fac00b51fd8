/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <cmath>

#include <boost/format.hpp>

#include "common/mselect-errors.hpp"
#include "coordinator.hpp"

/* floor(x) capped at ceiling, compared in double before the cast */
static long long capped_floor(double x, int ceiling) {
  if (x >= ceiling) {
    return ceiling;
  }
  return safe_floor(x);
}

void validate_plan(const AllocationPlan& plan) {
  if (plan.k < 1) {
    throw ConfigError((boost::format(
        "plan needs k >= 1, got k = %1%") % plan.k).str());
  }
  if (plan.k > plan.n) {
    throw ConfigError((boost::format(
        "plan needs k <= n, got n = %1%, k = %2%") % plan.n % plan.k).str());
  }
  if (plan.u < 1) {
    throw ConfigError((boost::format(
        "plan needs u >= 1, got u = %1%") % plan.u).str());
  }
}

Coordinator::Coordinator(
    const CoordinatorConfig& config,
    shared_ptr<RefinementController> controller)
      : config_(config), controller_(controller) {
  CHECK(controller_);
  if (config_.tie_break != TIE_BREAK_DEEPER_TRAINING &&
      config_.tie_break != TIE_BREAK_MORE_SURVIVORS) {
    throw ConfigError("unknown tie break policy " + config_.tie_break);
  }
  if (config_.min_u < 1 || config_.max_u < config_.min_u) {
    throw ConfigError((boost::format(
        "coordinator needs 1 <= min_u <= max_u, got %1% and %2%")
        % config_.min_u % config_.max_u).str());
  }
  if (config_.max_k < 1 || config_.max_n < 1) {
    throw ConfigError("coordinator needs max_k >= 1 and max_n >= 1");
  }
  if (config_.n_k_ratio < 1.0) {
    throw ConfigError("coordinator needs n_k_ratio >= 1");
  }
}

int Coordinator::n_ceiling() const {
  if (config_.search_space_size > 0) {
    return config_.search_space_size;
  }
  return config_.max_n;
}

int Coordinator::max_u_for_budget(
    int k, double refine_budget, double train_time_per_epoch) const {
  CHECK_GE(k, 1);
  CHECK_GT(train_time_per_epoch, 0.0);
  double limit = refine_budget + BUDGET_SLACK;
  if (controller_->predicted_cost(k, config_.min_u) * train_time_per_epoch
      > limit) {
    return 0;
  }
  /* The predicted cost never decreases with U */
  int lo = config_.min_u;
  int hi = config_.max_u;
  while (lo < hi) {
    int mid = lo + (hi - lo + 1) / 2;
    if (controller_->predicted_cost(k, mid) * train_time_per_epoch <= limit) {
      lo = mid;
    } else {
      hi = mid - 1;
    }
  }
  return lo;
}

bool Coordinator::better_plan(
    const AllocationPlan& a, const AllocationPlan& b) const {
  if (config_.tie_break == TIE_BREAK_MORE_SURVIVORS) {
    if (a.k != b.k) {
      return a.k > b.k;
    }
    if (a.u != b.u) {
      return a.u > b.u;
    }
    return a.n > b.n;
  }
  if (a.u != b.u) {
    return a.u > b.u;
  }
  if (a.k != b.k) {
    return a.k > b.k;
  }
  return a.n > b.n;
}

AllocationPlan Coordinator::coordinate(
    double total_budget, double score_time_per_candidate,
    double train_time_per_epoch, bool filter_only) const {
  if (!(total_budget > 0.0)) {
    throw ConfigError((boost::format(
        "budget must be positive, got %1%") % total_budget).str());
  }
  if (!(score_time_per_candidate >= 0.0)) {
    throw ConfigError((boost::format(
        "score time must be non-negative, got %1%")
        % score_time_per_candidate).str());
  }
  if (!filter_only && !(train_time_per_epoch > 0.0)) {
    throw ConfigError((boost::format(
        "train time per epoch must be positive, got %1%")
        % train_time_per_epoch).str());
  }

  int ceiling = n_ceiling();
  double t_score = score_time_per_candidate;
  if (filter_only) {
    long long n = ceiling;
    if (t_score > 0.0) {
      n = capped_floor(total_budget / t_score, ceiling);
    }
    AllocationPlan plan(std::max<long long>(n, 1), 1, config_.min_u);
    plan.filter_only = true;
    if (n < 1) {
      plan.status = PLAN_INSUFFICIENT_BUDGET;
      LOG(WARNING) << "Budget " << total_budget
                   << " cannot score a single candidate";
    }
    LOG(INFO) << "Filter-only plan: n = " << plan.n;
    return plan;
  }

  bool found = false;
  AllocationPlan best_plan;
  int k_limit = std::min(config_.max_k, ceiling);
  for (int k = 1; k <= k_limit; k++) {
    /* Filtering keeps at least n_k_ratio candidates per survivor */
    double ratio_n = std::ceil(k * config_.n_k_ratio - FLOOR_SLACK);
    int n_min = ceiling;
    if (ratio_n < ceiling) {
      n_min = std::max(k, static_cast<int>(ratio_n));
    }
    double refine_budget = total_budget - n_min * t_score;
    if (refine_budget <= 0.0) {
      continue;
    }
    int u = max_u_for_budget(k, refine_budget, train_time_per_epoch);
    if (u == 0) {
      continue;
    }
    double refine_cost =
        controller_->predicted_cost(k, u) * train_time_per_epoch;
    long long n = ceiling;
    if (t_score > 0.0) {
      n = capped_floor((total_budget - refine_cost) / t_score, ceiling);
    }
    n = std::max<long long>(n, n_min);
    AllocationPlan plan(n, k, u);
    if (!found || better_plan(plan, best_plan)) {
      best_plan = plan;
      found = true;
    }
  }

  if (!found) {
    AllocationPlan plan(1, 1, config_.min_u);
    plan.status = PLAN_INSUFFICIENT_BUDGET;
    LOG(WARNING) << "Budget " << total_budget
                 << " fits no plan, falling back to n = 1, k = 1, u = "
                 << plan.u;
    return plan;
  }
  validate_plan(best_plan);
  LOG(INFO) << "Plan for budget " << total_budget << " with "
            << controller_->name() << ": n = " << best_plan.n
            << ", k = " << best_plan.k << ", u = " << best_plan.u;
  return best_plan;
}
