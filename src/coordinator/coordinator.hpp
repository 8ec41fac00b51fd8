#ifndef __coordinator_hpp__
#define __coordinator_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/shared_ptr.hpp>

#include "common/common-utils.hpp"
#include "refinement/refinement-controller.hpp"

/* Turns a wall-clock budget into an allocation plan (N, K, U), using the
 * refinement policy's own cost model for the refinement phase */
class Coordinator {
  CoordinatorConfig config_;
  shared_ptr<RefinementController> controller_;

 public:
  Coordinator(
      const CoordinatorConfig& config,
      shared_ptr<RefinementController> controller);

  /* Throws ConfigError on illegal inputs. A budget too small for any
   * plan yields (1, 1, min_u) flagged PLAN_INSUFFICIENT_BUDGET. */
  AllocationPlan coordinate(
      double total_budget, double score_time_per_candidate,
      double train_time_per_epoch, bool filter_only) const;

  /* Largest U in [min_u, max_u] whose refinement of k candidates fits in
   * refine_budget, 0 if not even min_u fits */
  int max_u_for_budget(
      int k, double refine_budget, double train_time_per_epoch) const;

  /* Upper bound on N */
  int n_ceiling() const;

  const CoordinatorConfig& config() const {
    return config_;
  }

 private:
  bool better_plan(const AllocationPlan& a, const AllocationPlan& b) const;
};

/* Throws ConfigError unless n >= k >= 1 and u >= 1 */
void validate_plan(const AllocationPlan& plan);

#endif  // defined __coordinator_hpp__
