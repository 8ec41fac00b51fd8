/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <exception>

#include <boost/bind.hpp>
#include <boost/format.hpp>

#include "common/internal-config.hpp"
#include "common/mselect-errors.hpp"

#include "refinement/refinement-controller.hpp"
#include "refinement/refinement-controllers/successive-halving.hpp"
#include "refinement/refinement-controllers/successive-rejection.hpp"
#include "refinement/refinement-controllers/uniform-allocation.hpp"

static bool metric_order(const ScoredCandidate& a, const ScoredCandidate& b) {
  if (a.metric != b.metric) {
    return a.metric > b.metric;
  }
  return a.candidate.id < b.candidate.id;
}

void rank_by_metric(ScoredCandidates *candidates) {
  CHECK(candidates);
  std::sort(candidates->begin(), candidates->end(), metric_order);
}

RefinementController::RefinementController(const RefinementConfig& config)
    : config_(config) {
  if (config_.num_workers < 1) {
    throw ConfigError("refinement.num_workers must be at least 1");
  }
}

RoundPlans RefinementController::round_plans(int k, int u) const {
  if (k < 1) {
    throw ConfigError((boost::format(
        "refinement needs at least one candidate, got k = %1%") % k).str());
  }
  if (u < 1) {
    throw ConfigError((boost::format(
        "refinement needs u >= 1, got u = %1%") % u).str());
  }
  RoundPlans plans;
  if (k == 1) {
    plans.push_back(RoundPlan(u, 1, 0));
    return plans;
  }
  plans = make_round_plans(k, u);
  CHECK(!plans.empty());
  CHECK_EQ(plans.back().cumulative_budget, u);
  for (size_t r = 1; r < plans.size(); r++) {
    CHECK_GE(plans[r].cumulative_budget, plans[r - 1].cumulative_budget);
  }
  return plans;
}

long long RefinementController::predicted_cost(int k, int u) const {
  RoundPlans plans = round_plans(k, u);
  long long cost = 0;
  int trained = 0;
  for (size_t r = 0; r < plans.size(); r++) {
    cost += static_cast<long long>(plans[r].num_active) *
        (plans[r].cumulative_budget - trained);
    trained = plans[r].cumulative_budget;
  }
  return cost;
}

int RefinementController::survivors_after_round(
    const RoundPlan& round_plan, int num_entering) const {
  return std::max(1, num_entering - round_plan.num_to_eliminate);
}

RefinementResult RefinementController::refine(
    const Candidates& candidates, int u, Evaluator *evaluator,
    const CancelSignal *cancel) {
  if (candidates.empty()) {
    throw ConfigError("refinement needs a non-empty candidate list");
  }
  boost::unordered_set<CandidateId> ids;
  for (size_t i = 0; i < candidates.size(); i++) {
    if (!ids.insert(candidates[i].id).second) {
      throw ConfigError("duplicate candidate id " + candidates[i].id);
    }
  }
  CHECK(evaluator);
  int k = candidates.size();
  RoundPlans plans = round_plans(k, u);

  tbb::tick_count refine_start_tick = tbb::tick_count::now();
  RefinementResult result;
  RoundDispatcher dispatcher(config_.num_workers);
  ScoredCandidates active;
  for (size_t i = 0; i < candidates.size(); i++) {
    active.push_back(ScoredCandidate(candidates[i]));
  }
  int trained = 0;
  for (size_t r = 0; r < plans.size(); r++) {
    if (is_cancelled(cancel)) {
      LOG(INFO) << name() << " cancelled before round " << r;
      result.cancelled = true;
      break;
    }
    const RoundPlan& plan = plans[r];
    int increment = plan.cumulative_budget - trained;
    CHECK_GE(increment, 0);
    RoundRecord record;
    record.round = r;
    record.num_entering = active.size();
    record.increment = increment;

    if (increment > 0) {
      TrainOutcomes outcomes(active.size());
      dispatcher.run(active.size(), boost::bind(
          &RefinementController::train_one, this,
          &active, &outcomes, evaluator,
          static_cast<double>(trained), static_cast<double>(increment), _1));
      ScoredCandidates survivors;
      for (size_t i = 0; i < active.size(); i++) {
        ScoredCandidate& candidate = active[i];
        const TrainOutcome& outcome = outcomes[i];
        result.budget_consumed += outcome.result.budget_used;
        candidate.budget_used += outcome.result.budget_used;
        if (!outcome.ok) {
          candidate.metric = worst_metric();
          candidate.failed = true;
          result.failures.push_back(EvaluationFailure(
              candidate.candidate.id, PHASE_REFINEMENT, r, outcome.message));
          LOG(WARNING) << "Training " << candidate.candidate.id
                       << " failed in round " << r
                       << ": " << outcome.message;
          continue;
        }
        candidate.metric = outcome.result.metric;
        survivors.push_back(candidate);
      }
      active.swap(survivors);
    }
    trained = plan.cumulative_budget;

    rank_by_metric(&active);
    int num_survivors = std::min<int>(
        active.size(), survivors_after_round(plan, record.num_entering));
    active.resize(num_survivors);
    for (size_t i = 0; i < active.size(); i++) {
      record.survivor_ids.push_back(active[i].candidate.id);
    }
    result.rounds.push_back(record);
    if (!active.empty()) {
      result.best = active[0];
      result.best_metric = active[0].metric;
      result.found = true;
    } else {
      result.found = false;
      result.best = ScoredCandidate();
      result.best_metric = worst_metric();
    }
    LOG(INFO) << name() << " round " << r << ": " << record.num_entering
              << " trained +" << increment << " units, "
              << active.size() << " survive";
    if (active.size() <= 1) {
      break;
    }
  }

  double refine_time = (tbb::tick_count::now() - refine_start_tick).seconds();
  LOG(INFO) << name() << " refined " << k << " candidates with u = " << u
            << ", consumed " << result.budget_consumed
            << " units in " << refine_time << " s";
  if (result.found) {
    LOG(INFO) << "Best candidate " << result.best.candidate.id
              << " metric " << result.best_metric;
  } else {
    LOG(WARNING) << "Every candidate failed in refinement";
  }
  return result;
}

void RefinementController::train_one(
    const ScoredCandidates *active, TrainOutcomes *outcomes,
    Evaluator *evaluator, double trained_units, double budget_units,
    size_t idx) {
  const Candidate& candidate = (*active)[idx].candidate;
  TrainOutcome& outcome = (*outcomes)[idx];
  try {
    outcome.ok = evaluator->train_partial(
        candidate, trained_units, budget_units, &outcome.result);
    if (!outcome.ok) {
      outcome.message = evaluator->name() + " evaluator could not train it";
    }
  } catch (const std::exception& e) {
    outcome.ok = false;
    outcome.result = TrainResult();
    outcome.message = e.what();
  }
}

shared_ptr<RefinementController> make_refinement_controller(
    const RefinementConfig& config) {
  if (config.policy == POLICY_SH) {
    return make_shared<SuccessiveHalving>(config);
  }
  if (config.policy == POLICY_SR) {
    return make_shared<SuccessiveRejection>(config);
  }
  if (config.policy == POLICY_UNIFORM) {
    return make_shared<UniformAllocation>(config);
  }
  throw ConfigError("unknown refinement policy " + config.policy);
}
