/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>
#include <exception>

#include <boost/bind.hpp>
#include <boost/format.hpp>

#include "common/mselect-errors.hpp"
#include "filtering-driver.hpp"

static bool score_order(const ScoredCandidate& a, const ScoredCandidate& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return a.candidate.id < b.candidate.id;
}

void rank_by_score(ScoredCandidates *candidates) {
  CHECK(candidates);
  std::sort(candidates->begin(), candidates->end(), score_order);
}

DoubleVec trace_running_best(const ExplorationTrace& trace) {
  DoubleVec running_best(trace.size());
  double best = worst_metric();
  for (size_t i = 0; i < trace.size(); i++) {
    best = std::max(best, trace[i].first);
    running_best[i] = best;
  }
  return running_best;
}

FilteringDriver::FilteringDriver(const FilteringConfig& config)
    : config_(config) {
  if (config_.num_workers < 1) {
    throw ConfigError("filtering.num_workers must be at least 1");
  }
  if (config_.max_duplicate_draws < 1) {
    throw ConfigError("filtering.max_duplicate_draws must be at least 1");
  }
}

FilteringResult FilteringDriver::filter(
    int n, int k, CandidateSampler *sampler, Evaluator *evaluator,
    ScoreCache *cache, const CancelSignal *cancel) {
  if (k < 1 || n < k) {
    throw ConfigError((boost::format(
        "filtering needs n >= k >= 1, got n = %1%, k = %2%") % n % k).str());
  }
  CHECK(sampler);
  CHECK(evaluator);
  ScoreCache private_cache;
  if (cache == NULL) {
    cache = &private_cache;
  }

  FilteringResult result;
  RoundDispatcher dispatcher(config_.num_workers);
  boost::unordered_set<CandidateId> seen;
  ScoredCandidates scored;
  int duplicate_run = 0;
  int batch_idx = 0;
  while (static_cast<int>(seen.size()) < n) {
    if (is_cancelled(cancel)) {
      result.cancelled = true;
      break;
    }
    size_t batch_size = std::min<size_t>(
        config_.num_workers, n - seen.size());
    Candidates batch;
    bool exhausted =
        !draw_batch(batch_size, sampler, &seen, &duplicate_run, &batch);
    if (exhausted) {
      result.sampler_exhausted = true;
    }
    if (batch.empty()) {
      break;
    }

    ScoreOutcomes outcomes(batch.size());
    dispatcher.run(batch.size(), boost::bind(
        &FilteringDriver::score_one, this,
        &batch, &outcomes, evaluator, cache, _1));

    /* Batch results are folded in draw order */
    for (size_t i = 0; i < batch.size(); i++) {
      const ScoreOutcome& outcome = outcomes[i];
      result.num_scored++;
      if (outcome.cache_hit) {
        result.num_cache_hits++;
      }
      if (outcome.ok) {
        result.trace.push_back(TraceEntry(outcome.score, batch[i].id));
        scored.push_back(ScoredCandidate(batch[i], outcome.score));
      } else {
        result.trace.push_back(TraceEntry(worst_metric(), batch[i].id));
        result.failures.push_back(EvaluationFailure(
            batch[i].id, PHASE_FILTERING, batch_idx, outcome.message));
        LOG(WARNING) << "Scoring " << batch[i].id
                     << " failed: " << outcome.message;
      }
    }
    batch_idx++;
    if (exhausted) {
      break;
    }
  }

  rank_by_score(&scored);
  if (static_cast<int>(scored.size()) > k) {
    scored.resize(k);
  }
  result.top_k = scored;

  if (result.sampler_exhausted) {
    LOG(WARNING) << "Sampler exhausted after " << result.num_scored
                 << " of " << n << " candidates";
  }
  LOG(INFO) << "Filtering scored " << result.num_scored
            << " candidates (" << result.num_cache_hits << " cache hits, "
            << result.failures.size() << " failures), kept "
            << result.top_k.size() << " of " << k;
  return result;
}

bool FilteringDriver::draw_batch(
    size_t batch_size, CandidateSampler *sampler,
    boost::unordered_set<CandidateId> *seen, int *duplicate_run,
    Candidates *batch) {
  while (batch->size() < batch_size) {
    Candidate candidate;
    if (!sampler->next(&candidate)) {
      return false;
    }
    if (seen->count(candidate.id)) {
      (*duplicate_run)++;
      if (*duplicate_run >= config_.max_duplicate_draws) {
        return false;
      }
      continue;
    }
    *duplicate_run = 0;
    seen->insert(candidate.id);
    batch->push_back(candidate);
  }
  return true;
}

void FilteringDriver::score_one(
    const Candidates *batch, ScoreOutcomes *outcomes,
    Evaluator *evaluator, ScoreCache *cache, size_t idx) {
  const Candidate& candidate = (*batch)[idx];
  ScoreOutcome& outcome = (*outcomes)[idx];
  CachedScore cached;
  if (cache->lookup(candidate.id, &cached)) {
    outcome.cache_hit = true;
    outcome.score = cached.score;
    outcome.ok = cached.ok;
    if (!outcome.ok) {
      outcome.message = "cached scoring failure";
    }
    return;
  }

  try {
    double score = worst_metric();
    outcome.ok = evaluator->score(candidate, &score);
    if (outcome.ok) {
      outcome.score = score;
    } else {
      outcome.message = evaluator->name() + " evaluator could not score it";
    }
  } catch (const std::exception& e) {
    outcome.ok = false;
    outcome.message = e.what();
  }

  if (!cache->insert_if_absent(
        candidate.id, CachedScore(outcome.score, outcome.ok))) {
    /* Another run scored it concurrently, keep the first entry */
    CHECK(cache->lookup(candidate.id, &cached));
    outcome.score = cached.score;
    outcome.ok = cached.ok;
    if (!outcome.ok && outcome.message.empty()) {
      outcome.message = "cached scoring failure";
    }
  }
}
