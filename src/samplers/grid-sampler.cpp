/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <vector>

#include "samplers/candidate-pool.hpp"
#include "grid-sampler.hpp"

GridSampler::GridSampler(
    const Candidates& pool, bool shuffle, unsigned int seed)
    : pool_(pool), shuffle_(shuffle) {
  reset(seed);
}

void GridSampler::reset(unsigned int seed) {
  boost::random::mt19937 rng(seed);
  make_order(pool_.size(), shuffle_, &rng, &order_);
  current_choice_idx_ = 0;
}

bool GridSampler::next(Candidate *candidate_ptr) {
  CHECK(candidate_ptr);
  if (current_choice_idx_ >= order_.size()) {
    return false;
  }
  *candidate_ptr = pool_[order_[current_choice_idx_]];
  current_choice_idx_++;
  return true;
}
