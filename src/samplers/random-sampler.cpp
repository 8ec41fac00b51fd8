/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <vector>

#include <boost/random/uniform_int_distribution.hpp>

#include "samplers/candidate-pool.hpp"
#include "random-sampler.hpp"

RandomSampler::RandomSampler(
    const Candidates& pool, unsigned int seed, bool with_replacement)
    : pool_(pool), with_replacement_(with_replacement) {
  reset(seed);
}

void RandomSampler::reset(unsigned int seed) {
  rng_.seed(seed);
  next_idx_ = 0;
  if (!with_replacement_) {
    make_order(pool_.size(), true, &rng_, &order_);
  }
}

bool RandomSampler::next(Candidate *candidate_ptr) {
  CHECK(candidate_ptr);
  if (pool_.empty()) {
    return false;
  }
  if (with_replacement_) {
    boost::random::uniform_int_distribution<size_t> dist(0, pool_.size() - 1);
    *candidate_ptr = pool_[dist(rng_)];
    return true;
  }
  if (next_idx_ >= order_.size()) {
    return false;
  }
  *candidate_ptr = pool_[order_[next_idx_++]];
  return true;
}
