#ifndef __grid_sampler_hpp__
#define __grid_sampler_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/random/mersenne_twister.hpp>

#include "samplers/candidate-sampler.hpp"

/* Walks the pool once, in pool order or in a seeded shuffled order */
class GridSampler : public CandidateSampler {
 public:
  GridSampler(const Candidates& pool, bool shuffle, unsigned int seed);
  virtual bool next(Candidate *candidate_ptr);
  virtual void reset(unsigned int seed);
  virtual size_t size() const {
    return pool_.size();
  }

 private:
  Candidates pool_;
  bool shuffle_;
  vector<size_t> order_;
  size_t current_choice_idx_;
};

#endif  // defined __grid_sampler_hpp__
