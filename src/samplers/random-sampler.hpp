#ifndef __random_sampler_hpp__
#define __random_sampler_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/random/mersenne_twister.hpp>

#include "samplers/candidate-sampler.hpp"

class RandomSampler : public CandidateSampler {
 public:
  RandomSampler(
      const Candidates& pool, unsigned int seed, bool with_replacement);
  virtual bool next(Candidate *candidate_ptr);
  virtual void reset(unsigned int seed);
  virtual size_t size() const {
    return pool_.size();
  }

 private:
  Candidates pool_;
  bool with_replacement_;
  boost::random::mt19937 rng_;
  vector<size_t> order_;
  size_t next_idx_;
};

#endif  // defined __random_sampler_hpp__
