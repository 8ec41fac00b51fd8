#ifndef __candidate_sampler_hpp__
#define __candidate_sampler_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "common/common-utils.hpp"

class CandidateSampler {
 public:
  virtual ~CandidateSampler() {}
  /* Returns false once the sampler is exhausted */
  virtual bool next(Candidate *candidate_ptr) = 0;
  virtual void reset(unsigned int seed) = 0;
  /* Number of distinct candidates it can produce, 0 if unknown */
  virtual size_t size() const = 0;
};

shared_ptr<CandidateSampler> make_sampler(
    const SamplerConfig& config, const Candidates& pool);

#endif  // defined __candidate_sampler_hpp__
