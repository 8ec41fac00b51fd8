/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "common/mselect-errors.hpp"
#include "samplers/candidate-sampler.hpp"
#include "samplers/random-sampler.hpp"
#include "samplers/grid-sampler.hpp"

shared_ptr<CandidateSampler> make_sampler(
    const SamplerConfig& config, const Candidates& pool) {
  if (config.sampler == SAMPLER_RANDOM) {
    return boost::make_shared<RandomSampler>(
        pool, config.seed, config.with_replacement != 0);
  }
  if (config.sampler == SAMPLER_GRID) {
    return boost::make_shared<GridSampler>(
        pool, config.shuffle != 0, config.seed);
  }
  throw ConfigError("unknown sampler " + config.sampler);
}
