#ifndef __candidate_pool_hpp__
#define __candidate_pool_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <istream>

#include <boost/random/mersenne_twister.hpp>

#include "common/common-utils.hpp"

/* One candidate per line: "id [encoding]". Blank lines and lines
 * starting with '#' are skipped. */
void load_candidate_pool(std::istream& in, Candidates *pool_ptr);
void load_candidate_pool_file(const string& path, Candidates *pool_ptr);

/* Enumerates MLP architectures with num_layers hidden layers, each
 * layer taking one of hidden_choices. Ids look like "8-16-32". */
void enumerate_mlp_space(
    const vector<int>& hidden_choices, int num_layers, int max_space_size,
    Candidates *pool_ptr);

void make_order(
    size_t size, bool shuffle, boost::random::mt19937 *rng,
    vector<size_t> *order_ptr);

#endif  // defined __candidate_pool_hpp__
