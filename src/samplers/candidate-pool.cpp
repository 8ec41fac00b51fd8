/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "common/mselect-errors.hpp"
#include "candidate-pool.hpp"

using std::string;
using std::vector;

void load_candidate_pool(std::istream& in, Candidates *pool_ptr) {
  CHECK(pool_ptr);
  pool_ptr->clear();
  boost::unordered_set<CandidateId> seen;
  string line;
  while (!!getline(in, line)) {
    boost::trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::istringstream fields(line);
    Candidate candidate;
    fields >> candidate.id;
    if (!(fields >> candidate.encoding)) {
      candidate.encoding = candidate.id;
    }
    if (seen.count(candidate.id)) {
      throw ConfigError("duplicate candidate id in pool: " + candidate.id);
    }
    seen.insert(candidate.id);
    pool_ptr->push_back(candidate);
  }
}

void load_candidate_pool_file(const string& path, Candidates *pool_ptr) {
  std::ifstream in(path.c_str());
  if (!in) {
    throw ConfigError("cannot open candidate pool file " + path);
  }
  load_candidate_pool(in, pool_ptr);
  LOG(INFO) << "Loaded " << pool_ptr->size() << " candidates from " << path;
}

void enumerate_mlp_space(
    const vector<int>& hidden_choices, int num_layers, int max_space_size,
    Candidates *pool_ptr) {
  CHECK(pool_ptr);
  if (hidden_choices.empty() || num_layers < 1) {
    throw ConfigError("the mlp space needs hidden choices and layers");
  }
  long long num_choices = 1;
  for (int layer = 0; layer < num_layers; layer++) {
    num_choices *= hidden_choices.size();
    if (num_choices > max_space_size) {
      num_choices = max_space_size;
      break;
    }
  }
  pool_ptr->clear();
  for (long long choice_id = 0; choice_id < num_choices; choice_id++) {
    long long residual = choice_id;
    string id;
    for (int layer = 0; layer < num_layers; layer++) {
      int choice_idx = residual % hidden_choices.size();
      if (layer) {
        id += "-";
      }
      id += boost::lexical_cast<string>(hidden_choices[choice_idx]);
      residual /= hidden_choices.size();
    }
    pool_ptr->push_back(Candidate(id, id));
  }
}

void make_order(
    size_t size, bool shuffle, boost::random::mt19937 *rng,
    vector<size_t> *order_ptr) {
  CHECK(order_ptr);
  vector<size_t>& order = *order_ptr;
  order.resize(size);
  for (size_t i = 0; i < size; i++) {
    order[i] = i;
  }
  if (!shuffle || size < 2) {
    return;
  }
  CHECK(rng);
  /* Fisher-Yates, so the order only depends on the seed */
  for (size_t i = size - 1; i > 0; i--) {
    boost::random::uniform_int_distribution<size_t> dist(0, i);
    size_t j = dist(*rng);
    std::swap(order[i], order[j]);
  }
}
