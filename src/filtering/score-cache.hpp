#ifndef __score_cache_hpp__
#define __score_cache_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <tbb/concurrent_hash_map.h>

#include "common/common-utils.hpp"

struct CachedScore {
  double score;
  bool ok;
  CachedScore() : score(worst_metric()), ok(false) {}
  CachedScore(double score, bool ok) : score(score), ok(ok) {}
};

/* Proxy scores keyed by candidate id, shared by the concurrent
 * scoring calls of a filtering run. Entries are never overwritten. */
class ScoreCache {
  typedef tbb::concurrent_hash_map<CandidateId, CachedScore> ScoreMap;
  ScoreMap score_map_;

 public:
  /* Returns true if the entry was inserted, false if the id was
   * already cached (the cached value is left unchanged) */
  bool insert_if_absent(const CandidateId& id, const CachedScore& entry);
  bool lookup(const CandidateId& id, CachedScore *entry_ptr) const;
  size_t size() const {
    return score_map_.size();
  }
  void clear() {
    score_map_.clear();
  }
};

#endif  // defined __score_cache_hpp__
