/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include "score-cache.hpp"

bool ScoreCache::insert_if_absent(
    const CandidateId& id, const CachedScore& entry) {
  ScoreMap::accessor accessor;
  bool inserted = score_map_.insert(accessor, id);
  if (inserted) {
    accessor->second = entry;
  }
  return inserted;
}

bool ScoreCache::lookup(const CandidateId& id, CachedScore *entry_ptr) const {
  CHECK(entry_ptr);
  ScoreMap::const_accessor accessor;
  if (!score_map_.find(accessor, id)) {
    return false;
  }
  *entry_ptr = accessor->second;
  return true;
}
