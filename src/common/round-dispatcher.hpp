#ifndef __round_dispatcher_hpp__
#define __round_dispatcher_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/function.hpp>
#include <boost/thread.hpp>

#include "common/common-utils.hpp"

/* Runs the independent evaluator calls of one round on a small pool of
 * threads and returns only after all of them finished, so a round is a
 * barrier. Tasks must not throw. */
class RoundDispatcher {
 public:
  typedef boost::function<void (size_t)> Task;

  explicit RoundDispatcher(uint num_workers);
  void run(size_t num_tasks, const Task& task);
  uint num_workers() const {
    return num_workers_;
  }

 private:
  uint num_workers_;

  void worker_entry(
      const Task *task, size_t num_tasks,
      size_t *next_task, boost::mutex *mutex);
};

#endif  // defined __round_dispatcher_hpp__
