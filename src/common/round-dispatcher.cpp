/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <algorithm>

#include <boost/bind.hpp>

#include "round-dispatcher.hpp"

RoundDispatcher::RoundDispatcher(uint num_workers)
    : num_workers_(num_workers > 0 ? num_workers : 1) {
}

void RoundDispatcher::run(size_t num_tasks, const Task& task) {
  if (num_workers_ == 1 || num_tasks <= 1) {
    for (size_t i = 0; i < num_tasks; i++) {
      task(i);
    }
    return;
  }

  size_t next_task = 0;
  boost::mutex mutex;
  size_t num_threads = std::min<size_t>(num_workers_, num_tasks);
  boost::thread_group threads;
  for (size_t i = 0; i < num_threads; i++) {
    threads.create_thread(
        boost::bind(&RoundDispatcher::worker_entry, this,
            &task, num_tasks, &next_task, &mutex));
  }
  threads.join_all();
}

void RoundDispatcher::worker_entry(
    const Task *task, size_t num_tasks,
    size_t *next_task, boost::mutex *mutex) {
  while (true) {
    ScopedLock lock(*mutex);
    if (*next_task >= num_tasks) {
      return;
    }
    size_t task_idx = (*next_task)++;
    lock.unlock();
    (*task)(task_idx);
  }
}
