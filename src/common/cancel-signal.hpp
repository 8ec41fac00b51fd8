#ifndef __cancel_signal_hpp__
#define __cancel_signal_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/atomic.hpp>

/* Raised by the caller, observed by the drivers between rounds only */
class CancelSignal {
  boost::atomic<bool> cancelled_;

 public:
  CancelSignal() : cancelled_(false) {}
  void cancel() {
    cancelled_.store(true);
  }
  void reset() {
    cancelled_.store(false);
  }
  bool cancelled() const {
    return cancelled_.load();
  }
};

inline bool is_cancelled(const CancelSignal *cancel) {
  return cancel != NULL && cancel->cancelled();
}

#endif  // defined __cancel_signal_hpp__
