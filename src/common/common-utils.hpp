#ifndef __common_utils_hpp__
#define __common_utils_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/thread.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <map>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "mselect.hpp"
#include "mselect-user-defined-types.hpp"
#include "common/internal-config.hpp"

using std::string;
using std::vector;
using std::pair;
using std::cout;
using std::cerr;
using std::endl;

using boost::unordered_map;
using boost::shared_ptr;
using boost::make_shared;

typedef unsigned int uint;

typedef std::vector<double> DoubleVec;

typedef boost::unique_lock<boost::mutex> ScopedLock;

inline int ceil_div(int a, int b) {
  CHECK_GT(b, 0);
  CHECK_GE(a, 0);
  return (a + b - 1) / b;
}

/* Smallest r such that eta^r >= n */
inline int ceil_log(int n, int eta) {
  CHECK_GE(n, 1);
  CHECK_GE(eta, 2);
  int r = 0;
  long long power = 1;
  while (power < n) {
    power *= eta;
    r++;
  }
  return r;
}

inline long long int_pow(int base, int exp) {
  CHECK_GE(exp, 0);
  long long result = 1;
  for (int i = 0; i < exp; i++) {
    result *= base;
  }
  return result;
}

/* Floor that forgives the last ulp of a division such as 5.0 / 0.02 */
inline long long safe_floor(double x) {
  return static_cast<long long>(std::floor(x + FLOOR_SLACK));
}

inline double worst_metric() {
  return -std::numeric_limits<double>::infinity();
}

#endif  // defined __common_utils_hpp__
