#ifndef __mselect_errors_hpp__
#define __mselect_errors_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <stdexcept>
#include <string>

/* Malformed plan parameters or configuration values.
 * This is a caller bug, so it aborts the call. */
class ConfigError : public std::invalid_argument {
 public:
  explicit ConfigError(const std::string& what)
      : std::invalid_argument(what) {}
};

/* Malformed request at the JSON boundary */
class RequestError : public std::runtime_error {
 public:
  explicit RequestError(const std::string& what)
      : std::runtime_error(what) {}
};

#endif  // defined __mselect_errors_hpp__
