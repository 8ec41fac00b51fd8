#ifndef __request_handler_hpp__
#define __request_handler_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <string>

#include <boost/shared_ptr.hpp>

#include <json/json.h>

#include "common/common-utils.hpp"
#include "selection/model-selection.hpp"

/* The JSON request/response boundary. Every request is an object with a
 * "command" field, every response is an object. Faults never escape,
 * they come back as {"errored": true, "error_kind": ..., "message": ...}. */
class RequestHandler {
  shared_ptr<ModelSelection> model_selection_;
  bool shutdown_requested_;

 public:
  explicit RequestHandler(shared_ptr<ModelSelection> model_selection);

  string handle(const string& request);
  Json::Value handle_json(const Json::Value& request);
  bool shutdown_requested() const {
    return shutdown_requested_;
  }

 private:
  Json::Value dispatch(const Json::Value& request);
  Json::Value handle_coordinate(const Json::Value& request);
  Json::Value handle_filter(const Json::Value& request);
  Json::Value handle_refine(const Json::Value& request);
  Json::Value handle_select(const Json::Value& request);
  Json::Value handle_workloads(const Json::Value& request);
  Json::Value handle_profile_filtering(const Json::Value& request);
  Json::Value handle_profile_refinement(const Json::Value& request);
  Json::Value handle_shutdown(const Json::Value& request);
};

Json::Value make_error_record(const string& error_kind, const string& message);
string write_json(const Json::Value& value);

#endif  // defined __request_handler_hpp__
