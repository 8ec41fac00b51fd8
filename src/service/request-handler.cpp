/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <cmath>
#include <exception>
#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>

#include "common/internal-config.hpp"
#include "common/mselect-errors.hpp"
#include "request-handler.hpp"

using std::string;
using std::vector;

Json::Value make_error_record(const string& error_kind, const string& message) {
  Json::Value record(Json::objectValue);
  record["errored"] = true;
  record["error_kind"] = error_kind;
  record["message"] = message;
  return record;
}

string write_json(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

static const Json::Value& get_field(
    const Json::Value& request, const string& field) {
  if (!request.isMember(field)) {
    throw RequestError("missing field " + field);
  }
  return request[field];
}

static double get_double(const Json::Value& request, const string& field) {
  const Json::Value& value = get_field(request, field);
  if (!value.isNumeric()) {
    throw RequestError("field " + field + " must be a number");
  }
  return value.asDouble();
}

static int get_int(const Json::Value& request, const string& field) {
  const Json::Value& value = get_field(request, field);
  if (!value.isIntegral() || !value.isConvertibleTo(Json::intValue)) {
    throw RequestError("field " + field + " must be an integer");
  }
  return value.asInt();
}

/* Accepts a JSON bool or the strings "true" and "false" */
static bool get_flag(const Json::Value& request, const string& field) {
  if (!request.isMember(field) || request[field].isNull()) {
    return false;
  }
  const Json::Value& value = request[field];
  if (value.isBool()) {
    return value.asBool();
  }
  if (value.isString()) {
    string text = value.asString();
    if (text == "true" || text == "True") {
      return true;
    }
    if (text == "false" || text == "False") {
      return false;
    }
  }
  throw RequestError("field " + field + " must be a bool");
}

static vector<CandidateId> get_id_list(
    const Json::Value& request, const string& field) {
  const Json::Value& value = get_field(request, field);
  if (!value.isArray()) {
    throw RequestError("field " + field + " must be a list of ids");
  }
  vector<CandidateId> ids;
  for (Json::ArrayIndex i = 0; i < value.size(); i++) {
    if (!value[i].isString()) {
      throw RequestError("field " + field + " must be a list of ids");
    }
    ids.push_back(value[i].asString());
  }
  return ids;
}

/* -inf and NaN are not JSON, they become null */
static Json::Value json_number(double value) {
  if (std::isfinite(value)) {
    return Json::Value(value);
  }
  return Json::Value(Json::nullValue);
}

RequestHandler::RequestHandler(shared_ptr<ModelSelection> model_selection)
    : model_selection_(model_selection), shutdown_requested_(false) {
  CHECK(model_selection_);
}

string RequestHandler::handle(const string& request) {
  Json::CharReaderBuilder builder;
  boost::scoped_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  string errors;
  if (!reader->parse(request.data(), request.data() + request.size(),
                     &root, &errors)) {
    LOG(WARNING) << "Malformed request: " << errors;
    return write_json(make_error_record(
        ERROR_KIND_BAD_REQUEST, "malformed JSON: " + errors));
  }
  return write_json(handle_json(root));
}

Json::Value RequestHandler::handle_json(const Json::Value& request) {
  try {
    return dispatch(request);
  } catch (const RequestError& e) {
    LOG(WARNING) << "Bad request: " << e.what();
    return make_error_record(ERROR_KIND_BAD_REQUEST, e.what());
  } catch (const ConfigError& e) {
    LOG(WARNING) << "Configuration error: " << e.what();
    return make_error_record(ERROR_KIND_CONFIG, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "Internal error: " << e.what();
    return make_error_record(ERROR_KIND_INTERNAL, e.what());
  }
}

Json::Value RequestHandler::dispatch(const Json::Value& request) {
  if (!request.isObject()) {
    throw RequestError("request must be a JSON object");
  }
  const Json::Value& command_value = get_field(request, "command");
  if (!command_value.isString()) {
    throw RequestError("field command must be a string");
  }
  string command = command_value.asString();
  LOG(INFO) << "Handling " << command;
  if (command == "coordinate") {
    return handle_coordinate(request);
  }
  if (command == "filter") {
    return handle_filter(request);
  }
  if (command == "refine") {
    return handle_refine(request);
  }
  if (command == "select") {
    return handle_select(request);
  }
  if (command == "workloads") {
    return handle_workloads(request);
  }
  if (command == "profile_filtering") {
    return handle_profile_filtering(request);
  }
  if (command == "profile_refinement") {
    return handle_profile_refinement(request);
  }
  if (command == "shutdown") {
    return handle_shutdown(request);
  }
  throw RequestError("unknown command " + command);
}

Json::Value RequestHandler::handle_coordinate(const Json::Value& request) {
  double budget = get_double(request, "budget");
  double score_time = get_double(request, "score_time_per_model");
  bool only_phase1 = get_flag(request, "only_phase1");
  double train_time = 0.0;
  if (request.isMember("train_time_per_epoch")) {
    train_time = get_double(request, "train_time_per_epoch");
  } else if (!only_phase1) {
    throw RequestError("missing field train_time_per_epoch");
  }
  AllocationPlan plan = model_selection_->coordinate(
      budget, score_time, train_time, only_phase1);
  Json::Value response(Json::objectValue);
  response["k"] = plan.k;
  response["u"] = plan.u;
  response["n"] = plan.n;
  response["only_phase1"] = plan.filter_only;
  response["status"] = plan.status == PLAN_OK ? "ok" : "insufficient_budget";
  return response;
}

Json::Value RequestHandler::handle_filter(const Json::Value& request) {
  int n = get_int(request, "n");
  int k = get_int(request, "k");
  FilteringResult result = model_selection_->filter(n, k);
  Json::Value response(Json::objectValue);
  Json::Value k_models(Json::arrayValue);
  for (size_t i = 0; i < result.top_k.size(); i++) {
    k_models.append(result.top_k[i].candidate.id);
  }
  response["k_models"] = k_models;
  response["num_explored"] = result.num_scored;
  response["sampler_exhausted"] = result.sampler_exhausted;
  response["num_failures"] = static_cast<int>(result.failures.size());
  return response;
}

Json::Value RequestHandler::handle_refine(const Json::Value& request) {
  bool only_phase1 = get_flag(request, "only_phase1");
  int u = get_int(request, "u");
  vector<CandidateId> k_models = get_id_list(request, "k_models");
  RefinementResult result =
      model_selection_->refine(u, k_models, only_phase1);
  Json::Value response(Json::objectValue);
  if (result.found) {
    response["best_arch"] = result.best.candidate.id;
  } else {
    response["best_arch"] = Json::Value(Json::nullValue);
  }
  response["best_arch_performance"] = json_number(result.best_metric);
  response["budget_used"] = result.budget_consumed;
  response["num_failures"] = static_cast<int>(result.failures.size());
  return response;
}

Json::Value RequestHandler::handle_select(const Json::Value& request) {
  double budget = get_double(request, "budget");
  bool only_phase1 = get_flag(request, "only_phase1");
  SelectionResult result = model_selection_->select(budget, only_phase1);
  Json::Value response(Json::objectValue);
  if (result.found) {
    response["best_arch"] = result.best_id;
  } else {
    response["best_arch"] = Json::Value(Json::nullValue);
  }
  response["best_arch_performance"] = json_number(result.best_performance);
  response["time_usage"] = result.time_usage;
  response["n"] = result.plan.n;
  response["k"] = result.plan.k;
  response["u"] = result.plan.u;
  response["status"] =
      result.plan.status == PLAN_OK ? "ok" : "insufficient_budget";
  return response;
}

Json::Value RequestHandler::handle_workloads(const Json::Value& request) {
  AllocationPlan plan(
      get_int(request, "n"), get_int(request, "k"), get_int(request, "u"));
  plan.filter_only = get_flag(request, "only_phase1");
  SelectionResult result = model_selection_->run_workload(plan);
  Json::Value response(Json::objectValue);
  Json::Value k_models(Json::arrayValue);
  for (size_t i = 0; i < result.filtering.top_k.size(); i++) {
    k_models.append(result.filtering.top_k[i].candidate.id);
  }
  response["k_models"] = k_models;
  response["num_explored"] = result.filtering.num_scored;
  if (result.found) {
    response["best_arch"] = result.best_id;
  } else {
    response["best_arch"] = Json::Value(Json::nullValue);
  }
  response["best_arch_performance"] = json_number(result.best_performance);
  response["budget_used"] = result.refinement.budget_consumed;
  response["wall_time"] = result.wall_time;
  return response;
}

Json::Value RequestHandler::handle_profile_filtering(
    const Json::Value& request) {
  Json::Value response(Json::objectValue);
  response["time"] = model_selection_->profile_filtering();
  return response;
}

Json::Value RequestHandler::handle_profile_refinement(
    const Json::Value& request) {
  Json::Value response(Json::objectValue);
  response["time"] = model_selection_->profile_refinement();
  return response;
}

Json::Value RequestHandler::handle_shutdown(const Json::Value& request) {
  shutdown_requested_ = true;
  Json::Value response(Json::objectValue);
  response["shutdown"] = true;
  return response;
}
