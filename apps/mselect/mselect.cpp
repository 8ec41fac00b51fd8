/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <zmq.hpp>

#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "mselect.hpp"
#include "common/config-loader.hpp"
#include "common/internal-config.hpp"
#include "common/mselect-errors.hpp"
#include "benchmark/budget-sweep.hpp"
#include "evaluators/simulated-evaluator.hpp"
#include "selection/model-selection.hpp"
#include "service/request-handler.hpp"
#include "service/service-entry.hpp"

using std::vector;
using std::string;
using std::cout;
using std::cerr;
using std::endl;
using boost::shared_ptr;
using boost::make_shared;

DEFINE_string(config, "",
    "Configuration file path.");
DEFINE_double(budget, 0.0,
    "Total time budget for coordinate and select.");
DEFINE_double(score_time, -1.0,
    "Time to score one model, profiled when negative.");
DEFINE_double(train_time, -1.0,
    "Time to train one model for one epoch, profiled when negative.");
DEFINE_bool(only_phase1, false,
    "Filtering only, no refinement.");
DEFINE_int32(n, 0,
    "Number of models to explore in filtering.");
DEFINE_int32(k, 0,
    "Number of models promoted to refinement.");
DEFINE_int32(u, 0,
    "Budget units per model in refinement.");
DEFINE_string(k_models, "",
    "Comma separated model ids to refine.");
DEFINE_string(result_file, "",
    "Optional; where the benchmark writes its results.");

MselectConfig g_config;

// A simple registry for mselect commands.
typedef int (*BrewFunction)();
typedef std::map<string, BrewFunction> BrewMap;
BrewMap g_brew_map;

#define RegisterBrewFunction(func) \
namespace { \
class __Registerer_##func { \
 public: /* NOLINT */ \
  __Registerer_##func() { \
    g_brew_map[#func] = &func; \
  } \
}; \
__Registerer_##func g_registerer_##func; \
}

static BrewFunction GetBrewFunction(const string& name) {
  if (g_brew_map.count(name)) {
    return g_brew_map[name];
  } else {
    LOG(ERROR) << "Available mselect actions:";
    for (BrewMap::iterator it = g_brew_map.begin();
         it != g_brew_map.end(); ++it) {
      LOG(ERROR) << "\t" << it->first;
    }
    return NULL;
  }
}

static shared_ptr<RequestHandler> make_request_handler() {
  shared_ptr<ModelSelection> model_selection =
      make_shared<ModelSelection>(g_config);
  return make_shared<RequestHandler>(model_selection);
}

/* Prints the response and turns error records into a non-zero status */
static int run_request(const Json::Value& request) {
  shared_ptr<RequestHandler> request_handler = make_request_handler();
  Json::Value response = request_handler->handle_json(request);
  cout << write_json(response) << endl;
  return response.get("errored", false).asBool() ? 1 : 0;
}

static double profiled_time(const string& command, double flag_value) {
  if (flag_value >= 0.0) {
    return flag_value;
  }
  shared_ptr<RequestHandler> request_handler = make_request_handler();
  Json::Value request(Json::objectValue);
  request["command"] = command;
  Json::Value response = request_handler->handle_json(request);
  if (response.get("errored", false).asBool()) {
    throw std::runtime_error(response["message"].asString());
  }
  return response["time"].asDouble();
}

// mselect commands to call by
//     mselect <command> <args>
//
// To add a command, define a function "int command()" and register it with
// RegisterBrewFunction(action);

// Coordinate: compute the (n, k, u) plan for a budget.
int coordinate() {
  CHECK_GT(FLAGS_budget, 0.0) << "Need a budget to coordinate.";
  Json::Value request(Json::objectValue);
  request["command"] = "coordinate";
  request["budget"] = FLAGS_budget;
  request["score_time_per_model"] =
      profiled_time("profile_filtering", FLAGS_score_time);
  if (!FLAGS_only_phase1) {
    request["train_time_per_epoch"] =
        profiled_time("profile_refinement", FLAGS_train_time);
  }
  request["only_phase1"] = FLAGS_only_phase1;
  return run_request(request);
}
RegisterBrewFunction(coordinate);

// Filter: score n models and keep the best k.
int filter() {
  Json::Value request(Json::objectValue);
  request["command"] = "filter";
  request["n"] = FLAGS_n;
  request["k"] = FLAGS_k;
  return run_request(request);
}
RegisterBrewFunction(filter);

// Refine: train the given models with u budget units each.
int refine() {
  vector<string> ids;
  boost::split(ids, FLAGS_k_models, boost::is_any_of(","));
  Json::Value request(Json::objectValue);
  request["command"] = "refine";
  request["u"] = FLAGS_u;
  Json::Value k_models(Json::arrayValue);
  for (size_t i = 0; i < ids.size(); i++) {
    boost::trim(ids[i]);
    if (!ids[i].empty()) {
      k_models.append(ids[i]);
    }
  }
  request["k_models"] = k_models;
  request["only_phase1"] = FLAGS_only_phase1;
  return run_request(request);
}
RegisterBrewFunction(refine);

// Select: coordinate, filter and refine under one budget.
int select() {
  CHECK_GT(FLAGS_budget, 0.0) << "Need a budget to select.";
  Json::Value request(Json::objectValue);
  request["command"] = "select";
  request["budget"] = FLAGS_budget;
  request["only_phase1"] = FLAGS_only_phase1;
  return run_request(request);
}
RegisterBrewFunction(select);

// Workloads: filter a fixed (n, k) and refine the survivors with u.
int workloads() {
  Json::Value request(Json::objectValue);
  request["command"] = "workloads";
  request["n"] = FLAGS_n;
  request["k"] = FLAGS_k;
  request["u"] = FLAGS_u;
  request["only_phase1"] = FLAGS_only_phase1;
  return run_request(request);
}
RegisterBrewFunction(workloads);

// Profile: measure the scoring and the training time of one model.
int profile() {
  shared_ptr<RequestHandler> request_handler = make_request_handler();
  Json::Value response(Json::objectValue);
  const char *commands[] = {"profile_filtering", "profile_refinement"};
  for (int i = 0; i < 2; i++) {
    Json::Value request(Json::objectValue);
    request["command"] = commands[i];
    Json::Value command_response = request_handler->handle_json(request);
    if (command_response.get("errored", false).asBool()) {
      cout << write_json(command_response) << endl;
      return 1;
    }
    response[commands[i]] = command_response["time"];
  }
  cout << write_json(response) << endl;
  return 0;
}
RegisterBrewFunction(profile);

// Serve: answer JSON requests on a ZeroMQ REP socket.
int serve() {
  shared_ptr<zmq::context_t> zmq_ctx = make_shared<zmq::context_t>(1);
  ServiceEntry service_entry(
      zmq_ctx, g_config.service_config, make_request_handler());
  service_entry();
  return 0;
}
RegisterBrewFunction(serve);

// Benchmark: sweep budgets over the refinement policies.
int benchmark() {
  const EvaluatorConfig& evaluator_config = g_config.evaluator_config;
  if (evaluator_config.evaluator != EVALUATOR_SIMULATED) {
    throw ConfigError("the benchmark needs the simulated evaluator");
  }
  shared_ptr<SimulatedEvaluator> evaluator = make_shared<SimulatedEvaluator>(
      evaluator_config.score_time_per_model,
      evaluator_config.train_time_per_epoch);
  evaluator->load_file(evaluator_config.ground_truth_file);
  BudgetSweep budget_sweep(g_config, evaluator);
  SweepResults results = budget_sweep.run();

  string result_file = FLAGS_result_file;
  if (result_file.empty()) {
    result_file = g_config.benchmark_config.result_file;
  }
  if (result_file.empty() && !g_config.output_dir.empty()) {
    result_file = g_config.output_dir + "/budget-sweep.json";
  }
  if (result_file.empty()) {
    budget_sweep.write_results(results, cout);
  } else {
    budget_sweep.write_results_file(results, result_file);
  }
  return 0;
}
RegisterBrewFunction(benchmark);

int main(int argc, char** argv) {
  // Usage message.
  gflags::SetUsageMessage("two-phase model selection under a time budget\n"
      "usage: mselect <command> <args>\n\n"
      "commands:\n"
      "  coordinate      compute the (n, k, u) plan for --budget\n"
      "  filter          score --n models and keep the best --k\n"
      "  refine          train --k_models with --u units each\n"
      "  select          run the whole funnel under --budget\n"
      "  workloads       filter --n/--k, then refine with --u\n"
      "  profile         measure scoring and training time\n"
      "  serve           answer JSON requests over ZeroMQ\n"
      "  benchmark       sweep budgets over the refinement policies");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  try {
    if (!FLAGS_config.empty()) {
      load_config_file(FLAGS_config, &g_config);
    } else {
      validate_config(g_config);
    }
  } catch (const ConfigError& e) {
    cerr << write_json(make_error_record(ERROR_KIND_CONFIG, e.what())) << endl;
    return 1;
  }

  // Print output to stderr (while still logging).
  FLAGS_alsologtostderr = 1;
  if (!g_config.log_dir.empty()) {
    FLAGS_log_dir = g_config.log_dir;
  }
  google::InitGoogleLogging(argv[0]);

  if (argc != 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "apps/mselect");
    return 1;
  }
  BrewFunction brew_function = GetBrewFunction(string(argv[1]));
  if (brew_function == NULL) {
    LOG(ERROR) << "Unknown action: " << argv[1];
    return 1;
  }
  try {
    return brew_function();
  } catch (const ConfigError& e) {
    cout << write_json(make_error_record(ERROR_KIND_CONFIG, e.what())) << endl;
  } catch (const std::exception& e) {
    cout << write_json(make_error_record(ERROR_KIND_INTERNAL, e.what()))
         << endl;
  }
  return 1;
}
