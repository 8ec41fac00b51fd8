/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <sstream>
#include <string>

#include <boost/format.hpp>

#include <json/json.h>

#include <gtest/gtest.h>

#include "common/internal-config.hpp"
#include "evaluators/simulated-evaluator.hpp"
#include "selection/model-selection.hpp"
#include "service/request-handler.hpp"

class RequestHandlerTest : public ::testing::Test {
 protected:
  shared_ptr<RequestHandler> handler_;

  virtual void SetUp() {
    shared_ptr<SimulatedEvaluator> evaluator =
        make_shared<SimulatedEvaluator>(0.5, 2.0);
    for (int i = 0; i < 8; i++) {
      DoubleVec accuracies;
      accuracies.push_back(0.1 * i);
      accuracies.push_back(0.1 * i + 0.05);
      evaluator->add_model(
          Candidate((boost::format("a%d") % i).str()), i, accuracies, false);
    }
    MselectConfig config;
    config.coordinator_config.max_u = 2;
    config.sampler_config.pool_source = POOL_FROM_EVALUATOR;
    handler_ = make_shared<RequestHandler>(
        make_shared<ModelSelection>(config, evaluator));
  }

  Json::Value call(const string& request) {
    string response = handler_->handle(request);
    Json::CharReaderBuilder builder;
    Json::Value root;
    string errors;
    std::istringstream in(response);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors))
        << response;
    return root;
  }

  void expect_error(const Json::Value& response, const string& error_kind) {
    EXPECT_TRUE(response.get("errored", false).asBool());
    EXPECT_EQ(error_kind, response["error_kind"].asString());
    EXPECT_FALSE(response["message"].asString().empty());
  }
};

TEST_F(RequestHandlerTest, Coordinate) {
  Json::Value response = call(
      "{\"command\": \"coordinate\", \"budget\": 100,"
      " \"score_time_per_model\": 0.5, \"train_time_per_epoch\": 2}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("ok", response["status"].asString());
  EXPECT_FALSE(response["only_phase1"].asBool());
  int n = response["n"].asInt();
  int k = response["k"].asInt();
  int u = response["u"].asInt();
  EXPECT_GE(k, 1);
  EXPECT_LE(k, n);
  EXPECT_LE(n, 8);
  EXPECT_GE(u, 1);
  EXPECT_LE(u, 2);
}

TEST_F(RequestHandlerTest, CoordinateOnlyPhase1NeedsNoTrainTime) {
  Json::Value response = call(
      "{\"command\": \"coordinate\", \"budget\": 2,"
      " \"score_time_per_model\": 0.5, \"only_phase1\": \"True\"}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_TRUE(response["only_phase1"].asBool());
  EXPECT_EQ(4, response["n"].asInt());
  EXPECT_EQ(1, response["k"].asInt());
}

TEST_F(RequestHandlerTest, CoordinateReportsInsufficientBudget) {
  Json::Value response = call(
      "{\"command\": \"coordinate\", \"budget\": 0.1,"
      " \"score_time_per_model\": 0.5, \"train_time_per_epoch\": 2}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("insufficient_budget", response["status"].asString());
  EXPECT_EQ(1, response["n"].asInt());
  EXPECT_EQ(1, response["k"].asInt());
  EXPECT_EQ(1, response["u"].asInt());
}

TEST_F(RequestHandlerTest, Filter) {
  Json::Value response = call("{\"command\": \"filter\", \"n\": 8, \"k\": 2}");
  ASSERT_FALSE(response.isMember("errored"));
  ASSERT_EQ(2u, response["k_models"].size());
  EXPECT_EQ("a7", response["k_models"][0].asString());
  EXPECT_EQ("a6", response["k_models"][1].asString());
  EXPECT_EQ(8, response["num_explored"].asInt());
  EXPECT_FALSE(response["sampler_exhausted"].asBool());
  EXPECT_EQ(0, response["num_failures"].asInt());
}

TEST_F(RequestHandlerTest, FilterPastThePoolExhaustsTheSampler) {
  Json::Value response =
      call("{\"command\": \"filter\", \"n\": 20, \"k\": 3}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ(8, response["num_explored"].asInt());
  EXPECT_TRUE(response["sampler_exhausted"].asBool());
  EXPECT_EQ(3u, response["k_models"].size());
}

TEST_F(RequestHandlerTest, Refine) {
  Json::Value response = call(
      "{\"command\": \"refine\", \"u\": 2,"
      " \"k_models\": [\"a2\", \"a5\", \"a3\"]}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("a5", response["best_arch"].asString());
  EXPECT_NEAR(0.55, response["best_arch_performance"].asDouble(), 1e-9);
  EXPECT_GT(response["budget_used"].asDouble(), 0.0);
  EXPECT_EQ(0, response["num_failures"].asInt());
}

TEST_F(RequestHandlerTest, RefineOnlyPhase1PicksTheBestScore) {
  call("{\"command\": \"filter\", \"n\": 8, \"k\": 2}");
  Json::Value response = call(
      "{\"command\": \"refine\", \"u\": 2, \"only_phase1\": true,"
      " \"k_models\": [\"a2\", \"a5\", \"a4\"]}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("a5", response["best_arch"].asString());
  EXPECT_DOUBLE_EQ(5.0, response["best_arch_performance"].asDouble());
  EXPECT_DOUBLE_EQ(0.0, response["budget_used"].asDouble());
}

TEST_F(RequestHandlerTest, RefineOnlyPhase1WithoutScoresHasNoPerformance) {
  Json::Value response = call(
      "{\"command\": \"refine\", \"u\": 2, \"only_phase1\": true,"
      " \"k_models\": [\"a5\", \"a2\"]}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("a2", response["best_arch"].asString());
  EXPECT_TRUE(response["best_arch_performance"].isNull());
}

TEST_F(RequestHandlerTest, Select) {
  Json::Value response =
      call("{\"command\": \"select\", \"budget\": 500}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ("a7", response["best_arch"].asString());
  EXPECT_NEAR(0.75, response["best_arch_performance"].asDouble(), 1e-9);
  EXPECT_LE(response["time_usage"].asDouble(), 500.0);
  EXPECT_EQ("ok", response["status"].asString());
  EXPECT_EQ(8, response["n"].asInt());
}

TEST_F(RequestHandlerTest, WorkloadsFilterThenRefineAFixedPlan) {
  Json::Value response = call(
      "{\"command\": \"workloads\", \"n\": 8, \"k\": 2, \"u\": 2}");
  ASSERT_FALSE(response.isMember("errored"));
  ASSERT_EQ(2u, response["k_models"].size());
  EXPECT_EQ("a7", response["k_models"][0].asString());
  EXPECT_EQ("a6", response["k_models"][1].asString());
  EXPECT_EQ(8, response["num_explored"].asInt());
  EXPECT_EQ("a7", response["best_arch"].asString());
  EXPECT_NEAR(0.75, response["best_arch_performance"].asDouble(), 1e-9);
  EXPECT_GT(response["budget_used"].asDouble(), 0.0);
}

TEST_F(RequestHandlerTest, WorkloadsOnlyPhase1TrainsNothing) {
  Json::Value response = call(
      "{\"command\": \"workloads\", \"n\": 6, \"k\": 3, \"u\": 1,"
      " \"only_phase1\": true}");
  ASSERT_FALSE(response.isMember("errored"));
  EXPECT_EQ(3u, response["k_models"].size());
  EXPECT_EQ(6, response["num_explored"].asInt());
  EXPECT_FALSE(response["best_arch"].isNull());
  EXPECT_DOUBLE_EQ(0.0, response["budget_used"].asDouble());
}

TEST_F(RequestHandlerTest, WorkloadsRejectsKAboveN) {
  expect_error(
      call("{\"command\": \"workloads\","
           " \"n\": 2, \"k\": 3, \"u\": 1}"),
      ERROR_KIND_CONFIG);
  expect_error(
      call("{\"command\": \"workloads\", \"n\": 4, \"k\": 2}"),
      ERROR_KIND_BAD_REQUEST);
}

TEST_F(RequestHandlerTest, Profiles) {
  Json::Value response = call("{\"command\": \"profile_filtering\"}");
  EXPECT_DOUBLE_EQ(0.5, response["time"].asDouble());
  response = call("{\"command\": \"profile_refinement\"}");
  EXPECT_DOUBLE_EQ(2.0, response["time"].asDouble());
}

TEST_F(RequestHandlerTest, MalformedJsonIsABadRequest) {
  expect_error(call("{\"command\": "), ERROR_KIND_BAD_REQUEST);
  expect_error(call("[1, 2]"), ERROR_KIND_BAD_REQUEST);
}

TEST_F(RequestHandlerTest, BadFieldsAreBadRequests) {
  expect_error(call("{\"budget\": 1}"), ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"train\"}"), ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"filter\", \"n\": 4}"),
               ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"filter\", \"n\": 4.5, \"k\": 1}"),
               ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"select\", \"budget\": \"lots\"}"),
               ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"select\", \"budget\": 5,"
                    " \"only_phase1\": \"maybe\"}"),
               ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"refine\", \"u\": 1,"
                    " \"k_models\": \"a1\"}"),
               ERROR_KIND_BAD_REQUEST);
  expect_error(call("{\"command\": \"coordinate\", \"budget\": 10,"
                    " \"score_time_per_model\": 0.5}"),
               ERROR_KIND_BAD_REQUEST);
}

TEST_F(RequestHandlerTest, IllegalValuesAreConfigurationErrors) {
  expect_error(call("{\"command\": \"filter\", \"n\": 2, \"k\": 3}"),
               ERROR_KIND_CONFIG);
  expect_error(call("{\"command\": \"refine\", \"u\": 0,"
                    " \"k_models\": [\"a1\"]}"),
               ERROR_KIND_CONFIG);
  expect_error(call("{\"command\": \"refine\", \"u\": 1,"
                    " \"k_models\": [\"zz\"]}"),
               ERROR_KIND_CONFIG);
  expect_error(call("{\"command\": \"refine\", \"u\": 1, \"k_models\": []}"),
               ERROR_KIND_CONFIG);
  expect_error(call("{\"command\": \"select\", \"budget\": -1}"),
               ERROR_KIND_CONFIG);
}

TEST_F(RequestHandlerTest, Shutdown) {
  EXPECT_FALSE(handler_->shutdown_requested());
  Json::Value response = call("{\"command\": \"shutdown\"}");
  EXPECT_TRUE(response["shutdown"].asBool());
  EXPECT_TRUE(handler_->shutdown_requested());
}

TEST(ErrorRecordTest, Shape) {
  Json::Value record = make_error_record(ERROR_KIND_INTERNAL, "boom");
  EXPECT_EQ("{\"error_kind\":\"InternalError\",\"errored\":true,"
            "\"message\":\"boom\"}", write_json(record));
}
