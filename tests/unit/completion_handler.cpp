// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <unistd.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>

#include "coordination/completion_handler.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;
using namespace stitcher::coordination;
using stitcher::catalog::JobPayload;
using stitcher::catalog::WorkCatalog;

class CompletionHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    stitcher::utils::EnsureDir(test_folder_);
    catalog_.emplace(test_folder_ / "work_catalog");
    catalog_->Initialize({"A"}, {"r"}, 90.0);
    handler_.emplace(*catalog_, registry_, sessions_, results_);
  }

  void TearDown() override {
    handler_.reset();
    catalog_.reset();
    fs::remove_all(test_folder_);
  }

  /// Puts `worker` in the running set with an open session for `payload`.
  void OpenSession(const std::string &session_id, const std::string &worker, const JobPayload &payload) {
    registry_.Add(worker);
    ASSERT_EQ(registry_.AcquireReady(), worker);
    ASSERT_TRUE(sessions_.Insert(Session{.session_id = session_id,
                                         .worker = worker,
                                         .payload = payload,
                                         .status_url = "http://" + worker + "/api/v1/status/" + session_id,
                                         .created_at = std::chrono::system_clock::now()}));
  }

  static JobPayload Cell() {
    return {.scenario_id = "A",
            .raster_id = "r",
            .bounds = {.lng_min = 0.0, .lat_min = 0.0, .lng_max = 90.0, .lat_max = 90.0}};
  }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_completion_handler_test_" + std::to_string(static_cast<int>(getpid())))};
  std::optional<WorkCatalog> catalog_;
  WorkerRegistry registry_;
  SessionTable sessions_;
  ResultQueue results_;
  std::optional<CompletionHandler> handler_;
};

TEST_F(CompletionHandlerTest, CompletesSession) {
  OpenSession("S", "w1:8888", Cell());
  const nlohmann::json body{{"session_id", "S"}, {"output_uri", "s3://bucket/A/r/0_0.tif"}};

  const auto result = handler_->Handle(body);
  ASSERT_FALSE(result.HasError());

  EXPECT_FALSE(sessions_.Contains("S"));
  EXPECT_TRUE(registry_.IsReady("w1:8888"));
  EXPECT_FALSE(registry_.IsRunning("w1:8888"));
  EXPECT_TRUE(catalog_->Get(Cell())->stitched);
  EXPECT_EQ(catalog_->Counts().stitched, 1);

  ASSERT_EQ(results_.size(), 1);
  EXPECT_EQ(results_.try_pop().value(), body);
}

TEST_F(CompletionHandlerTest, SecondCompletionIsUnknown) {
  OpenSession("S", "w1:8888", Cell());
  ASSERT_FALSE(handler_->Handle({{"session_id", "S"}}).HasError());

  const auto result = handler_->Handle({{"session_id", "S"}});
  ASSERT_TRUE(result.HasError());
  EXPECT_EQ(result.GetError(), CompletionError::UNKNOWN_SESSION);
  EXPECT_EQ(results_.size(), 1);
}

TEST_F(CompletionHandlerTest, UnknownSessionChangesNothing) {
  OpenSession("S", "w1:8888", Cell());

  const auto result = handler_->Handle({{"session_id", "other"}});
  ASSERT_TRUE(result.HasError());
  EXPECT_EQ(result.GetError(), CompletionError::UNKNOWN_SESSION);

  EXPECT_TRUE(sessions_.Contains("S"));
  EXPECT_TRUE(registry_.IsRunning("w1:8888"));
  EXPECT_EQ(catalog_->Counts().stitched, 0);
  EXPECT_EQ(results_.size(), 0);
}

TEST_F(CompletionHandlerTest, MalformedRequests) {
  OpenSession("S", "w1:8888", Cell());

  for (const auto &body : {nlohmann::json::array({1, 2}), nlohmann::json{{"id", "S"}}, nlohmann::json{{"session_id", 7}},
                           nlohmann::json("S")}) {
    const auto result = handler_->Handle(body);
    ASSERT_TRUE(result.HasError()) << body.dump();
    EXPECT_EQ(result.GetError(), CompletionError::MALFORMED_REQUEST) << body.dump();
  }

  const auto raw = handler_->HandleRaw("{not json");
  ASSERT_TRUE(raw.HasError());
  EXPECT_EQ(raw.GetError(), CompletionError::MALFORMED_REQUEST);

  EXPECT_TRUE(sessions_.Contains("S"));
  EXPECT_EQ(results_.size(), 0);
}

TEST_F(CompletionHandlerTest, HandleRaw) {
  OpenSession("S", "w1:8888", Cell());
  ASSERT_FALSE(handler_->HandleRaw(R"({"session_id": "S", "status": "done"})").HasError());
  EXPECT_TRUE(registry_.IsReady("w1:8888"));
  EXPECT_EQ(results_.try_pop().value().at("status"), "done");
}

TEST_F(CompletionHandlerTest, UnknownWorkItemStillReleasesWorker) {
  auto missing = Cell();
  missing.scenario_id = "Z";
  OpenSession("S", "w1:8888", missing);

  ASSERT_FALSE(handler_->Handle({{"session_id", "S"}}).HasError());
  EXPECT_TRUE(registry_.IsReady("w1:8888"));
  EXPECT_EQ(catalog_->Counts().stitched, 0);
}

TEST_F(CompletionHandlerTest, FullResultQueueDropsResults) {
  ResultQueue bounded(1);
  CompletionHandler handler(*catalog_, registry_, sessions_, bounded);
  auto second = Cell();
  second.bounds.lng_min = 90.0;
  second.bounds.lng_max = 180.0;
  OpenSession("S1", "w1:8888", Cell());
  OpenSession("S2", "w2:8888", second);
  OpenSession("S3", "w3:8888", second);

  ASSERT_FALSE(handler.Handle(nlohmann::json{{"session_id", "S1"}}).HasError());
  ASSERT_FALSE(handler.Handle(nlohmann::json{{"session_id", "S2"}}).HasError());
  ASSERT_FALSE(handler.Handle(nlohmann::json{{"session_id", "S3"}}).HasError());

  // Nothing drains the queue, so it stays at its bound.
  EXPECT_EQ(bounded.size(), 1);
  EXPECT_EQ(handler.DroppedResults(), 2);
  EXPECT_EQ(bounded.try_pop().value().at("session_id"), "S1");
  // Dropping a result doesn't hold back the completion itself.
  for (const auto *worker : {"w1:8888", "w2:8888", "w3:8888"}) EXPECT_TRUE(registry_.IsReady(worker)) << worker;
  EXPECT_EQ(sessions_.Size(), 0);
  EXPECT_EQ(catalog_->Counts().stitched, 2);
}

TEST_F(CompletionHandlerTest, ClosedResultQueueDropsResults) {
  results_.finish();
  OpenSession("S", "w1:8888", Cell());
  ASSERT_FALSE(handler_->Handle(nlohmann::json{{"session_id", "S"}}).HasError());
  EXPECT_EQ(handler_->DroppedResults(), 1);
  EXPECT_TRUE(registry_.IsReady("w1:8888"));
}

TEST(CompletionError, ToString) {
  EXPECT_EQ(CompletionErrorToString(CompletionError::UNKNOWN_SESSION), "unknown session");
  EXPECT_EQ(CompletionErrorToString(CompletionError::MALFORMED_REQUEST), "malformed request");
}
