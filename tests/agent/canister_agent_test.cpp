/**
 * @file canister_agent_test.cpp
 * @brief Unit tests for CanisterAgent and the embedded backend
 */

#include "agent/canister_agent.h"

#include <gtest/gtest.h>

#include <string>

#include "agent/embedded_agent.h"
#include "service/stable_storage_service.h"
#include "storage/stable_memory.h"
#include "system/system_interface.h"

using namespace stashd::agent;
using stashd::config::AgentConfig;
using stashd::service::StableStorageService;
using stashd::storage::StableMemory;
using stashd::system::FixedSystem;
using stashd::utils::ErrorCode;

namespace methods = stashd::service::methods;

class CanisterAgentTest : public ::testing::Test {
 protected:
  CanisterAgentTest() : memory_(128), system_(1, 2048, 42), service_(memory_, system_, "0.9.0") {}

  StableMemory memory_;
  FixedSystem system_;
  StableStorageService service_;
};

TEST_F(CanisterAgentTest, CreateEmbedded) {
  AgentConfig config;
  config.identity = "operator";
  config.canister_id = "forum";

  auto agent = CanisterAgent::Create(config, &service_);
  ASSERT_TRUE(agent) << agent.error().to_string();
  EXPECT_EQ(agent->CanisterId(), "forum");

  auto principal = agent->GetPrincipal();
  ASSERT_TRUE(principal);
  EXPECT_EQ(*principal, "operator");
}

TEST_F(CanisterAgentTest, EmbeddedRequiresService) {
  AgentConfig config;
  auto agent = CanisterAgent::Create(config, nullptr);
  ASSERT_FALSE(agent);
  EXPECT_EQ(agent.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(CanisterAgentTest, CreateHttpWithoutService) {
  AgentConfig config;
  config.type = "http";
  config.host = "127.0.0.1";
  config.port = 1;
  auto agent = CanisterAgent::Create(config, nullptr);
  ASSERT_TRUE(agent) << agent.error().to_string();
  EXPECT_EQ(agent->CanisterId(), "stashd");
}

TEST_F(CanisterAgentTest, UnknownType) {
  AgentConfig config;
  config.type = "grpc";
  auto agent = CanisterAgent::Create(config, &service_);
  ASSERT_FALSE(agent);
  EXPECT_EQ(agent.error().code(), ErrorCode::kConfigInvalidValue);
}

TEST_F(CanisterAgentTest, CloneWithIdentity) {
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);

  auto clone = agent->CloneWithIdentity("admin");
  ASSERT_TRUE(clone);
  EXPECT_EQ(*clone->GetPrincipal(), "admin");
  EXPECT_EQ(clone->CanisterId(), agent->CanisterId());
  // The original handle keeps its identity
  EXPECT_EQ(*agent->GetPrincipal(), "anonymous");

  auto empty = agent->CloneWithIdentity("");
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(CanisterAgentTest, SetIdentity) {
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);
  CanisterAgent copy = *agent;

  ASSERT_TRUE(agent->SetIdentity("backup-bot"));
  EXPECT_EQ(*agent->GetPrincipal(), "backup-bot");
  EXPECT_EQ(*copy.GetPrincipal(), "anonymous");
}

TEST_F(CanisterAgentTest, CanisterStats) {
  ASSERT_TRUE(memory_.Grow(3));
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);

  auto stats = agent->CanisterStats();
  ASSERT_TRUE(stats) << stats.error().to_string();
  EXPECT_EQ(stats->version, "0.9.0");
  EXPECT_EQ(stats->stable_storage_usage_bytes, 384U);
  EXPECT_EQ(stats->memory_usage, 2048U);
  EXPECT_EQ(stats->now, 42U);
}

TEST_F(CanisterAgentTest, TypedCalls) {
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);

  ASSERT_TRUE(agent->UpdateUnit(methods::kRestoreStableStorage, uint64_t{4}, Bytes{7, 7, 7}));
  auto window = agent->QueryTyped<Bytes>(methods::kBackupStableStorage, uint64_t{3}, uint64_t{5});
  ASSERT_TRUE(window) << window.error().to_string();
  EXPECT_EQ(*window, (Bytes{0, 7, 7, 7, 0}));
}

TEST_F(CanisterAgentTest, MethodKindIsEnforced) {
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);

  auto as_query = agent->Query(methods::kInitStableStorage, {});
  ASSERT_FALSE(as_query);
  EXPECT_EQ(as_query.error().code(), ErrorCode::kRemoteMethodNotFound);

  auto as_update = agent->Update(methods::kStats, {});
  ASSERT_FALSE(as_update);
  EXPECT_EQ(as_update.error().code(), ErrorCode::kRemoteMethodNotFound);
}

TEST_F(CanisterAgentTest, ReadState) {
  auto agent = CanisterAgent::Create(AgentConfig{}, &service_);
  ASSERT_TRUE(agent);

  auto page_size = agent->ReadStateCanisterInfo("page_size");
  ASSERT_TRUE(page_size);
  EXPECT_EQ(std::string(page_size->begin(), page_size->end()), "128");

  auto missing = agent->ReadStateCanisterInfo("controllers");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kNotFound);
}
