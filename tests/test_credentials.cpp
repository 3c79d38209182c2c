#include <gtest/gtest.h>
#include "credentials.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace gateway;

namespace {

std::string Lookup(const EnvironmentList& env, const std::string& key) {
  std::string value;
  int seen = 0;
  for (const auto& [k, v] : env) {
    if (k == key) {
      value = v;
      seen++;
    }
  }
  EXPECT_LE(seen, 1) << key;
  return value;
}

}  // namespace

class FileCredentialStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path = std::filesystem::temp_directory_path() /
           ("gateway_credentials_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
  void WriteFile(const std::string& body) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body;
  }

  std::filesystem::path path;
};

TEST_F(FileCredentialStoreTest, LoadsUserRecord) {
  WriteFile(R"({"users": {"u1": {"access_token": "at", "refresh_token": "rt", "expires_at": 1700000000000}}})");
  FileCredentialStore store(path.string());
  std::string err;
  auto c = store.Load("u1", &err);
  ASSERT_TRUE(c.has_value()) << err;
  EXPECT_EQ(c->access_token, "at");
  EXPECT_EQ(c->refresh_token, "rt");
  EXPECT_EQ(c->expires_at_ms, 1700000000000);
}

TEST_F(FileCredentialStoreTest, AcceptsStringExpiry) {
  WriteFile(R"({"users": {"u1": {"access_token": "at", "expires_at": "1700000000001"}}})");
  FileCredentialStore store(path.string());
  std::string err;
  auto c = store.Load("u1", &err);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->expires_at_ms, 1700000000001);
}

TEST_F(FileCredentialStoreTest, OutOfRangeExpiryIsIgnored) {
  WriteFile(R"({"users": {"u1": {"access_token": "at", "expires_at": 1e300},
                          "u2": {"access_token": "at", "expires_at": 18446744073709551615},
                          "u3": {"access_token": "at", "expires_at": 1700000000000.5}}})");
  FileCredentialStore store(path.string());
  std::string err;
  auto huge = store.Load("u1", &err);
  ASSERT_TRUE(huge.has_value()) << err;
  EXPECT_EQ(huge->expires_at_ms, 0);
  auto unsigned_max = store.Load("u2", &err);
  ASSERT_TRUE(unsigned_max.has_value()) << err;
  EXPECT_EQ(unsigned_max->expires_at_ms, 0);
  auto fractional = store.Load("u3", &err);
  ASSERT_TRUE(fractional.has_value()) << err;
  EXPECT_EQ(fractional->expires_at_ms, 1700000000000);
}

TEST_F(FileCredentialStoreTest, MissingUserIsNoRecord) {
  WriteFile(R"({"users": {"u1": {"access_token": "at"}}})");
  FileCredentialStore store(path.string());
  std::string err;
  EXPECT_FALSE(store.Load("u2", &err).has_value());
  EXPECT_TRUE(err.empty());
}

TEST_F(FileCredentialStoreTest, RecordWithoutTokensIsRejected) {
  WriteFile(R"({"users": {"u1": {"expires_at": 5}}})");
  FileCredentialStore store(path.string());
  std::string err;
  EXPECT_FALSE(store.Load("u1", &err).has_value());
  EXPECT_FALSE(err.empty());
}

TEST_F(FileCredentialStoreTest, MissingOrInvalidFile) {
  FileCredentialStore store(path.string());
  std::string err;
  EXPECT_FALSE(store.Load("u1", &err).has_value());
  EXPECT_NE(err.find("not found"), std::string::npos);

  WriteFile("{not json");
  err.clear();
  EXPECT_FALSE(store.Load("u1", &err).has_value());
  EXPECT_NE(err.find("not valid json"), std::string::npos);
}

TEST_F(FileCredentialStoreTest, PicksUpRewrittenFile) {
  WriteFile(R"({"users": {"u1": {"access_token": "old"}}})");
  FileCredentialStore store(path.string());
  std::string err;
  EXPECT_EQ(store.Load("u1", &err)->access_token, "old");
  WriteFile(R"({"users": {"u1": {"access_token": "new"}}})");
  EXPECT_EQ(store.Load("u1", &err)->access_token, "new");
}

TEST(InMemoryCredentialStoreTest, PutLoadRemove) {
  InMemoryCredentialStore store;
  std::string err;
  EXPECT_FALSE(store.Load("u1", &err).has_value());
  store.Put("u1", {"at", "rt", 42});
  ASSERT_TRUE(store.Load("u1", &err).has_value());
  EXPECT_EQ(store.Load("u1", &err)->expires_at_ms, 42);
  store.Remove("u1");
  EXPECT_FALSE(store.Load("u1", &err).has_value());
}

TEST(BuildWorkerEnvironmentTest, InjectsCredentialsAndOverridesInherited) {
  EnvironmentList base = {{"PATH", "/usr/bin"}, {"SESSION_USER_ID", "stale"}, {"HOME", "/home/x"}};
  WorkerCredentials creds{"access", "refresh", 1700000000000};
  ClientIdentity client{"cid", "csecret"};
  auto env = BuildWorkerEnvironment(base, "u2", creds, client);

  EXPECT_EQ(Lookup(env, "PATH"), "/usr/bin");
  EXPECT_EQ(Lookup(env, "HOME"), "/home/x");
  EXPECT_EQ(Lookup(env, "SESSION_USER_ID"), "u2");
  EXPECT_EQ(Lookup(env, "GOOGLE_ACCESS_TOKEN"), "access");
  EXPECT_EQ(Lookup(env, "GOOGLE_REFRESH_TOKEN"), "refresh");
  EXPECT_EQ(Lookup(env, "GOOGLE_TOKEN_EXPIRES_AT"), "1700000000000");
  EXPECT_EQ(Lookup(env, "GOOGLE_CLIENT_ID"), "cid");
  EXPECT_EQ(Lookup(env, "GOOGLE_CLIENT_SECRET"), "csecret");
  EXPECT_EQ(Lookup(env, "PYTHONUNBUFFERED"), "1");
  EXPECT_EQ(Lookup(env, "PYTHONIOENCODING"), "utf-8");
  EXPECT_EQ(env.size(), 10u);
}
