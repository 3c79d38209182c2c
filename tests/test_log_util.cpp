#include <gtest/gtest.h>
#include "log_util.hpp"

#include <regex>

using namespace gateway;

TEST(LogUtilTest, TruncateForLog) {
  EXPECT_EQ(TruncateForLog("short", 10), "short");
  auto t = TruncateForLog(std::string(100, 'x'), 30);
  EXPECT_EQ(t.size(), 30u);
  EXPECT_EQ(t.substr(t.size() - 14), "...(truncated)");
  EXPECT_EQ(TruncateForLog("abc", 0), "");
}

TEST(LogUtilTest, SanitizeDropsSecretsRecursively) {
  nlohmann::json body = {{"query", "budget"},
                         {"access_token", "at"},
                         {"nested", {{"Authorization", "Bearer x"}, {"keep", 1}}},
                         {"list", {{{"client_secret", "s"}, {"id", 2}}}}};
  auto out = nlohmann::json::parse(SanitizeJsonForLog(body));
  EXPECT_EQ(out["query"], "budget");
  EXPECT_FALSE(out.contains("access_token"));
  EXPECT_FALSE(out["nested"].contains("Authorization"));
  EXPECT_EQ(out["nested"]["keep"], 1);
  EXPECT_FALSE(out["list"][0].contains("client_secret"));
  EXPECT_EQ(out["list"][0]["id"], 2);
}

TEST(LogUtilTest, Iso8601UtcNowFormat) {
  EXPECT_TRUE(std::regex_match(Iso8601UtcNow(), std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));
}
