#include "infra/SettingsLoader.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

static SettingsLoader::Lookup
env_of(std::map<std::string, std::string> vars = {}) {
  return [vars](const std::string &name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end())
      return std::nullopt;
    return it->second;
  };
}

TEST(SettingsLoader, DefaultsFromEmptyObject) {
  Settings s = SettingsLoader::parse("{}", env_of());
  EXPECT_EQ(s.server.host, "0.0.0.0");
  EXPECT_EQ(s.server.port, 4000);
  EXPECT_EQ(s.server.api_prefix, "/api/v1");
  EXPECT_EQ(s.providers.kakao.timeout, std::chrono::milliseconds(4000));
  EXPECT_EQ(s.providers.odsay.timeout, std::chrono::milliseconds(4500));
  EXPECT_EQ(s.providers.kakao.base_url, "https://apis-navi.kakaomobility.com");
}

TEST(SettingsLoader, JsonValuesApply) {
  Settings s = SettingsLoader::parse(R"({
    "server": {"port": 8088, "api_prefix": "api", "post_endpoints": ["route/optimize"]},
    "providers": {"kakao": {"base_url": "http://127.0.0.1:9000", "timeout_ms": 1500}}
  })",
                                     env_of());
  EXPECT_EQ(s.server.port, 8088);
  EXPECT_EQ(s.server.api_prefix, "/api");
  EXPECT_EQ(s.providers.kakao.base_url, "http://127.0.0.1:9000");
  EXPECT_EQ(s.providers.kakao.path, "/v1/directions");
  EXPECT_EQ(s.providers.kakao.timeout, std::chrono::milliseconds(1500));
}

TEST(SettingsLoader, EnvironmentOverrides) {
  Settings s = SettingsLoader::parse(
      R"({"server": {"port": 8088}})",
      env_of({{"PORT", "5050"}, {"HOST", "127.0.0.1"}, {"API_PREFIX", " v2 "}}));
  EXPECT_EQ(s.server.port, 5050);
  EXPECT_EQ(s.server.host, "127.0.0.1");
  EXPECT_EQ(s.server.api_prefix, "/v2");
}

TEST(SettingsLoader, InvalidPortRejected) {
  EXPECT_THROW(SettingsLoader::parse("{}", env_of({{"PORT", "http"}})),
               std::runtime_error);
  EXPECT_THROW(SettingsLoader::parse("{}", env_of({{"PORT", "70000"}})),
               std::runtime_error);
  EXPECT_THROW(SettingsLoader::parse(R"({"server": {"port": 0}})", env_of()),
               std::runtime_error);
}

TEST(SettingsLoader, BadJsonRejected) {
  EXPECT_THROW(SettingsLoader::parse("{ nope", env_of()), std::runtime_error);
  EXPECT_THROW(SettingsLoader::parse(R"({"server": {"port": "x"}})", env_of()),
               std::runtime_error);
  EXPECT_THROW(SettingsLoader::parse(
                   R"({"providers": {"odsay": {"timeout_ms": 0}}})", env_of()),
               std::runtime_error);
}

TEST(SettingsLoader, SectionsMustBeObjects) {
  try {
    SettingsLoader::parse(R"({"server": 5})", env_of());
    FAIL() << "expected a settings error";
  } catch (const std::runtime_error &e) {
    EXPECT_STREQ(e.what(), "settings: server must be an object");
  }
  EXPECT_THROW(SettingsLoader::parse(R"({"providers": []})", env_of()),
               std::runtime_error);
  EXPECT_THROW(
      SettingsLoader::parse(R"({"providers": {"kakao": "http://x"}})", env_of()),
      std::runtime_error);
  EXPECT_THROW(SettingsLoader::parse("[]", env_of()), std::runtime_error);
}

TEST(SettingsLoader, MissingFile) {
  EXPECT_THROW(SettingsLoader::load("does/not/exist.json", env_of()),
               std::runtime_error);
}

TEST(SettingsLoader, ShippedConfigLoads) {
  // tests run from the source directory
  Settings s = SettingsLoader::load("config/settings.json", env_of());
  EXPECT_EQ(s.server.port, 4000);
  EXPECT_EQ(s.providers.odsay.path, "/v1/api/searchPubTransPathT");
}
