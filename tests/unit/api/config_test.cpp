#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "ephem_api/config.hpp"

using ephem_api::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/ephem_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

// Sets an environment variable for the lifetime of the object
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    setenv(name, value, 1);
  }
  ~ScopedEnv() {
    unsetenv(name_);
  }

 private:
  const char* name_;
};

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:8000");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "all-minilm");
  EXPECT_EQ(cfg.embedding_dimension, 384);
  EXPECT_EQ(cfg.session_ttl_seconds, 3600);
  EXPECT_EQ(cfg.quota_limit, 2000);
  EXPECT_EQ(cfg.quota_window_seconds, 86400);
  EXPECT_EQ(cfg.max_top_k, 50);
  EXPECT_EQ(cfg.host(), "127.0.0.1");
  EXPECT_EQ(cfg.port(), 8000);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:9090"},
                      {"embedding_model", "nomic-embed-text"},
                      {"embedding_dimension", 768},
                      {"session_ttl_seconds", 600},
                      {"quota_limit", 50},
                      {"num_workers", 4}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.port(), 9090);
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_EQ(cfg.num_workers, 4);

  ephem_core::CoreSettings settings = cfg.to_core_settings();
  EXPECT_EQ(settings.embedding_dimension, 768u);
  EXPECT_EQ(settings.session_ttl, std::chrono::seconds(600));
  EXPECT_EQ(settings.quota_limit, 50);
  EXPECT_EQ(settings.max_chunks_per_session, 5000u);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string path = write_temp_file(R"JSON({"quota_limit": 3, "max_top_k": 5})JSON");
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.quota_limit, 3);
  EXPECT_EQ(cfg.max_top_k, 5);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/config.json"); }, std::runtime_error);
}

TEST(ConfigTest, MalformedJsonFileThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  EXPECT_THROW({ (void)Config::from_json({{"api_base_url", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"api_base_url", "localhost"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"embedding_dimension", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"quota_limit", -1}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"session_ttl_seconds", "long"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"embedding_model", 5}}); }, std::runtime_error);
}

TEST(ConfigTest, EnvironmentOverridesJson) {
  ScopedEnv ttl("EPHEM_SESSION_TTL_SECONDS", "120");
  ScopedEnv model("EPHEM_EMBEDDING_MODEL", "mxbai-embed-large");

  Config cfg = Config::from_json({{"session_ttl_seconds", 900}, {"quota_limit", 10}});
  cfg.apply_environment();

  EXPECT_EQ(cfg.session_ttl_seconds, 120);
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.quota_limit, 10);
}

TEST(ConfigTest, MalformedEnvironmentNumberThrows) {
  ScopedEnv bad("EPHEM_MAX_TOP_K", "12abc");
  Config cfg;
  EXPECT_THROW(cfg.apply_environment(), std::runtime_error);
}

TEST(ConfigTest, FromEnvironmentLoadsNamedFileFirst) {
  std::string path = write_temp_file(R"JSON({"quota_limit": 7, "max_top_k": 9})JSON");
  {
    ScopedEnv file("EPHEM_CONFIG", path.c_str());
    ScopedEnv top_k("EPHEM_MAX_TOP_K", "4");

    Config cfg = Config::from_environment();

    EXPECT_EQ(cfg.quota_limit, 7);
    EXPECT_EQ(cfg.max_top_k, 4);
  }
  remove_file(path);
}
