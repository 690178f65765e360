#include "util/config.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

inline fs::path fresh_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

inline void write_file(const fs::path& path, const std::string& body) {
  std::ofstream file(path);
  file << body;
}

TEST_CASE("Config files override defaults or fall back to them", "[config]") {
  auto dir = fresh_dir("stocklens_config_test");
  write_file(dir / "indicators.json",
             R"({"sma_long": 150, "rsi_period": 10})");
  write_file(dir / "quality.json", "{ \"max_pe\": ");

  Config cfg;
  cfg.config_dir = dir.string();
  cfg.quality_config.max_pe = 99.0;
  cfg.sig_config.option_sentiment_min = 0.5;

  cfg.update();

  // valid file, unlisted keys keep their defaults
  CHECK(cfg.ind_config.sma_long == 150);
  CHECK(cfg.ind_config.rsi_period == 10);
  CHECK(cfg.ind_config.sma_short == 50);

  // malformed file
  CHECK(cfg.quality_config.max_pe == 20.0);
  CHECK(cfg.quality_config.pass_ratio == 0.6);

  // missing file
  CHECK(cfg.sig_config.option_sentiment_min == 0.05);
  CHECK(cfg.sig_config.overall_sentiment_min == 0.0);

  fs::remove_all(dir);
}

TEST_CASE("Missing config directory keeps defaults", "[config]") {
  Config cfg;
  auto dir = fs::temp_directory_path() / "stocklens_no_such_dir";
  fs::remove_all(dir);
  cfg.config_dir = dir.string();

  cfg.update();

  CHECK(cfg.ind_config.sma_long == 200);
  CHECK(cfg.quality_config.max_periods == 5);
  CHECK(cfg.sig_config.sentiment_positive == 0.05);
}

inline bool parse(Config& cfg, std::vector<std::string> args) {
  std::vector<char*> argv;
  for (auto& arg : args)
    argv.push_back(arg.data());
  return cfg.read_args(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("Command line arguments", "[config]") {
  Config cfg;
  REQUIRE(parse(cfg, {"stocklens", "acme", "-p", "prices.json", "-n",
                      "news.json", "--json", "out.json", "-d"}));

  CHECK(cfg.symbol == "ACME");
  CHECK(cfg.prices_path == "prices.json");
  CHECK(cfg.headlines_path == "news.json");
  CHECK(cfg.fundamentals_path.empty());
  CHECK(cfg.config_dir == "private");
  CHECK(cfg.json_en);
  CHECK(cfg.json_path == "out.json");
  CHECK(cfg.debug_en);
}

TEST_CASE("Prices are required on the command line", "[config]") {
  Config cfg;
  CHECK_FALSE(parse(cfg, {"stocklens", "acme"}));
}
