#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <cctype>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <iostream>

namespace fs = std::filesystem;

template <typename T>
T read(const fs::path& path) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} not found, using defaults", path.string());
    return t;
  }

  auto ec = glz::read_file_json(t, path.string(), std::string{});
  if (ec) {
    spdlog::error("[config] {} error {}", path.string(),
                  glz::format_error(ec));
    return T{};
  }

  if (T::debug) {
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    spdlog::debug("[config] \"{}\": {}", T::name, buffer);
  }

  return t;
}

void Config::update() {
  fs::path dir{config_dir};

  ind_config = read<IndicatorsConfig>(dir / "indicators.json");
  quality_config = read<QualityConfig>(dir / "quality.json");
  sig_config = read<SignalConfig>(dir / "signal.json");

  if (ind_config.sma_short >= ind_config.sma_long)
    spdlog::warn("[config] sma_short {} is not shorter than sma_long {}",
                 ind_config.sma_short, ind_config.sma_long);
}

bool Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("stocklens");

  program.add_argument("symbol").help("Ticker symbol being analysed");

  program.add_argument("-p", "--prices")
      .required()
      .help("Daily OHLCV bars as JSON");

  program.add_argument("-f", "--fundamentals")
      .default_value(std::string{})
      .help("Annual statements and quote snapshot as JSON");

  program.add_argument("-n", "--headlines")
      .default_value(std::string{})
      .help("Scored news headlines as JSON");

  program.add_argument("-c", "--config-dir")
      .default_value(std::string{"private"})
      .help("Directory holding indicators/quality/signal json configs");

  program.add_argument("-j", "--json")
      .default_value(std::string{})
      .help("Also write the analysis as JSON to this path");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    return false;
  }

  symbol = program.get<std::string>("symbol");
  prices_path = program.get<std::string>("--prices");
  fundamentals_path = program.get<std::string>("--fundamentals");
  headlines_path = program.get<std::string>("--headlines");
  config_dir = program.get<std::string>("--config-dir");
  json_path = program.get<std::string>("--json");
  debug_en = program.get<bool>("--debug");

  json_en = !json_path.empty();
  for (auto& c : symbol)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  return true;
}
