#include "core/analysis.h"
#include "core/loader.h"
#include "core/report.h"
#include "util/config.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>

namespace fs = std::filesystem;

inline void init_logging() {
  auto pwd = fs::current_path().generic_string();
  auto now = std::chrono::floor<std::chrono::seconds>(SysClock::now());
  auto log_name = std::format("{}/logs/{:%F_%H%M%S}.log", pwd, now);
  auto link_name = pwd + "/logs/output.log";

  std::error_code ec;
  fs::remove(link_name, ec);
  fs::create_symlink(log_name, link_name, ec);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (!fs::create_directories(path))
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  if (!config.read_args(argc, argv))
    return 2;

  ensure_directories_exist({"logs"});
  init_logging();
  config.update();

  Timer timer;

  AnalysisInput input;
  input.symbol = config.symbol;
  input.bars = read_bars_file(config.prices_path);
  if (input.bars.empty()) {
    std::cerr << std::format("No price data found for '{}' in {}\n",
                             config.symbol, config.prices_path);
    return 1;
  }

  if (!config.fundamentals_path.empty())
    input.fundamentals = read_fundamentals_file(config.fundamentals_path);
  if (!config.headlines_path.empty())
    input.headlines = read_headlines_file(config.headlines_path);

  Analysis analysis{std::move(input)};
  std::cout << render_text(analysis);

  int status = 0;
  if (config.json_en && !write_json(analysis, config.json_path))
    status = 1;

  spdlog::info("[exit] {} analysed in {:.1f} ms", analysis.symbol,
               timer.diff_ms());
  return status;
}
