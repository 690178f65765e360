#include "core/loader.h"
#include "util/format.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <fstream>
#include <glaze/glaze.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

// Left in place of a date string that doesn't parse
constexpr Date no_date{};

template <>
struct glz::meta<Date> {
  using T = Date;

  static constexpr auto write = [](const T& date) {
    return date_to_string(date);
  };

  static constexpr auto read = [](T& t, const std::string& str) {
    t = string_to_date(str).value_or(no_date);
  };

  static constexpr auto value = custom<read, write>;
};

template <>
struct glz::meta<Bar> {
  using T = Bar;
  static constexpr auto value = object("datetime", &T::date,  //
                                       "open", &T::open,      //
                                       "high", &T::high,      //
                                       "low", &T::low,        //
                                       "close", &T::close,    //
                                       "volume", &T::volume);
};

struct PricesRes {
  std::string symbol;
  PriceSeries values;
};

constexpr auto read_opts = glz::opts{.error_on_unknown_keys = false};

PriceSeries read_bars_json(const std::string& str) {
  PricesRes res;
  auto ec = glz::read<read_opts>(res, str);
  if (ec) {
    spdlog::error("[load] prices json error: {}", glz::format_error(ec, str));
    return {};
  }

  PriceSeries bars;
  bars.reserve(res.values.size());
  for (auto& bar : res.values) {
    if (bar.date == no_date) {
      spdlog::warn("[load] {}: dropping bar without a date: {}", res.symbol,
                   to_str(bar));
      continue;
    }
    if (!bars.empty() && bar.date <= bars.back().date) {
      spdlog::warn("[load] {}: dropping out of order bar {}", res.symbol,
                   to_str(bar));
      continue;
    }
    bars.push_back(bar);
  }

  spdlog::info("[load] {}: {} bars", res.symbol, bars.size());
  return bars;
}

Fundamentals read_fundamentals_json(const std::string& str) {
  Fundamentals fund;
  auto ec = glz::read<read_opts>(fund, str);
  if (ec) {
    spdlog::error("[load] fundamentals json error: {}",
                  glz::format_error(ec, str));
    return {};
  }

  std::erase_if(fund.statements, [](const FinancialPeriod& p) {
    if (p.period_end != no_date)
      return false;
    spdlog::warn("[load] dropping statement without a period end");
    return true;
  });

  spdlog::info("[load] {} statements", fund.statements.size());
  return fund;
}

// Absent, null or non-string fields read as empty
inline std::string string_field(const json& item, const char* key) {
  auto it = item.find(key);
  return it != item.end() && it->is_string() ? it->get<std::string>() : "";
}

std::vector<Headline> read_headlines_json(const std::string& str) {
  std::vector<Headline> headlines;

  try {
    auto root = json::parse(str);
    if (!root.contains("articles") || !root["articles"].is_array())
      return headlines;

    for (auto& item : root["articles"]) {
      auto it = item.find("polarity");
      if (it == item.end() || !it->is_number()) {
        spdlog::warn("[load] headline without polarity skipped");
        continue;
      }

      headlines.push_back({string_field(item, "title"),
                           string_field(item, "url"), it->get<double>()});
    }
  } catch (const std::exception& e) {
    spdlog::error("[load] headlines json error: {}", e.what());
    return {};
  }

  spdlog::info("[load] {} headlines", headlines.size());
  return headlines;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::error("[load] couldn't open {}", path);
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

PriceSeries read_bars_file(const std::string& path) {
  auto str = read_file(path);
  return str ? read_bars_json(*str) : PriceSeries{};
}

Fundamentals read_fundamentals_file(const std::string& path) {
  auto str = read_file(path);
  return str ? read_fundamentals_json(*str) : Fundamentals{};
}

std::vector<Headline> read_headlines_file(const std::string& path) {
  auto str = read_file(path);
  return str ? read_headlines_json(*str) : std::vector<Headline>{};
}
