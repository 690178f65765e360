#include "core/report.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <format>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

inline json to_json(Value v) {
  return v ? json(*v) : json(nullptr);
}

inline std::string last_value(const Series& s) {
  return s.empty() ? NA : fmt_float(s.back());
}

inline void render_technical(std::ostringstream& out, const Analysis& a) {
  out << "Technical Indicator Summary\n";
  out << std::format("  Golden/Death Cross: {}\n",
                     to_str(a.crossover.cross_type));
  out << std::format("  MACD Signal: {}\n",
                     a.crossover.macd_cross == MacdCross::None
                         ? "No recent crossover"
                         : to_str(a.crossover.macd_cross));

  if (a.ind.empty()) {
    out << "  No price data.\n\n";
    return;
  }

  out << std::format("  Close: {:.2f} on {}\n", a.ind.close(-1),
                     date_to_string(a.ind.date(-1)));
  out << std::format("  RSI: {}\n", last_value(a.ind.rsi_series()));
  out << std::format("  Stochastic %K: {}, %D: {}\n",
                     last_value(a.ind.stoch_k_series()),
                     last_value(a.ind.stoch_d_series()));
  out << std::format("  MACD: {:.4f}, Signal: {:.4f}\n", a.ind.macd(-1),
                     a.ind.macd_signal(-1));
  out << std::format("  SMA50: {}, SMA200: {}\n\n",
                     last_value(a.ind.sma_short_series()),
                     last_value(a.ind.sma_long_series()));
}

inline void render_quote(std::ostringstream& out, const QuoteSnapshot& q) {
  out << "Fundamental Data\n";
  out << std::format("  Market Cap: {}\n", fmt_currency(q.market_cap));
  out << std::format("  PE Ratio: {}\n", fmt_float(q.trailing_pe));
  out << std::format("  EPS: {}\n", fmt_float(q.trailing_eps));
  out << std::format("  Dividend Yield: {}\n", fmt_float(q.dividend_yield));
  out << std::format("  52 Week High: {}\n", fmt_float(q.fifty_two_week_high));
  out << std::format("  52 Week Low: {}\n\n", fmt_float(q.fifty_two_week_low));
}

inline void render_valuation(std::ostringstream& out, const Analysis& a) {
  out << std::format("{} Financials + Valuation Ratios (Last {} Years)\n",
                     a.symbol, a.valuation.size());

  out << std::format(
      "  {:<6} {:>18} {:>18} {:>18} {:>18} {:>9} {:>7} {:>8} {:>7} {:>7} "
      "{:>7} {:>7}\n",
      "Year", "Net Income", "Total Debt", "Equity", "Free Cash Flow", "ROE",
      "D/E", "Margin", "P/E", "P/B", "P/S", "P/FCF");

  for (auto& row : a.valuation) {
    out << std::format(
        "  {:<6} {:>18} {:>18} {:>18} {:>18} {:>9} {:>7} {:>8} {:>7} {:>7} "
        "{:>7} {:>7}\n",
        year_of(row.period_end), fmt_currency(row.net_income),
        fmt_currency(row.total_debt), fmt_currency(row.total_equity),
        fmt_currency(row.free_cash_flow), fmt_percent(row.roe),
        fmt_float(row.debt_to_equity), fmt_percent(row.profit_margin),
        fmt_float(row.pe), fmt_float(row.pb), fmt_float(row.ps),
        fmt_float(row.pfcf));
  }
  out << "\n";
}

inline void render_verdict(std::ostringstream& out, const Analysis& a) {
  auto& v = a.verdict;

  if (v.insufficient()) {
    out << "Insufficient data to analyze.\n\n";
    return;
  }

  if (v.overall_pass())
    out << std::format(
        "{} has performed well in the last {} years based on Buffett's "
        "criteria.\n",
        a.symbol, v.periods_evaluated);
  else
    out << std::format(
        "{} shows mixed or weak performance in the last {} years.\n",
        a.symbol, v.periods_evaluated);

  for (auto& p : v.periods) {
    if (!p.passes())
      out << std::format("  {}: fails {}\n", year_of(p.period_end),
                         join(p.failed.begin(), p.failed.end()));
  }

  auto interp = interpret(v);
  out << "\nInterpretation\n";
  out << "  " << interp.summary << "\n";
  for (auto& point : interp.points)
    out << "  - " << point << "\n";
  out << "  Overall: " << interp.overall << "\n\n";
}

inline void render_movement(std::ostringstream& out, const Analysis& a) {
  out << "Price Movement\n";
  if (!a.movement) {
    out << "  No price data available.\n\n";
    return;
  }

  auto& m = *a.movement;
  out << std::format("  Starting Price ({}): ${:.2f}\n",
                     date_to_string(m.from), m.start_price);
  out << std::format("  Current Price ({}): ${:.2f}\n", date_to_string(m.to),
                     m.end_price);
  out << std::format("  Total Change: {}\n", fmt_percent(m.change_pct));
  out << (m.significant_growth
              ? "  The stock has shown significant growth over the period.\n\n"
              : "  The stock has shown limited growth or decline over the "
                "period.\n\n");
}

inline void render_sentiment(std::ostringstream& out, const Analysis& a) {
  out << "News Sentiment Analysis\n";
  for (size_t i = 0; i < a.headlines.size(); i++)
    out << std::format("  {}. {} ({})\n", i + 1, a.headlines[i].title,
                       a.headlines[i].url);

  if (a.sentiment.has_headlines())
    out << std::format("  Sentiment: {} (Average polarity score: {:.2f})\n\n",
                       to_str(a.sentiment.label), *a.sentiment.average);
  else
    out << "  No news sentiment data available.\n\n";
}

inline void render_summary(std::ostringstream& out, const Analysis& a) {
  auto& r = a.recommendation;

  out << "Summary Dashboard\n";
  out << "  Fundamental Analysis\n";
  for (auto& msg : r.fundamental_msgs)
    out << "    - " << msg << "\n";

  out << "  Qualitative Analysis (News Sentiment)\n";
  out << "    " << r.sentiment_msg << "\n";

  out << "  Technical Analysis\n";
  out << std::format("    Technical analysis suggests: {}.\n",
                     to_str(r.technical));
  for (auto& note : r.notes)
    out << "    - " << note << "\n";

  out << std::format("\nOverall Recommendation: {}\n", to_str(r.overall));
  out << (r.suggest_calls
              ? "Option Trading Suggestion: good time to consider buying call "
                "options based on bullish technical signals and positive "
                "news sentiment.\n"
              : "Option Trading Suggestion: not a strong signal to buy call "
                "options at this time.\n");
}

std::string render_text(const Analysis& a) {
  std::ostringstream out;

  out << std::format("== {} ==\n\n", a.symbol);
  render_technical(out, a);
  render_quote(out, a.quote);
  render_valuation(out, a);
  render_verdict(out, a);
  render_movement(out, a);
  render_sentiment(out, a);
  render_summary(out, a);

  return out.str();
}

json to_json(const Analysis& a) {
  json j;
  j["symbol"] = a.symbol;

  json tech = json::object();
  tech["cross_type"] = to_str(a.crossover.cross_type);
  tech["macd_crossover"] = to_str(a.crossover.macd_cross);
  if (!a.ind.empty()) {
    tech["date"] = date_to_string(a.ind.date(-1));
    tech["close"] = a.ind.close(-1);
    tech["rsi"] = to_json(a.ind.rsi(-1));
    tech["macd"] = a.ind.macd(-1);
    tech["signal"] = a.ind.macd_signal(-1);
    tech["stoch_k"] = to_json(a.ind.stoch_k(-1));
    tech["stoch_d"] = to_json(a.ind.stoch_d(-1));
    tech["sma50"] = to_json(a.ind.sma_short(-1));
    tech["sma200"] = to_json(a.ind.sma_long(-1));
  }
  j["technical"] = tech;

  json rows = json::array();
  for (auto& row : a.valuation) {
    rows.push_back({
        {"period_end", date_to_string(row.period_end)},
        {"net_income", to_json(row.net_income)},
        {"total_debt", to_json(row.total_debt)},
        {"total_equity", to_json(row.total_equity)},
        {"free_cash_flow", to_json(row.free_cash_flow)},
        {"market_cap", to_json(row.market_cap)},
        {"roe", to_json(row.roe)},
        {"debt_to_equity", to_json(row.debt_to_equity)},
        {"profit_margin", to_json(row.profit_margin)},
        {"pe", to_json(row.pe)},
        {"pb", to_json(row.pb)},
        {"ps", to_json(row.ps)},
        {"pfcf", to_json(row.pfcf)},
    });
  }
  j["valuation"] = rows;

  j["verdict"] = {
      {"status", to_str(a.verdict.status)},
      {"periods_evaluated", a.verdict.periods_evaluated},
      {"periods_passing", a.verdict.periods_passing},
  };

  j["sentiment"] = {
      {"average", to_json(a.sentiment.average)},
      {"label", to_str(a.sentiment.label)},
      {"headlines", a.sentiment.n_headlines},
  };

  j["recommendation"] = {
      {"technical", to_str(a.recommendation.technical)},
      {"overall", to_str(a.recommendation.overall)},
      {"notes", a.recommendation.notes},
      {"suggest_calls", a.recommendation.suggest_calls},
  };

  if (a.movement)
    j["price_movement"] = {
        {"start", a.movement->start_price},
        {"end", a.movement->end_price},
        {"change_pct", to_json(a.movement->change_pct)},
    };

  return j;
}

bool write_json(const Analysis& a, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[report] couldn't open {}", path);
    return false;
  }

  file << to_json(a).dump(2) << '\n';
  spdlog::info("[report] wrote {}", path);
  return true;
}
