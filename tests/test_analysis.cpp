#include "bars.h"
#include "core/analysis.h"
#include "core/report.h"
#include "util/format.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;

// Slow decline, then a rally whose last bar lifts SMA50 over SMA200.
inline PriceSeries golden_cross_bars() {
  auto xs = linear(300, -0.5, 240);
  for (int j = 1; j <= 38; j++)
    xs.push_back(180 + 3.0 * j);
  return flat_bars(xs);
}

inline FinancialPeriod statement(int year, double net_income) {
  FinancialPeriod p;
  p.period_end = Date{std::chrono::year{year} / 6 / 30};
  p.net_income = net_income;
  p.total_debt = 100.0;
  p.total_equity = 1000.0;
  p.total_revenue = 2000.0;
  p.cash_from_ops = 300.0;
  p.capital_expenditures = -100.0;
  return p;
}

inline AnalysisInput sample_input() {
  AnalysisInput input;
  input.symbol = "ACME";
  input.bars = golden_cross_bars();
  input.fundamentals.shares_outstanding = 1000.0;
  input.fundamentals.quote.trailing_pe = 12.0;
  input.fundamentals.statements = {statement(2023, 250.0),
                                   statement(2022, 200.0)};
  input.headlines = {
      {"Record revenue", "https://example.com/a", 0.5},
      {"New product line", "https://example.com/b", 0.1},
  };
  return input;
}

TEST_CASE("Price movement over the whole history", "[analysis]") {
  auto movement = price_movement(flat_bars(linear(100, 1, 51)));

  REQUIRE(movement.has_value());
  CHECK(movement->start_price == 100.0);
  CHECK(movement->end_price == 150.0);
  CHECK(*movement->change_pct == Approx(50.0));
  CHECK(movement->significant_growth);

  auto flat = price_movement(flat_bars(linear(100, 0.1, 51)));
  CHECK_FALSE(flat->significant_growth);

  CHECK_FALSE(price_movement({}).has_value());
}

TEST_CASE("Analysis composes every stage", "[analysis]") {
  Config cfg;
  Analysis a{sample_input(), cfg};

  CHECK(a.symbol == "ACME");
  CHECK(a.ind.size() == 278);
  CHECK(a.crossover.cross_type == CrossType::GoldenCross);

  REQUIRE(a.periods.size() == 2);
  CHECK(date_to_string(a.periods[0].period_end) == "2023-06-30");
  CHECK(*a.periods[0].shares_outstanding == 1000.0);
  REQUIRE(a.periods[0].period_close_price.has_value());

  // period before the first bar takes the first close
  CHECK(*a.periods[1].period_close_price == 300.0);

  REQUIRE(a.valuation.size() == 2);
  CHECK(*a.valuation[1].roe == Approx(20.0));
  CHECK(*a.valuation[1].pe == Approx(1500.0));

  CHECK(a.verdict.periods_evaluated == 2);
  CHECK(a.verdict.status == VerdictStatus::Fail);

  CHECK(a.sentiment.n_headlines == 2);
  CHECK(*a.sentiment.average == Approx(0.3));
  CHECK(a.sentiment.label == SentimentLabel::Positive);

  CHECK(a.recommendation.technical == technical_signal(a.crossover));
  CHECK(a.recommendation.technical == TechnicalSignal::Buy);
  CHECK(a.recommendation.overall == Overall::Buy);
  CHECK(a.recommendation.suggest_calls);

  REQUIRE(a.movement.has_value());
  CHECK(a.movement->start_price == 300.0);
}

TEST_CASE("Analysis without fundamentals or news", "[analysis]") {
  AnalysisInput input;
  input.symbol = "ACME";
  input.bars = flat_bars(linear(100, 1, 30));

  Analysis a{std::move(input), Config{}};

  CHECK(a.verdict.insufficient());
  CHECK(a.valuation.empty());
  CHECK_FALSE(a.sentiment.has_headlines());
  CHECK(a.crossover.cross_type == CrossType::None);
  CHECK(a.recommendation.overall == Overall::HoldWait);

  auto text = render_text(a);
  CHECK(text.find("Insufficient data to analyze.") != std::string::npos);
  CHECK(text.find("No news sentiment data available.") != std::string::npos);
  CHECK(text.find("Overall Recommendation: HOLD/WAIT") != std::string::npos);
}

TEST_CASE("Analysis of an empty price history", "[analysis]") {
  AnalysisInput input;
  input.symbol = "NONE";

  Analysis a{std::move(input), Config{}};

  CHECK(a.ind.empty());
  CHECK_FALSE(a.movement.has_value());
  CHECK(a.recommendation.technical == TechnicalSignal::Hold);

  auto text = render_text(a);
  CHECK(text.find("No price data.") != std::string::npos);

  auto j = to_json(a);
  CHECK_FALSE(j["technical"].contains("close"));
  CHECK_FALSE(j.contains("price_movement"));
}

TEST_CASE("Text report sections", "[report]") {
  Analysis a{sample_input(), Config{}};
  auto text = render_text(a);

  CHECK(text.find("== ACME ==") != std::string::npos);
  CHECK(text.find("Golden/Death Cross: Golden Cross") != std::string::npos);
  CHECK(text.find("Financials + Valuation Ratios") != std::string::npos);
  CHECK(text.find("1. Record revenue") != std::string::npos);
  CHECK(text.find("PE Ratio suggests the stock might be undervalued.") !=
        std::string::npos);
  CHECK(text.find("Overall Recommendation: BUY") != std::string::npos);
  CHECK(text.find("good time to consider buying call options") !=
        std::string::npos);
}

TEST_CASE("Json report", "[report]") {
  Analysis a{sample_input(), Config{}};
  auto j = to_json(a);

  CHECK(j["symbol"] == "ACME");
  CHECK(j["technical"]["cross_type"] == "Golden Cross");
  CHECK(j["technical"]["sma200"].is_number());
  CHECK(j["valuation"].size() == 2);
  CHECK(j["verdict"]["status"] == "fail");
  CHECK(j["sentiment"]["label"] == "Positive");
  CHECK(j["recommendation"]["overall"] == "BUY");
  CHECK(j["recommendation"]["suggest_calls"] == true);
}

TEST_CASE("Report number formatting", "[report]") {
  CHECK(fmt_currency(1234567.4) == "$1,234,567");
  CHECK(fmt_currency(999.0) == "$999");
  CHECK(fmt_currency(std::nullopt) == "n/a");
  CHECK(fmt_percent(12.5) == "12.50%");
  CHECK(fmt_float(std::nullopt, "-") == "-");
  CHECK(group_thousands(-1000) == "-1,000");
}

TEST_CASE("Bar description", "[report]") {
  auto bars = flat_bars({1.5});
  CHECK(to_str(bars[0]) == "2023-01-02 1.50 1.50 1.50 1.50 1000");
}
