#include "fund/quality.h"
#include "util/format.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

inline ValuationRow healthy_row(int year = 2023) {
  ValuationRow row;
  row.period_end = Date{std::chrono::year{year} / 12 / 31};
  row.net_income = 100.0;
  row.roe = 20.0;
  row.profit_margin = 15.0;
  row.debt_to_equity = 0.3;
  row.pe = 15.0;
  row.pb = 2.0;
  row.ps = 3.0;
  return row;
}

inline bool fails_on(const ValuationRow& row, QualityCriterion c) {
  auto failed = failed_criteria(row);
  return std::find(failed.begin(), failed.end(), c) != failed.end();
}

TEST_CASE("A healthy year passes without P/FCF", "[quality]") {
  auto row = healthy_row();

  CHECK_FALSE(row.pfcf.has_value());
  CHECK(failed_criteria(row).empty());
  CHECK(passes(row));
}

TEST_CASE("A high P/E fails the year", "[quality]") {
  auto row = healthy_row();
  row.pe = 25.0;

  auto failed = failed_criteria(row);
  REQUIRE(failed.size() == 1);
  CHECK(failed[0] == QualityCriterion::PriceEarnings);
  CHECK_FALSE(passes(row));
}

TEST_CASE("P/FCF is only checked when present", "[quality]") {
  auto row = healthy_row();

  row.pfcf = 19.0;
  CHECK(passes(row));

  row.pfcf = 25.0;
  CHECK(fails_on(row, QualityCriterion::PriceFreeCashFlow));
}

TEST_CASE("Missing figures fail their checks", "[quality]") {
  auto row = healthy_row();
  row.roe.reset();
  row.pb.reset();

  auto failed = failed_criteria(row);
  CHECK(failed.size() == 2);
  CHECK(fails_on(row, QualityCriterion::Roe));
  CHECK(fails_on(row, QualityCriterion::PriceBook));
}

TEST_CASE("Thresholds are strict", "[quality]") {
  auto row = healthy_row();
  row.net_income = 0.0;
  row.roe = 15.0;
  row.profit_margin = 10.0;
  row.debt_to_equity = 0.5;
  row.pe = 20.0;
  row.pb = 3.0;
  row.ps = 4.0;
  row.pfcf = 20.0;

  CHECK(failed_criteria(row).size() == 8);
}

TEST_CASE("Custom thresholds", "[quality]") {
  QualityConfig cfg;
  cfg.max_pe = 30.0;

  auto row = healthy_row();
  row.pe = 25.0;

  CHECK(passes(row, cfg));
  CHECK_FALSE(passes(row));
}

TEST_CASE("Verdict over no periods is insufficient data", "[quality]") {
  QualityVerdict verdict{std::vector<ValuationRow>{}};

  CHECK(verdict.status == VerdictStatus::InsufficientData);
  CHECK(verdict.insufficient());
  CHECK_FALSE(verdict.overall_pass());
  CHECK(verdict.periods_evaluated == 0);
  CHECK(interpret(verdict).summary.empty());
}

TEST_CASE("Verdict needs 60 percent of periods passing", "[quality]") {
  std::vector<ValuationRow> rows;
  for (int y = 2023; y > 2018; y--)
    rows.push_back(healthy_row(y));

  rows[3].pe = 25.0;
  rows[4].roe = 5.0;
  QualityVerdict three{rows};

  CHECK(three.periods_evaluated == 5);
  CHECK(three.periods_passing == 3);
  CHECK(three.status == VerdictStatus::Pass);
  CHECK(three.periods.size() == 5);
  CHECK_FALSE(three.periods[3].passes());

  rows[2].debt_to_equity = 2.0;
  QualityVerdict two{rows};

  CHECK(two.periods_passing == 2);
  CHECK(two.status == VerdictStatus::Fail);
}

TEST_CASE("All periods failing is a fail, not missing data", "[quality]") {
  std::vector<ValuationRow> rows(3);

  QualityVerdict verdict{rows};

  CHECK(verdict.periods_evaluated == 3);
  CHECK(verdict.periods_passing == 0);
  CHECK(verdict.status == VerdictStatus::Fail);
  CHECK_FALSE(verdict.insufficient());
}

TEST_CASE("Interpretation of a passing verdict", "[quality]") {
  std::vector<ValuationRow> rows{healthy_row(2023), healthy_row(2022)};
  auto interp = interpret(QualityVerdict{rows});

  CHECK(interp.summary.find("2 out of 2 years") != std::string::npos);
  CHECK(interp.points.size() == 5);
  CHECK(interp.overall.find("strong fundamentals") != std::string::npos);
}

TEST_CASE("Interpretation of a failing verdict", "[quality]") {
  std::vector<ValuationRow> rows(2);
  auto interp = interpret(QualityVerdict{rows});

  CHECK(interp.summary.find("0 out of 2 years") != std::string::npos);
  CHECK(interp.overall.find("weaknesses") != std::string::npos);
}

TEST_CASE("Criteria names", "[quality]") {
  std::vector<QualityCriterion> failed{QualityCriterion::Roe,
                                       QualityCriterion::PriceEarnings};
  CHECK(join(failed.begin(), failed.end()) == "ROE, P/E");
}
