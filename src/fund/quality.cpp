#include "fund/quality.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <format>

std::vector<QualityCriterion> failed_criteria(
    const ValuationRow& row,
    const QualityConfig& cfg) noexcept {
  std::vector<QualityCriterion> failed;

  // an empty field fails its check, except P/FCF
  auto check = [&failed](QualityCriterion c, bool ok) {
    if (!ok)
      failed.push_back(c);
  };

  check(QualityCriterion::NetIncome,
        row.net_income && *row.net_income > cfg.min_net_income);
  check(QualityCriterion::Roe, row.roe && *row.roe > cfg.min_roe);
  check(QualityCriterion::ProfitMargin,
        row.profit_margin && *row.profit_margin > cfg.min_profit_margin);
  check(QualityCriterion::DebtToEquity,
        row.debt_to_equity && *row.debt_to_equity < cfg.max_debt_to_equity);
  check(QualityCriterion::PriceEarnings, row.pe && *row.pe < cfg.max_pe);
  check(QualityCriterion::PriceBook, row.pb && *row.pb < cfg.max_pb);
  check(QualityCriterion::PriceSales, row.ps && *row.ps < cfg.max_ps);
  check(QualityCriterion::PriceFreeCashFlow,
        !row.pfcf || *row.pfcf < cfg.max_pfcf);

  return failed;
}

QualityVerdict::QualityVerdict(const std::vector<ValuationRow>& rows,
                               const QualityConfig& cfg) noexcept
    : periods_evaluated{rows.size()} {
  for (auto& row : rows) {
    auto& score =
        periods.emplace_back(row.period_end, failed_criteria(row, cfg));
    if (score.passes())
      periods_passing++;

    spdlog::debug("[fund] {}: {}", date_to_string(row.period_end),
                  score.passes() ? "pass"
                                 : "fails " + join(score.failed.begin(),
                                                   score.failed.end()));
  }

  if (periods_evaluated == 0)
    status = VerdictStatus::InsufficientData;
  else if (periods_passing >= cfg.pass_ratio * periods_evaluated)
    status = VerdictStatus::Pass;
  else
    status = VerdictStatus::Fail;
}

Interpretation interpret(const QualityVerdict& verdict,
                         const QualityConfig& cfg) {
  Interpretation res;
  if (verdict.insufficient())
    return res;

  bool good = verdict.overall_pass();
  auto pick = [good](const char* pos, const char* neg) {
    return good ? pos : neg;
  };

  res.summary = std::format(
      "{} out of {} years met Buffett-style criteria for strong financial "
      "health and valuation.",
      verdict.periods_passing, verdict.periods_evaluated);

  res.points = {
      std::format("Net Income: the company has {} net income trends.",
                  pick("mostly positive", "variable or negative")),
      std::format("Return on Equity (ROE): {} ROE performance (target >{}%).",
                  pick("strong", "inconsistent"), cfg.min_roe),
      std::format("Profit Margin: profit margins are {} (target >{}%).",
                  pick("healthy", "below ideal"), cfg.min_profit_margin),
      std::format("Debt/Equity: {} debt level relative to equity "
                  "(target <{}).",
                  pick("low", "relatively high"), cfg.max_debt_to_equity),
      std::format("Valuation Ratios (P/E, P/B, P/S, P/FCF): valuation is {}.",
                  pick("attractive", "mixed or high")),
  };

  res.overall = std::format(
      "The company has {} over the last {} years.",
      pick("strong fundamentals and valuation", "some weaknesses or risks"),
      verdict.periods_evaluated);

  return res;
}
