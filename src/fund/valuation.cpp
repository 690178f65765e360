#include "fund/valuation.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline Value sum(Value a, Value b) {
  return a && b ? finite_or_none(*a + *b) : std::nullopt;
}

inline Value product(Value a, Value b) {
  return a && b ? finite_or_none(*a * *b) : std::nullopt;
}

ValuationRow::ValuationRow(const FinancialPeriod& p) noexcept
    : period_end{p.period_end},
      net_income{p.net_income},
      total_debt{p.total_debt},
      total_equity{p.total_equity}  //
{
  auto price = p.period_close_price;
  auto shares = p.shares_outstanding;

  free_cash_flow = sum(p.cash_from_ops, p.capital_expenditures);
  market_cap = product(price, shares);

  roe = scaled(safe_div(p.net_income, p.total_equity), 100.0);
  debt_to_equity = safe_div(p.total_debt, p.total_equity);
  profit_margin = scaled(safe_div(p.net_income, p.total_revenue), 100.0);

  // price over a per-share figure; a zero per-share value leaves it empty
  auto per_share_ratio = [&](Value figure) {
    return safe_div(price, safe_div(figure, shares));
  };

  pe = per_share_ratio(p.net_income);
  pb = per_share_ratio(p.total_equity);
  ps = per_share_ratio(p.total_revenue);
  pfcf = per_share_ratio(free_cash_flow);
}

size_t ValuationRow::n_missing() const {
  size_t n = 0;
  for (auto* v : {&free_cash_flow, &market_cap, &roe, &debt_to_equity,
                  &profit_margin, &pe, &pb, &ps, &pfcf})
    n += !v->has_value();
  return n;
}

std::vector<ValuationRow> valuation_table(
    const std::vector<FinancialPeriod>& periods) noexcept {
  std::vector<ValuationRow> rows;
  rows.reserve(periods.size());

  for (auto& p : periods) {
    auto& row = rows.emplace_back(p);
    if (auto n = row.n_missing(); n > 0)
      spdlog::debug("[fund] {}: {} ratios without value",
                    date_to_string(p.period_end), n);
  }

  return rows;
}

Value period_close_price(const PriceSeries& bars, Date period_end) noexcept {
  auto it = std::lower_bound(
      bars.begin(), bars.end(), period_end,
      [](const Bar& bar, Date date) { return bar.date < date; });

  if (it == bars.end())
    return std::nullopt;
  return it->price();
}

std::vector<FinancialPeriod> build_periods(
    std::vector<FinancialPeriod> statements,
    const PriceSeries& bars,
    Value shares_outstanding,
    size_t max_periods) noexcept {
  std::sort(statements.begin(), statements.end(),
            [](auto& lhs, auto& rhs) { return lhs.period_end > rhs.period_end; });

  if (statements.size() > max_periods) {
    spdlog::debug("[fund] keeping {} of {} periods", max_periods,
                  statements.size());
    statements.resize(max_periods);
  }

  for (auto& p : statements) {
    if (!p.shares_outstanding)
      p.shares_outstanding = shares_outstanding;
    if (!p.period_close_price)
      p.period_close_price = period_close_price(bars, p.period_end);

    if (!p.period_close_price)
      spdlog::warn("[fund] {}: no close price at or after period end",
                   date_to_string(p.period_end));
  }

  return statements;
}
