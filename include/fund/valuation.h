#pragma once

#include "fund/financials.h"
#include "ind/bar.h"
#include "util/math.h"

#include <vector>

// Ratios derived from one FinancialPeriod. A missing operand or a zero
// denominator leaves the affected field empty, nothing else.
struct ValuationRow {
  Date period_end;

  Value net_income;
  Value total_debt;
  Value total_equity;

  Value free_cash_flow;
  Value market_cap;

  Value roe;            // percent
  Value debt_to_equity;
  Value profit_margin;  // percent

  Value pe;
  Value pb;
  Value ps;
  Value pfcf;

  ValuationRow() = default;
  explicit ValuationRow(const FinancialPeriod& p) noexcept;

  size_t n_missing() const;
};

std::vector<ValuationRow> valuation_table(
    const std::vector<FinancialPeriod>& periods) noexcept;

Value period_close_price(const PriceSeries& bars, Date period_end) noexcept;

// Newest first, at most `max_periods`, with close price and share count
// filled in where the statement has none.
std::vector<FinancialPeriod> build_periods(
    std::vector<FinancialPeriod> statements,
    const PriceSeries& bars,
    Value shares_outstanding,
    size_t max_periods) noexcept;
