#pragma once

#include "util/math.h"
#include "util/times.h"

#include <vector>

// One reported fiscal year. Every figure may be absent.
struct FinancialPeriod {
  Date period_end;

  Value net_income;
  Value total_debt;
  Value total_equity;
  Value total_revenue;
  Value cash_from_ops;
  Value capital_expenditures;  // usually negative in source data

  Value shares_outstanding;
  Value period_close_price;  // first close at or after period_end
};

// Point-in-time quote fields, passed through unmodified.
struct QuoteSnapshot {
  Value market_cap;
  Value trailing_pe;
  Value trailing_eps;
  Value dividend_yield;
  Value fifty_two_week_high;
  Value fifty_two_week_low;
};

struct Fundamentals {
  Value shares_outstanding;
  QuoteSnapshot quote;
  std::vector<FinancialPeriod> statements;
};
