#pragma once

#include "fund/financials.h"
#include "fund/quality.h"
#include "fund/valuation.h"
#include "ind/crossover.h"
#include "ind/indicators.h"
#include "ind/price_movement.h"
#include "sig/recommendation.h"
#include "sig/sentiment.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <vector>

struct AnalysisInput {
  std::string symbol;
  PriceSeries bars;
  Fundamentals fundamentals;
  std::vector<Headline> headlines;
};

// Everything derived for one symbol. Built once, never mutated.
struct Analysis {
  std::string symbol;
  QuoteSnapshot quote;
  std::vector<Headline> headlines;

  std::optional<PriceMovement> movement;
  Indicators ind;
  Crossover crossover;

  std::vector<FinancialPeriod> periods;
  std::vector<ValuationRow> valuation;
  QualityVerdict verdict;

  Sentiment sentiment;
  Recommendation recommendation;

  Analysis(AnalysisInput&& input, const Config& cfg = config) noexcept;

  Analysis(const Analysis&) = delete;
  Analysis& operator=(const Analysis&) = delete;

  Analysis(Analysis&&) = default;
  Analysis& operator=(Analysis&&) = default;
};
