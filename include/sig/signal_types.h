#pragma once

enum class CrossType {
  None,
  GoldenCross,  // short SMA crosses above long SMA
  DeathCross,   // short SMA crosses below long SMA
};

enum class MacdCross {
  None,
  Bullish,  // MACD crosses above its signal line
  Bearish,  // MACD crosses below its signal line
};

enum class TechnicalSignal { Hold, Buy, Sell };

enum class Overall { HoldWait, Buy };

enum class SentimentLabel {
  NoHeadlines,
  Positive,
  Neutral,
  Negative,
};

enum class VerdictStatus {
  InsufficientData,  // no period could be evaluated
  Pass,
  Fail,
};

enum class QualityCriterion {
  NetIncome,
  Roe,
  ProfitMargin,
  DebtToEquity,
  PriceEarnings,
  PriceBook,
  PriceSales,
  PriceFreeCashFlow,
};
