#pragma once

#include "fund/valuation.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <string>
#include <vector>

std::vector<QualityCriterion> failed_criteria(
    const ValuationRow& row,
    const QualityConfig& cfg = config.quality_config) noexcept;

inline bool passes(const ValuationRow& row,
                   const QualityConfig& cfg = config.quality_config) {
  return failed_criteria(row, cfg).empty();
}

struct PeriodScore {
  Date period_end;
  std::vector<QualityCriterion> failed;

  bool passes() const { return failed.empty(); }
};

struct QualityVerdict {
  size_t periods_evaluated = 0;
  size_t periods_passing = 0;
  VerdictStatus status = VerdictStatus::InsufficientData;

  std::vector<PeriodScore> periods;

  QualityVerdict() = default;
  QualityVerdict(const std::vector<ValuationRow>& rows,
                 const QualityConfig& cfg = config.quality_config) noexcept;

  bool insufficient() const {
    return status == VerdictStatus::InsufficientData;
  }
  bool overall_pass() const { return status == VerdictStatus::Pass; }
};

struct Interpretation {
  std::string summary;
  std::vector<std::string> points;
  std::string overall;
};

// Narrative for the verdict; empty summary when there is nothing to say.
Interpretation interpret(const QualityVerdict& verdict,
                         const QualityConfig& cfg = config.quality_config);
