#include "core/analysis.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

Analysis::Analysis(AnalysisInput&& input, const Config& cfg) noexcept
    : symbol{std::move(input.symbol)},
      quote{input.fundamentals.quote},
      headlines(std::move(input.headlines)),
      movement{price_movement(input.bars, cfg.sig_config)},
      ind{std::move(input.bars), cfg.ind_config},
      crossover{ind, cfg.ind_config},
      periods(build_periods(std::move(input.fundamentals.statements),
                            ind.bars(),
                            input.fundamentals.shares_outstanding,
                            cfg.quality_config.max_periods)),
      valuation(valuation_table(periods)),
      verdict{valuation, cfg.quality_config},
      sentiment{headlines, cfg.sig_config},
      recommendation{crossover, sentiment, quote, cfg.sig_config}  //
{
  spdlog::info("[analysis] {}: {} bars, {} periods ({}), {} headlines ({})",
               symbol, ind.size(), verdict.periods_evaluated,
               to_str(verdict.status), sentiment.n_headlines,
               to_str(sentiment.label));
  spdlog::info("[analysis] {}: cross {}, macd {}, technical {}, overall {}",
               symbol, to_str(crossover.cross_type),
               to_str(crossover.macd_cross),
               to_str(recommendation.technical),
               to_str(recommendation.overall));
}
