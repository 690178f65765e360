#pragma once

#include "fund/financials.h"
#include "ind/bar.h"
#include "sig/sentiment.h"

#include <optional>
#include <string>
#include <vector>

// Readers for collaborator output. Parse errors are logged and yield an
// empty result; bars out of date order are dropped.

PriceSeries read_bars_json(const std::string& str);
Fundamentals read_fundamentals_json(const std::string& str);
std::vector<Headline> read_headlines_json(const std::string& str);

PriceSeries read_bars_file(const std::string& path);
Fundamentals read_fundamentals_file(const std::string& path);
std::vector<Headline> read_headlines_file(const std::string& path);

std::optional<std::string> read_file(const std::string& path);
