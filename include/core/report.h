#pragma once

#include "core/analysis.h"

#include <nlohmann/json.hpp>
#include <string>

std::string render_text(const Analysis& a);

nlohmann::json to_json(const Analysis& a);
bool write_json(const Analysis& a, const std::string& path);
