#pragma once

#include <json/json.h>

#include <optional>
#include <string>

namespace castd {

// Single-line JSON, no trailing newline.
std::string write_compact(const Json::Value& value);

std::optional<Json::Value> parse_json(const std::string& text);

}  // namespace castd
