// File: include/cogsim/core/util/json_text.hpp
#pragma once

#include <string>

namespace cogsim {

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string json_escape(const std::string& s);

// "\"" + json_escape(s) + "\""
std::string json_quote(const std::string& s);

// Fixed-point text with `decimals` digits ("0.85", "1420.0").
std::string format_fixed(double v, int decimals);

}  // namespace cogsim
