#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace f1s {

std::string trim(std::string s);
std::string strip_quotes(const std::string& s);
std::string upper(std::string s);

// Simple CSV: no quoted fields. Fields are trimmed.
std::vector<std::string> split_csv_line(const std::string& line);

// Whole-string numeric parsing; nullopt on junk or trailing characters.
std::optional<double> to_double(const std::string& s);
std::optional<long> to_long(const std::string& s);

// Replace every "{name}" with vars[name]; unknown placeholders are kept.
std::string render_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& vars);

// Fixed-point formatting used in templated messages ("1.25").
std::string format_fixed(double v, int decimals);

} // namespace f1s
