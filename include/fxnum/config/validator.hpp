#pragma once

#include <string>
#include <vector>

namespace fxnum::config {

// Upper bound on any configured resolution or integer width
constexpr unsigned kMaxBits = 1u << 16;

// Demo names in their default running order
const std::vector<std::string>& known_demos();

bool is_known_demo(const std::string& name, std::string& err);

// Non-empty list of values in [1, kMaxBits]
bool validate_bit_list(const std::vector<unsigned>& values, const std::string& key, std::string& err);

// Text helpers shared by the key=value and environment readers
bool parse_unsigned(const std::string& text, unsigned& out, std::string& err);
bool parse_unsigned_list(const std::string& text, std::vector<unsigned>& out, std::string& err);
bool parse_positive_double(const std::string& text, double& out, std::string& err);
std::vector<std::string> split_list(const std::string& text);

} // namespace fxnum::config
