#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);
int get_env_int(const std::string& name, int default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);

// Hex encoding of binary buffers
std::string to_hex(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

// True for a plain decimal integer string with a nonzero value ("0012" yes, "0", "-5", "" no)
bool is_positive_integer_string(const std::string& value);

// Time utilities
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
