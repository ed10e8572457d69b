#pragma once
#include <string>
#include <vector>

namespace util {

void setup_logging(const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string read_secret(const std::string& file_env, const std::string& value_env);
size_t load_env_file(const std::string& path);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool iequals(const std::string& a, const std::string& b);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

}
