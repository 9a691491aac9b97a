#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace reverie::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Numeric lookups; unparsable values fall back with a warning.
double get_env_double(const std::string& key, double fallback);
long long get_env_int(const std::string& key, long long fallback);

} // namespace reverie::core::config
