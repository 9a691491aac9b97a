#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace reverie::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Common search roots for project-relative files (.env lookup).
std::vector<std::filesystem::path> project_search_paths();

// Create the directory (and parents) if missing. Returns false on failure.
bool ensure_dir(const std::filesystem::path& dir);

} // namespace reverie::core::paths
