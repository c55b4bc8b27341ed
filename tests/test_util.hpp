#pragma once
#include <filesystem>
#include <string>
#include <unistd.h>

// Empty per-process scratch directory under the system temp dir
inline std::string fresh_dir(const std::string& name) {
  namespace fs = std::filesystem;
  auto p = fs::temp_directory_path() / ("mdvault_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p.string();
}
