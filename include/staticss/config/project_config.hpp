#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"

namespace staticss::config {

inline constexpr std::string_view kConfigFileName = "staticss.toml";

struct ThemeConfig {
  // Theme path a.b resolves to `<object>.a.b`.
  std::string object;
  // Module the object is imported from; no import when empty.
  std::string import_from;
  // Explicit path -> expression overrides.
  std::vector<std::pair<std::string, std::string>> paths;
};

struct AdapterConfig {
  std::optional<ThemeConfig> theme;
  // CSS custom property -> expression.
  std::vector<std::pair<std::string, std::string>> css_variables;
  // Callee -> expression pattern; `{0}` is the first literal argument.
  std::vector<std::pair<std::string, std::string>> calls;
};

struct ProjectConfig {
  std::string name;
  std::vector<std::string> files;
  AdapterConfig adapter;

  // Directory where staticss.toml was found
  std::filesystem::path root_dir;
};

// Search for staticss.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse staticss.toml file
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// Parses configuration text. `source_name` prefixes messages; relative file
// paths are resolved against `root_dir`.
auto ParseConfig(
    std::string_view text, std::string_view source_name,
    const std::filesystem::path& root_dir) -> Result<ProjectConfig>;

// Commented configuration written by `staticss init`.
auto TemplateConfig(std::string_view project_name) -> std::string;

}  // namespace staticss::config
