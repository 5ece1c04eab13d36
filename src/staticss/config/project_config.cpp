#include "staticss/config/project_config.hpp"

#include <expected>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "staticss/common/diagnostic/diagnostic.hpp"

namespace staticss::config {

namespace fs = std::filesystem;

namespace {

class ConfigReader {
 public:
  ConfigReader(std::string_view source_name, fs::path root_dir)
      : source_name_(source_name), root_dir_(std::move(root_dir)) {
  }

  auto Read(const toml::table& tbl) -> Result<ProjectConfig> {
    ProjectConfig config;
    config.root_dir = root_dir_;

    if (auto err = CheckKeys(tbl, "", {"project", "adapter"})) {
      return std::unexpected(*err);
    }

    // [project] section (optional)
    if (const auto* project = tbl["project"].as_table()) {
      if (auto err = CheckKeys(*project, "project", {"name", "files"})) {
        return std::unexpected(*err);
      }
      if (auto node = (*project)["name"]) {
        auto name = node.value<std::string>();
        if (!name) {
          return std::unexpected(TypeError("project.name", "a string"));
        }
        config.name = *name;
      }
      if (auto node = (*project)["files"]) {
        const auto* files = node.as_array();
        if (files == nullptr) {
          return std::unexpected(TypeError("project.files", "an array"));
        }
        for (const auto& elem : *files) {
          auto str = elem.value<std::string>();
          if (!str) {
            return std::unexpected(
                TypeError("project.files", "an array of strings"));
          }
          // Resolve relative paths against config directory
          fs::path file_path = *str;
          if (file_path.is_relative()) {
            file_path = root_dir_ / file_path;
          }
          config.files.push_back(file_path.string());
        }
      }
    } else if (tbl.contains("project")) {
      return std::unexpected(TypeError("project", "a table"));
    }

    // [adapter] section (optional)
    if (const auto* adapter = tbl["adapter"].as_table()) {
      auto result = ReadAdapter(*adapter);
      if (!result) {
        return std::unexpected(result.error());
      }
      config.adapter = std::move(*result);
    } else if (tbl.contains("adapter")) {
      return std::unexpected(TypeError("adapter", "a table"));
    }

    return config;
  }

 private:
  auto ReadAdapter(const toml::table& adapter) -> Result<AdapterConfig> {
    AdapterConfig config;
    if (auto err = CheckKeys(
            adapter, "adapter", {"theme", "css_variables", "calls"})) {
      return std::unexpected(*err);
    }

    if (const auto* theme = adapter["theme"].as_table()) {
      if (auto err = CheckKeys(
              *theme, "adapter.theme", {"object", "import", "paths"})) {
        return std::unexpected(*err);
      }
      ThemeConfig theme_config;
      auto object = (*theme)["object"].value<std::string>();
      if (!object) {
        return std::unexpected(
            Error("missing required field 'adapter.theme.object'"));
      }
      theme_config.object = *object;
      if (auto node = (*theme)["import"]) {
        auto from = node.value<std::string>();
        if (!from) {
          return std::unexpected(
              TypeError("adapter.theme.import", "a string"));
        }
        theme_config.import_from = *from;
      }
      if (auto node = (*theme)["paths"]) {
        auto paths = ReadStringMap(node, "adapter.theme.paths");
        if (!paths) {
          return std::unexpected(paths.error());
        }
        theme_config.paths = std::move(*paths);
      }
      config.theme = std::move(theme_config);
    } else if (adapter.contains("theme")) {
      return std::unexpected(TypeError("adapter.theme", "a table"));
    }

    if (auto node = adapter["css_variables"]) {
      auto vars = ReadStringMap(node, "adapter.css_variables");
      if (!vars) {
        return std::unexpected(vars.error());
      }
      config.css_variables = std::move(*vars);
    }
    if (auto node = adapter["calls"]) {
      auto calls = ReadStringMap(node, "adapter.calls");
      if (!calls) {
        return std::unexpected(calls.error());
      }
      config.calls = std::move(*calls);
    }
    return config;
  }

  auto ReadStringMap(
      toml::node_view<const toml::node> node, std::string_view path)
      -> Result<std::vector<std::pair<std::string, std::string>>> {
    const auto* table = node.as_table();
    if (table == nullptr) {
      return std::unexpected(TypeError(path, "a table"));
    }
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& [key, value] : *table) {
      auto str = value.value<std::string>();
      if (!str) {
        return std::unexpected(TypeError(
            fmt::format("{}.\"{}\"", path, key.str()), "a string"));
      }
      entries.emplace_back(std::string(key.str()), *str);
    }
    return entries;
  }

  auto CheckKeys(
      const toml::table& table, std::string_view path,
      std::initializer_list<std::string_view> allowed) const
      -> std::optional<Diagnostic> {
    for (const auto& [key, value] : table) {
      bool known = false;
      for (auto name : allowed) {
        known = known || key.str() == name;
      }
      if (!known) {
        return Error(fmt::format(
            "unknown key '{}{}{}'", path, path.empty() ? "" : ".", key.str()));
      }
    }
    return std::nullopt;
  }

  auto TypeError(std::string_view path, std::string_view expected) const
      -> Diagnostic {
    return Error(fmt::format("'{}' must be {}", path, expected));
  }

  auto Error(std::string message) const -> Diagnostic {
    return Diagnostic::HostError(
        fmt::format("{}: {}", source_name_, message));
  }

  std::string source_name_;
  fs::path root_dir_;
};

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(
    std::string_view text, std::string_view source_name,
    const fs::path& root_dir) -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format(
            "failed to parse {}: {}", source_name, e.description())));
  }
  return ConfigReader(source_name, root_dir).Read(tbl);
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format(
            "failed to parse {}: {}", config_path.string(), e.description())));
  }
  return ConfigReader(config_path.string(), config_path.parent_path())
      .Read(tbl);
}

auto TemplateConfig(std::string_view project_name) -> std::string {
  return fmt::format(
      R"([project]
name = "{}"
# Files lowered when none are given on the command line.
files = []

# Theme access (props.theme.a.b) resolves to <object>.a.b.
# [adapter.theme]
# object = "themeVars"
# import = "./tokens.stylex"
#
# [adapter.theme.paths]
# "colors.primary" = "colorVars.primary"

# [adapter.css_variables]
# "--brand" = "vars.brand"

# Call resolution; {{0}} is the first literal argument.
# [adapter.calls]
# "transitionSpeed" = "transitionSpeedVars.{{0}}"
)",
      project_name);
}

}  // namespace staticss::config
