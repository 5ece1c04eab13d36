#include "staticss/config/config_adapter.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "staticss/common/string_utils.hpp"
#include "staticss/lowering/adapter.hpp"

namespace staticss::config {

namespace {

auto Lookup(
    const std::vector<std::pair<std::string, std::string>>& entries,
    std::string_view key) -> const std::string* {
  for (const auto& [name, value] : entries) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

// Root identifier of a dotted expression ("themeVars.a" -> "themeVars").
auto RootName(std::string_view expr) -> std::string {
  size_t end = 0;
  while (end < expr.size() && common::IsIdentifierChar(expr[end])) {
    ++end;
  }
  return std::string(expr.substr(0, end));
}

// `a.b-c` -> `a["b-c"]` for segments that are not identifiers.
auto MemberAccess(std::string_view object, std::string_view path)
    -> std::string {
  std::string out(object);
  for (const auto& segment : common::SplitTopLevel(path, '.')) {
    if (common::IsIdentifier(segment)) {
      out += "." + segment;
    } else {
      out += "[\"" + common::EscapeForJsString(segment) + "\"]";
    }
  }
  return out;
}

}  // namespace

ConfigAdapter::ConfigAdapter(AdapterConfig config)
    : config_(std::move(config)) {
}

auto ConfigAdapter::ResolveValue(const lowering::ResolveValueContext& context)
    -> std::optional<lowering::ResolveResult> {
  if (context.kind == lowering::ResolveKind::kCssVariable) {
    const auto* expr = Lookup(config_.css_variables, context.path);
    if (expr == nullptr) {
      return std::nullopt;
    }
    return lowering::ResolveResult{.expr = *expr, .imports = {}};
  }

  if (!config_.theme) {
    return std::nullopt;
  }
  const ThemeConfig& theme = *config_.theme;
  if (const auto* expr = Lookup(theme.paths, context.path)) {
    return lowering::ResolveResult{.expr = *expr, .imports = {}};
  }
  lowering::ResolveResult result{
      .expr = MemberAccess(theme.object, context.path), .imports = {}};
  if (!theme.import_from.empty()) {
    result.imports.push_back(
        lowering::ImportSpec{
            .from = theme.import_from, .names = {RootName(theme.object)}});
  }
  spdlog::trace("theme path {} -> {}", context.path, result.expr);
  return result;
}

auto ConfigAdapter::ResolveCall(const lowering::ResolveCallContext& context)
    -> std::optional<lowering::ResolveResult> {
  const auto* pattern = Lookup(config_.calls, context.callee_name);
  if (pattern == nullptr) {
    return std::nullopt;
  }
  std::string expr = *pattern;
  auto at = expr.find("{0}");
  if (at != std::string::npos) {
    if (context.args.empty() ||
        context.args.front().kind != lowering::CallArgKind::kLiteral) {
      return std::nullopt;
    }
    expr.replace(at, 3, context.args.front().text);
  }
  return lowering::ResolveResult{.expr = std::move(expr), .imports = {}};
}

}  // namespace staticss::config
