#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace staticss::lowering {

struct ImportSpec {
  std::string from;
  std::vector<std::string> names;

  auto operator==(const ImportSpec&) const -> bool = default;
};

enum class ResolveKind : uint8_t {
  kTheme,
  kCssVariable,
};

struct ResolveValueContext {
  ResolveKind kind = ResolveKind::kTheme;
  // Theme path ("colors.primary") or custom property name ("--brand").
  std::string path;
  std::optional<std::string> fallback;
};

enum class CallArgKind : uint8_t {
  kLiteral,
  kTheme,
  kUnknown,
};

struct CallArg {
  CallArgKind kind = CallArgKind::kUnknown;
  // Literal value, theme path, or source text.
  std::string text;
};

struct ResolveCallContext {
  std::string callee_name;
  std::string callee_source;
  std::vector<CallArg> args;
};

struct ResolveResult {
  std::string expr;
  std::vector<ImportSpec> imports;

  auto operator==(const ResolveResult&) const -> bool = default;
};

// Policy hook for values the engine cannot resolve on its own. Returning
// nullopt means "does not apply", never an error.
class Adapter {
 public:
  Adapter() = default;
  virtual ~Adapter() = default;

  Adapter(const Adapter&) = delete;
  auto operator=(const Adapter&) -> Adapter& = delete;
  Adapter(Adapter&&) = delete;
  auto operator=(Adapter&&) -> Adapter& = delete;

  [[nodiscard]] virtual auto ResolveValue(const ResolveValueContext& context)
      -> std::optional<ResolveResult> = 0;
  [[nodiscard]] virtual auto ResolveCall(const ResolveCallContext& context)
      -> std::optional<ResolveResult> = 0;
};

// Declines every request.
class NullAdapter final : public Adapter {
 public:
  auto ResolveValue(const ResolveValueContext& /*context*/)
      -> std::optional<ResolveResult> override {
    return std::nullopt;
  }
  auto ResolveCall(const ResolveCallContext& /*context*/)
      -> std::optional<ResolveResult> override {
    return std::nullopt;
  }
};

}  // namespace staticss::lowering
