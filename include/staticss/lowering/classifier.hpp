#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "staticss/js/arena.hpp"
#include "staticss/js/fwd.hpp"
#include "staticss/js/pattern.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/decision.hpp"

namespace staticss::lowering {

// `const helper = (v) => v ? "a" : "b"` with literal branches.
struct TernaryHelper {
  std::string name;
  js::StaticLiteral truthy;
  js::StaticLiteral falsy;
};

// File-level facts the matchers consult.
struct ClassifierEnv {
  const js::Arena* arena = nullptr;
  Adapter* adapter = nullptr;
  const std::vector<TernaryHelper>* helpers = nullptr;
  const std::unordered_set<std::string>* keyframes = nullptr;
  // Imported local name -> module source.
  const std::unordered_map<std::string, std::string>* imports = nullptr;
};

// Prioritized chain of pattern matchers. The first matcher that applies
// decides; when none does the result is a Bail.
class Classifier {
 public:
  explicit Classifier(ClassifierEnv env) : env_(env) {
  }

  [[nodiscard]] auto Classify(
      std::optional<js::ExprId> expr, const DynamicContext& context) const
      -> LoweringDecision;

  // Names of the matchers in priority order.
  static auto MatcherNames() -> std::vector<std::string_view>;

 private:
  ClassifierEnv env_;
};

}  // namespace staticss::lowering
