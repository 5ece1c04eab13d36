#pragma once

#include <optional>

#include "staticss/config/project_config.hpp"
#include "staticss/lowering/adapter.hpp"

namespace staticss::config {

// Adapter whose policy comes from the [adapter] tables of staticss.toml.
class ConfigAdapter final : public lowering::Adapter {
 public:
  explicit ConfigAdapter(AdapterConfig config);

  auto ResolveValue(const lowering::ResolveValueContext& context)
      -> std::optional<lowering::ResolveResult> override;
  auto ResolveCall(const lowering::ResolveCallContext& context)
      -> std::optional<lowering::ResolveResult> override;

 private:
  AdapterConfig config_;
};

}  // namespace staticss::config
