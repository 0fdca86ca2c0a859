#pragma once

#include "orch/agent.hpp"

namespace orchestra::agents {

// Returns the payload unchanged.
class EchoAgent final : public orch::Agent {
 public:
  core::Result<nlohmann::json> execute(const nlohmann::json& payload) override;
};

}  // namespace orchestra::agents
