#include "agents/echo.hpp"

namespace orchestra::agents {

core::Result<nlohmann::json> EchoAgent::execute(const nlohmann::json& payload) { return payload; }

}  // namespace orchestra::agents
