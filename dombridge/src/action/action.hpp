#pragma once

#include "../core_context.hpp"

#include <string>

namespace dombridge::actions {

/// Decodes one control request frame, runs its action and returns the encoded response.
std::string handle_action(const std::string& request_bytes, BridgeContext& context);

} // namespace dombridge::actions
