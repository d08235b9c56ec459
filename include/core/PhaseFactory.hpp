#pragma once

#include <memory>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// The six deployment phases in ordinal order.
std::vector<std::unique_ptr<IPhase>> makeDefaultPhases();

}  // namespace cdp::core
