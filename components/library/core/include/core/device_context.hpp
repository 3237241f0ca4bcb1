/**
 * @file device_context.hpp
 * @brief Process-wide device singletons lent to each pipeline stage
 */

#pragma once

#include "abort.hpp"
#include "clock.hpp"
#include "pacer.hpp"
#include "status.hpp"

namespace core {

/// Owned by the application, borrowed by every stage for one cycle.
/// Single thread of control: no locking.
struct DeviceContext {
  Clock &clock;
  StatusIndicator &status;
  Pacer &pacer;
  AbortSignal &abort;
};

} // namespace core
