/**
 * @file spsc_queue.cpp
 * @brief SpscQueue error names and explicit instantiations.
 */
#include "galley/mem/spsc_queue.hpp"
#include "galley/dispatch/channel.hpp"

namespace galley::mem {

const char* to_string(SpscError e) noexcept {
  switch (e) {
    case SpscError::CapacityTooSmall:         return "capacity_too_small";
    case SpscError::CapacityNotPowerOfTwo:    return "capacity_not_power_of_two";
    case SpscError::AllocationFailed:         return "allocation_failed";
    case SpscError::ElementNotNothrowMovable: return "element_not_nothrow_movable";
  }
  return "unknown";
}

// One compiled instance instead of every TU instantiating its own.
template class SpscQueue<int>;                          // unit tests
template class SpscQueue<galley::dispatch::MessagePtr>; // display channel mailboxes

} // namespace galley::mem
