#include "parcelday/core/schedule.h"

#include <sstream>
#include <type_traits>

namespace parcelday {

std::string scheduled_action_to_string(const ScheduledAction& action) {
  return std::visit(
      [](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        std::ostringstream ss;
        if constexpr (std::is_same_v<T, DelayedArrival>) {
          ss << "DelayedArrival";
        } else if constexpr (std::is_same_v<T, AddressCorrection>) {
          ss << "AddressCorrection(item=" << a.item_id << ", location=" << a.location_id << ")";
        }
        return ss.str();
      },
      action);
}

} // namespace parcelday
