#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace weft::weaver {

// How a notifier type selects the properties to weave.
// kExplicit: only properties carrying the notify marker.
// kImplicit: additionally every property with a public setter.
enum class NotificationMode : uint8_t { kExplicit = 0, kImplicit = 1 };

auto ToString(NotificationMode mode) -> std::string_view;

// Annotation type names the weaver looks for. Overridable from weft.toml.
struct MarkerNames {
  std::string notifier = "Weft.NotifierAttribute";
  std::string notify_target = "Weft.NotifyTargetAttribute";
  std::string notify = "Weft.NotifyAttribute";
  std::string suppress = "Weft.SuppressNotifyAttribute";
};

}  // namespace weft::weaver
