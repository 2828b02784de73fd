#include "control_plane.h"

namespace strata {

bool identity_present(std::optional<std::string> const &identity) {
  if (!identity) { return false; }
  auto const trimmed{ util_trim(*identity) };
  return !trimmed.empty() && trimmed != "None" && trimmed != "null";
}

}  // namespace strata
