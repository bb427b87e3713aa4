#pragma once

#include <string>

namespace hermit::common {

inline std::string version_number() {
#ifdef HERMIT_VERSION
  return HERMIT_VERSION;
#else
  return "0.1.0";
#endif
}

} // namespace hermit::common
