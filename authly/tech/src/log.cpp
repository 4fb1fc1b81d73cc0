#include "authly/log.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

namespace authly {

bool SetLogLevelFromEnv() {
  const char* envLevel = std::getenv("AUTHLY_LOG_LEVEL");
  if (envLevel == nullptr || *envLevel == '\0') {
    return false;
  }
  const std::string_view levelName(envLevel);
  const auto level = log::level::from_str(std::string(levelName));
  // from_str falls back to 'off' for unknown names
  if (level == log::level::off && levelName != "off") {
    log::warn("Ignoring unknown AUTHLY_LOG_LEVEL '{}'", levelName);
    return false;
  }
  log::set_level(level);
  return true;
}

}  // namespace authly
