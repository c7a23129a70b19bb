#pragma once
#include <string>

namespace safesar {
  // Value of environment variable key, or defval when it is unset.
  std::string get_env_or(const char* key, const std::string& defval);
}
