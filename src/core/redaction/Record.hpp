#pragma once
#include <nlohmann/json.hpp>

namespace safesar {
  // Case data tree. ordered_json keeps object keys in insertion order so the
  // walker can hand back the same key order it was given.
  using Record = nlohmann::ordered_json;
}
