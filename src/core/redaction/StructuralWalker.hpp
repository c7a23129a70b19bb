#pragma once
#include "Record.hpp"
#include "StringScrubber.hpp"

namespace safesar {

// Rebuilds value with every string leaf scrubbed. Keys, key order, array
// lengths and non-string scalars are left as they are.
Record walk(const Record& value, const StringScrubber& scrubber, ScrubStats* stats = nullptr);

} // namespace safesar
