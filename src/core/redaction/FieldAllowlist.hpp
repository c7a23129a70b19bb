#pragma once
#include "Record.hpp"
#include "core/config/RedactionConfig.hpp"

namespace safesar {

// Top-level keys of record that are in allowed, in their original order.
// Anything that is not an object yields an empty object. Nested values are
// copied whole; only the top level is filtered.
Record allowlist(const Record& record, const AllowedFieldSet& allowed);

} // namespace safesar
