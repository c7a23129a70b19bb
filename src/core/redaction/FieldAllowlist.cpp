#include "FieldAllowlist.hpp"

namespace safesar {

Record allowlist(const Record& record, const AllowedFieldSet& allowed) {
  Record out = Record::object();
  if (!record.is_object()) return out;
  for (auto it = record.begin(); it != record.end(); ++it) {
    if (allowed.count(it.key()) != 0) out[it.key()] = it.value();
  }
  return out;
}

} // namespace safesar
