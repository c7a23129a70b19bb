#include "StructuralWalker.hpp"

namespace safesar {

Record walk(const Record& value, const StringScrubber& scrubber, ScrubStats* stats) {
  using value_t = Record::value_t;
  switch (value.type()) {
    case value_t::object: {
      Record out = Record::object();
      for (auto it = value.begin(); it != value.end(); ++it) {
        out[it.key()] = walk(it.value(), scrubber, stats);
      }
      return out;
    }
    case value_t::array: {
      Record out = Record::array();
      for (const auto& element : value) {
        out.push_back(walk(element, scrubber, stats));
      }
      return out;
    }
    case value_t::string:
      return scrubber.scrub(value.get_ref<const std::string&>(), stats);
    case value_t::null:
    case value_t::boolean:
    case value_t::number_integer:
    case value_t::number_unsigned:
    case value_t::number_float:
      return value;
    case value_t::binary:    // raw bytes cannot be scrubbed
    case value_t::discarded:
      return nullptr;
  }
  return nullptr;
}

} // namespace safesar
