#pragma once

#include "ulidkit/core/id_generator.h"

#include <string>

namespace ulidkit::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// These are "vocabulary types" that prevent ID confusion and enable type-safe APIs.

struct RecordId {
  std::string value;
  auto operator<=>(const RecordId&) const = default;  // C++20: generates ==, !=, <, <=, >, >=
};

inline RecordId new_record_id(IIdGenerator& gen) { return RecordId{gen.next("rec")}; }

}  // namespace ulidkit::core
