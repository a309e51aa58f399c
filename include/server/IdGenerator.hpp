#pragma once

#include <string>

namespace blockfall::server {

/// Random (version 4) UUID in canonical text form, used for game ids and
/// player tokens. Thread-safe.
std::string makeUuid();

} // namespace blockfall::server
