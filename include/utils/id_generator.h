#pragma once

#include <string>

namespace docbridge {
namespace utils {

/// Random RFC 4122 version-4 UUID, lowercase hex ("3f2b...-4...-a...")
std::string generateUuid();

} // namespace utils
} // namespace docbridge
