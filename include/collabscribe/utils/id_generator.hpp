#pragma once

#include <string>

namespace collabscribe {
namespace utils {

/**
 * Random RFC 4122 version 4 UUID in canonical lowercase form,
 * e.g. "3f2b8c1e-9a4d-4f6b-8e2a-1c5d7b9e0f12". Thread-safe.
 */
std::string generateUuid();

/**
 * Eight random hex digits, used for diagnostic ids.
 */
std::string generateShortId();

bool isValidUuid(const std::string& value);

} // namespace utils
} // namespace collabscribe
