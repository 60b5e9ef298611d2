#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace util {

// Raw 16 byte RFC 4122 UUID.
using Uuid = std::array<uint8_t, 16>;

// Version 4 (random) UUID.
Uuid generate_uuid();

// Canonical 8-4-4-4-12 lowercase hex form.
std::string to_string(const Uuid& id);

// Shorthand for to_string(generate_uuid()).
std::string new_id();

} // namespace util
