#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace treasury::util {

// 16 random bytes, RFC4122 version 4 / variant 1.
using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical lowercase 8-4-4-4-12 form.
std::string ToString(const UUID& id);

// Identifier for a ledger created without one.
std::string NewLedgerId();

} // namespace treasury::util
