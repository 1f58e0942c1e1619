#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace ledger::util {

/*
  UUID helpers

  Plans, instances and chores are keyed by RFC4122 v4 UUIDs in their
  canonical 36-character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// ToString(GenerateUUID())
std::string NewId();

} // namespace ledger::util
