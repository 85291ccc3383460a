#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace flightrec::util {

/*
  UUID helpers

  Session, record, trace and replay identifiers are RFC4122 version 4
  UUIDs rendered in canonical 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered as a string.
std::string NewId();

} // namespace flightrec::util
