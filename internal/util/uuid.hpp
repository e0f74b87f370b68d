#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace settle::util {

/*
  UUID helpers

  Random RFC4122 version 4 ids, used to tell apart processes that share
  a configured reservation holder name.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace settle::util
