#pragma once
#include "skykernel/core/constants.hpp"
#include <array>
#include <cstdint>
namespace skykernel::models {
/// 2-byte little-endian bitfield followed by a 32-byte root.
using SkylinkBytes = std::array<uint8_t, SkylinkConstants::SKYLINK_SIZE>;
using Datakey = std::array<uint8_t, RegistryConstants::DATAKEY_SIZE>;
using EntryId = std::array<uint8_t, RegistryConstants::ENTRY_ID_SIZE>;
}
