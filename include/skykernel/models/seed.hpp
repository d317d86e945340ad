#pragma once
#include "skykernel/core/constants.hpp"
#include <array>
#include <cstdint>
namespace skykernel::models {
/// The 16-byte root secret every key and address is derived from.
using Seed = std::array<uint8_t, SeedConstants::SEED_BYTES>;
}
