#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/constants.hpp"
#include <array>
#include <span>
#include <string_view>
#include <cstdint>
namespace skykernel::skylink {
using Bitfield = std::array<uint8_t, SkylinkConstants::BITFIELD_SIZE>;

struct ParsedBitfield {
    uint8_t version = 0;
    uint64_t offset = 0;
    uint64_t fetch_size = 0;
};

/**
 * @brief Encoding of the 2-byte skylink bitfield
 *
 * Bits 0-1 hold the version minus one. For version 1 the remaining bits
 * hold a unary mode (run of 1 bits ended by a 0), three fetch-size bits
 * and the offset in units of 4096 << mode.
 */
class SkylinkBitfield {
public:
    /// Bitfield for a version 1 skylink at offset 0 covering data_size bytes.
    static Result<Bitfield, KernelFailure> SkylinkV1Bitfield(uint64_t data_size);

    static Result<ParsedBitfield, KernelFailure> ParseSkylinkBitfield(std::span<const uint8_t> skylink);

    static bool ValidSkylink(std::span<const uint8_t> skylink) noexcept;
    static bool ValidSkylink(std::string_view skylink) noexcept;
private:
    SkylinkBitfield() = delete;
};
}
