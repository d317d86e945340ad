#include "skykernel/skylink/skylink_bitfield.hpp"
#include "skykernel/encoding/encoding.hpp"
#include <fmt/core.h>
#include <new>

namespace skykernel::skylink {
    Result<Bitfield, KernelFailure> SkylinkBitfield::SkylinkV1Bitfield(const uint64_t data_size) {
        if (data_size > SkylinkConstants::SECTOR_SIZE) {
            return Result<Bitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield(fmt::format(
                    "data size {} exceeds the sector size {}", data_size, SkylinkConstants::SECTOR_SIZE)));
        }

        unsigned mode = 0;
        for (uint64_t limit = SkylinkConstants::MODE_ZERO_LIMIT; limit < data_size; limit *= 2) {
            ++mode;
        }

        uint64_t fetch_units = 0;
        if (mode == 0) {
            if (data_size != 0) {
                fetch_units = (data_size - 1) / SkylinkConstants::FETCH_SIZE_STEP;
            }
        } else {
            const uint64_t step = 1ULL << (11 + mode);
            const uint64_t target = data_size - (1ULL << (14 + mode));
            if (target != 0) {
                fetch_units = (target - 1) / step;
            }
        }

        const uint32_t value = (((1U << mode) - 1U) << 2) |
                               (static_cast<uint32_t>(fetch_units) << (3 + mode));
        return Result<Bitfield, KernelFailure>::Ok(Bitfield{
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        });
    }

    Result<ParsedBitfield, KernelFailure> SkylinkBitfield::ParseSkylinkBitfield(
        const std::span<const uint8_t> skylink) {
        if (skylink.size() != SkylinkConstants::SKYLINK_SIZE) {
            return Result<ParsedBitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield(fmt::format(
                    "skylink must be {} bytes, got {}", SkylinkConstants::SKYLINK_SIZE, skylink.size())));
        }

        uint32_t bitfield = static_cast<uint32_t>(skylink[0]) |
                            (static_cast<uint32_t>(skylink[1]) << 8);
        ParsedBitfield parsed;
        parsed.version = static_cast<uint8_t>((bitfield & 3U) + 1);
        if (parsed.version > 2) {
            return Result<ParsedBitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield(fmt::format("unrecognized skylink version {}", parsed.version)));
        }
        if (parsed.version == 2) {
            if ((bitfield & 3U) != bitfield) {
                return Result<ParsedBitfield, KernelFailure>::Err(
                    KernelFailure::InvalidBitfield("v2 skylink has non-version bits set"));
            }
            return Result<ParsedBitfield, KernelFailure>::Ok(parsed);
        }

        bitfield >>= 2;
        if ((bitfield & 255U) == 255U) {
            return Result<ParsedBitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield("skylink mode bits are all set"));
        }
        unsigned mode = 0;
        while (bitfield & 1U) {
            ++mode;
            bitfield >>= 1;
        }
        // drop the 0 that ends the mode run
        bitfield >>= 1;
        if (mode > SkylinkConstants::MAX_MODE) {
            return Result<ParsedBitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield(fmt::format("skylink mode {} is out of range", mode)));
        }

        const uint64_t offset_increment = SkylinkConstants::FETCH_SIZE_STEP << mode;
        uint64_t fetch_size_increment = SkylinkConstants::FETCH_SIZE_STEP;
        uint64_t fetch_size_start = 0;
        if (mode > 0) {
            fetch_size_increment <<= (mode - 1);
            fetch_size_start = SkylinkConstants::MODE_ZERO_LIMIT << (mode - 1);
        }
        parsed.fetch_size = fetch_size_start + ((bitfield & 7U) + 1) * fetch_size_increment;
        bitfield >>= 3;
        parsed.offset = static_cast<uint64_t>(bitfield) * offset_increment;
        if (parsed.offset + parsed.fetch_size > SkylinkConstants::SECTOR_SIZE) {
            return Result<ParsedBitfield, KernelFailure>::Err(
                KernelFailure::InvalidBitfield("skylink offset and fetch size exceed the sector size"));
        }
        return Result<ParsedBitfield, KernelFailure>::Ok(parsed);
    }

    bool SkylinkBitfield::ValidSkylink(const std::span<const uint8_t> skylink) noexcept {
        if (skylink.size() != SkylinkConstants::SKYLINK_SIZE) {
            return false;
        }
        try {
            return ParseSkylinkBitfield(skylink).IsOk();
        } catch (const std::bad_alloc&) {
            return false;
        }
    }

    bool SkylinkBitfield::ValidSkylink(const std::string_view skylink) noexcept {
        try {
            auto bytes = encoding::Encoding::B64ToBuf(skylink);
            return bytes.IsOk() && ValidSkylink(std::span<const uint8_t>(bytes.Unwrap()));
        } catch (const std::bad_alloc&) {
            return false;
        }
    }
}
