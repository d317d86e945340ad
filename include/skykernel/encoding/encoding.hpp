#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/constants.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace skykernel::encoding {
using U64Bytes = std::array<uint8_t, Constants::U64_ENCODED_SIZE>;

/**
 * @brief Binary codec shared by every wire format of the kernel
 *
 * Integers are always little-endian. Base64 is the unpadded url-safe
 * alphabet; hex is lowercase.
 */
class Encoding {
public:
    static U64Bytes EncodeU64(uint64_t value) noexcept;

    /// Reads exactly 8 little-endian bytes.
    static Result<uint64_t, KernelFailure> DecodeU64(std::span<const uint8_t> bytes);

    /**
     * @brief Parse an unsigned 64-bit decimal number
     *
     * Negative values and values of 2^64 or more fail with Range, anything
     * that is not a plain decimal number fails with Decode.
     */
    static Result<uint64_t, KernelFailure> ParseU64(std::string_view decimal);

    /// EncodeU64(len) followed by the bytes themselves.
    static std::vector<uint8_t> EncodePrefixedBytes(std::span<const uint8_t> bytes);

    static std::string BufToB64(std::span<const uint8_t> bytes);

    /**
     * @brief Decode base64 text
     *
     * Accepts the url-safe and the standard alphabet, with or without
     * trailing '=' padding.
     */
    static Result<std::vector<uint8_t>, KernelFailure> B64ToBuf(std::string_view text);

    static std::string BufToHex(std::span<const uint8_t> bytes);
    static Result<std::vector<uint8_t>, KernelFailure> HexToBuf(std::string_view hex);

    static std::span<const uint8_t> AsBytes(std::string_view text) noexcept;
    static std::string BytesToString(std::span<const uint8_t> bytes);
private:
    Encoding() = delete;
};
}
