#include "skykernel/encoding/encoding.hpp"
#include <sodium.h>
#include <fmt/core.h>
#include <charconv>
#include <system_error>

namespace skykernel::encoding {
    U64Bytes Encoding::EncodeU64(const uint64_t value) noexcept {
        U64Bytes bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
        }
        return bytes;
    }

    Result<uint64_t, KernelFailure> Encoding::DecodeU64(const std::span<const uint8_t> bytes) {
        if (bytes.size() != Constants::U64_ENCODED_SIZE) {
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Decode(fmt::format(
                    "u64 must be encoded in {} bytes, got {}",
                    Constants::U64_ENCODED_SIZE, bytes.size())));
        }
        uint64_t value = 0;
        for (size_t i = bytes.size(); i > 0; --i) {
            value = (value << 8) | bytes[i - 1];
        }
        return Result<uint64_t, KernelFailure>::Ok(value);
    }

    Result<uint64_t, KernelFailure> Encoding::ParseU64(const std::string_view decimal) {
        if (decimal.empty()) {
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Decode("cannot parse an empty string as a number"));
        }
        if (decimal.front() == '-') {
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Range(fmt::format("'{}' is negative", decimal)));
        }
        uint64_t value = 0;
        const char* first = decimal.data();
        const char* last = decimal.data() + decimal.size();
        const auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (ec == std::errc::result_out_of_range) {
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Range(fmt::format("'{}' does not fit in 64 bits", decimal)));
        }
        if (ec != std::errc{} || ptr != last) {
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Decode(fmt::format("'{}' is not a decimal number", decimal)));
        }
        return Result<uint64_t, KernelFailure>::Ok(value);
    }

    std::vector<uint8_t> Encoding::EncodePrefixedBytes(const std::span<const uint8_t> bytes) {
        const auto length = EncodeU64(bytes.size());
        std::vector<uint8_t> result;
        result.reserve(length.size() + bytes.size());
        result.insert(result.end(), length.begin(), length.end());
        result.insert(result.end(), bytes.begin(), bytes.end());
        return result;
    }

    std::string Encoding::BufToB64(const std::span<const uint8_t> bytes) {
        constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
        std::string text(sodium_base64_encoded_len(bytes.size(), variant), '\0');
        sodium_bin2base64(text.data(), text.size(), bytes.data(), bytes.size(), variant);
        // encoded_len counts the terminating NUL
        text.pop_back();
        return text;
    }

    Result<std::vector<uint8_t>, KernelFailure> Encoding::B64ToBuf(std::string_view text) {
        while (!text.empty() && text.back() == '=') {
            text.remove_suffix(1);
        }
        std::string normalized(text);
        for (auto& c : normalized) {
            if (c == '+') {
                c = '-';
            } else if (c == '/') {
                c = '_';
            }
        }
        std::vector<uint8_t> bytes(normalized.size() * 3 / 4 + 1);
        size_t decoded_len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(bytes.data(), bytes.size(),
                              normalized.data(), normalized.size(),
                              nullptr, &decoded_len, &end,
                              sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0 ||
            end != normalized.data() + normalized.size()) {
            return Result<std::vector<uint8_t>, KernelFailure>::Err(
                KernelFailure::Decode("input is not valid base64"));
        }
        bytes.resize(decoded_len);
        return Result<std::vector<uint8_t>, KernelFailure>::Ok(std::move(bytes));
    }

    std::string Encoding::BufToHex(const std::span<const uint8_t> bytes) {
        std::string hex(bytes.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
        hex.pop_back();
        return hex;
    }

    Result<std::vector<uint8_t>, KernelFailure> Encoding::HexToBuf(const std::string_view hex) {
        if (hex.size() % 2 != 0) {
            return Result<std::vector<uint8_t>, KernelFailure>::Err(
                KernelFailure::Decode("hex string has an odd length"));
        }
        std::vector<uint8_t> bytes(hex.size() / 2);
        size_t decoded_len = 0;
        const char* end = nullptr;
        if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                           nullptr, &decoded_len, &end) != 0 ||
            end != hex.data() + hex.size() || decoded_len != bytes.size()) {
            return Result<std::vector<uint8_t>, KernelFailure>::Err(
                KernelFailure::Decode("hex string contains non-hex characters"));
        }
        return Result<std::vector<uint8_t>, KernelFailure>::Ok(std::move(bytes));
    }

    std::span<const uint8_t> Encoding::AsBytes(const std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::string Encoding::BytesToString(const std::span<const uint8_t> bytes) {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }
}
