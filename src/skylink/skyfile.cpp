#include "skykernel/skylink/skyfile.hpp"
#include "skykernel/skylink/skyfile_validation.hpp"
#include "skykernel/skylink/skylink_bitfield.hpp"
#include "skykernel/skylink/merkle.hpp"
#include "skykernel/encoding/encoding.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <algorithm>

namespace skykernel::skylink {
    using encoding::Encoding;

    namespace {
        template<typename Out>
        Out WriteU64(Out out, const uint64_t value) {
            const auto bytes = Encoding::EncodeU64(value);
            return std::copy(bytes.begin(), bytes.end(), out);
        }

        uint64_t ReadU64(const std::span<const uint8_t> bytes, const size_t offset) {
            uint64_t value = 0;
            for (size_t i = Constants::U64_ENCODED_SIZE; i > 0; --i) {
                value = (value << 8) | bytes[offset + i - 1];
            }
            return value;
        }
    }

    bool SkyfileLayout::IsPlaintext() const noexcept {
        return std::all_of(cipher_type.begin(), cipher_type.end() - 1, [](const uint8_t b) { return b == 0; }) &&
               cipher_type.back() == 1;
    }

    LayoutBytes Skyfile::EncodeLayout(const SkyfileLayout& layout) {
        LayoutBytes bytes{};
        auto out = bytes.begin();
        *out++ = layout.version;
        out = WriteU64(out, layout.filesize);
        out = WriteU64(out, layout.metadata_size);
        out = WriteU64(out, layout.fanout_size);
        *out++ = layout.fanout_data_pieces;
        *out++ = layout.fanout_parity_pieces;
        out = std::copy(layout.cipher_type.begin(), layout.cipher_type.end(), out);
        std::copy(layout.key_data.begin(), layout.key_data.end(), out);
        return bytes;
    }

    Result<SkyfileLayout, KernelFailure> Skyfile::DecodeLayout(const std::span<const uint8_t> bytes) {
        if (bytes.size() < SkyfileConstants::LAYOUT_SIZE) {
            return Result<SkyfileLayout, KernelFailure>::Err(
                KernelFailure::Decode(fmt::format(
                    "layout needs {} bytes, got {}", SkyfileConstants::LAYOUT_SIZE, bytes.size())));
        }
        SkyfileLayout layout;
        size_t offset = 0;
        layout.version = bytes[offset++];
        layout.filesize = ReadU64(bytes, offset);
        offset += Constants::U64_ENCODED_SIZE;
        layout.metadata_size = ReadU64(bytes, offset);
        offset += Constants::U64_ENCODED_SIZE;
        layout.fanout_size = ReadU64(bytes, offset);
        offset += Constants::U64_ENCODED_SIZE;
        layout.fanout_data_pieces = bytes[offset++];
        layout.fanout_parity_pieces = bytes[offset++];
        std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                    layout.cipher_type.size(), layout.cipher_type.begin());
        offset += layout.cipher_type.size();
        std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                    layout.key_data.size(), layout.key_data.begin());
        return Result<SkyfileLayout, KernelFailure>::Ok(layout);
    }

    Result<UploadHeader, KernelFailure> Skyfile::BuildUploadHeader(const std::string_view skylink_text) {
        if (skylink_text.size() != SkylinkConstants::SKYLINK_TEXT_SIZE) {
            return Result<UploadHeader, KernelFailure>::Err(
                KernelFailure::InvalidInput(fmt::format(
                    "skylink text must be {} characters, got {}",
                    SkylinkConstants::SKYLINK_TEXT_SIZE, skylink_text.size())));
        }
        UploadHeader header{};
        auto out = header.begin();
        for (const auto field : {SkyfileConstants::HEADER_METADATA, SkyfileConstants::HEADER_VERSION, skylink_text}) {
            out = WriteU64(out, field.size());
            out = std::copy(field.begin(), field.end(), out);
        }
        return Result<UploadHeader, KernelFailure>::Ok(header);
    }

    Result<BaseSector, KernelFailure> Skyfile::BuildBaseSector(
        const std::span<const uint8_t> file_data,
        const nlohmann::json& metadata) {
        if (file_data.size() > SkyfileConstants::MAX_UPLOAD_SIZE) {
            return Result<BaseSector, KernelFailure>::Err(
                KernelFailure::DataTooLarge("currently only small uploads are supported, please use less than 4 MB"));
        }
        if (auto valid = SkyfileValidation::ValidateSkyfileMetadata(metadata); valid.IsErr()) {
            return Result<BaseSector, KernelFailure>::Err(
                valid.UnwrapErr().WithContext("upload is using invalid metadata"));
        }
        std::string metadata_text;
        try {
            metadata_text = metadata.dump();
        } catch (const nlohmann::json::type_error& e) {
            return Result<BaseSector, KernelFailure>::Err(KernelFailure::InvalidMetadata(
                fmt::format("upload is using invalid metadata: metadata is not valid UTF-8: {}", e.what())));
        }

        SkyfileLayout layout;
        layout.filesize = file_data.size();
        layout.metadata_size = metadata_text.size();
        const auto layout_bytes = EncodeLayout(layout);

        BaseSector base;
        base.total_size = layout_bytes.size() + metadata_text.size() + file_data.size();
        if (base.total_size > SkylinkConstants::SECTOR_SIZE) {
            return Result<BaseSector, KernelFailure>::Err(
                KernelFailure::DataTooLarge("error when building the base sector: total sector is too large"));
        }

        base.sector.assign(SkylinkConstants::SECTOR_SIZE, 0);
        auto out = std::copy(layout_bytes.begin(), layout_bytes.end(), base.sector.begin());
        out = std::copy(metadata_text.begin(), metadata_text.end(), out);
        std::copy(file_data.begin(), file_data.end(), out);

        auto root = Merkle::BlakeMerkleRoot(base.sector);
        if (root.IsErr()) {
            return Result<BaseSector, KernelFailure>::Err(
                root.UnwrapErr().WithContext("unable to compute sector root"));
        }
        auto bitfield = SkylinkBitfield::SkylinkV1Bitfield(base.total_size);
        if (bitfield.IsErr()) {
            return Result<BaseSector, KernelFailure>::Err(
                bitfield.UnwrapErr().WithContext("unable to create bitfield for skylink"));
        }
        std::copy(bitfield.Unwrap().begin(), bitfield.Unwrap().end(), base.skylink.begin());
        std::copy(root.Unwrap().begin(), root.Unwrap().end(),
                  base.skylink.begin() + SkylinkConstants::ROOT_OFFSET);
        base.skylink_text = Encoding::BufToB64(base.skylink);
        SKY_LOG_MSG(debug::Component::Skylink, "base sector built for " + base.skylink_text);
        return Result<BaseSector, KernelFailure>::Ok(std::move(base));
    }

    Result<SkyfileContent, KernelFailure> Skyfile::ExtractContent(const std::span<const uint8_t> fetched) {
        auto layout = DecodeLayout(fetched);
        if (layout.IsErr()) {
            return Result<SkyfileContent, KernelFailure>::Err(
                layout.UnwrapErr().WithContext("unable to read skyfile layout"));
        }
        SkyfileContent content;
        content.layout = layout.Unwrap();
        if (content.layout.version != SkyfileConstants::LAYOUT_VERSION) {
            return Result<SkyfileContent, KernelFailure>::Err(
                KernelFailure::Verification(fmt::format(
                    "unsupported skyfile layout version {}", content.layout.version)));
        }
        if (content.layout.fanout_size != 0) {
            return Result<SkyfileContent, KernelFailure>::Err(
                KernelFailure::Verification("skyfiles with a fanout are not supported"));
        }
        if (!content.layout.IsPlaintext()) {
            return Result<SkyfileContent, KernelFailure>::Err(
                KernelFailure::Verification("encrypted skyfiles are not supported"));
        }
        const uint64_t available = fetched.size() - SkyfileConstants::LAYOUT_SIZE;
        if (content.layout.metadata_size > available ||
            content.layout.filesize > available - content.layout.metadata_size) {
            return Result<SkyfileContent, KernelFailure>::Err(
                KernelFailure::Verification("skyfile layout declares more data than was fetched"));
        }
        const auto metadata = fetched.subspan(SkyfileConstants::LAYOUT_SIZE, content.layout.metadata_size);
        const auto data = fetched.subspan(
            SkyfileConstants::LAYOUT_SIZE + content.layout.metadata_size, content.layout.filesize);
        content.metadata = Encoding::BytesToString(metadata);
        content.data.assign(data.begin(), data.end());
        return Result<SkyfileContent, KernelFailure>::Ok(std::move(content));
    }
}
