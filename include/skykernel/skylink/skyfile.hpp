#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/constants.hpp"
#include "skykernel/models/skylink.hpp"
#include <nlohmann/json_fwd.hpp>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace skykernel::skylink {
using LayoutBytes = std::array<uint8_t, SkyfileConstants::LAYOUT_SIZE>;
using UploadHeader = std::array<uint8_t, SkyfileConstants::UPLOAD_HEADER_SIZE>;

/// The 99-byte header at the front of every skyfile base sector.
struct SkyfileLayout {
    uint8_t version = SkyfileConstants::LAYOUT_VERSION;
    uint64_t filesize = 0;
    uint64_t metadata_size = 0;
    uint64_t fanout_size = 0;
    uint8_t fanout_data_pieces = 0;
    uint8_t fanout_parity_pieces = 0;
    std::array<uint8_t, SkyfileConstants::CIPHER_TYPE_SIZE> cipher_type = {0, 0, 0, 0, 0, 0, 0, 1};
    std::array<uint8_t, SkyfileConstants::LAYOUT_KEY_DATA_SIZE> key_data{};

    [[nodiscard]] bool IsPlaintext() const noexcept;
};

struct BaseSector {
    std::vector<uint8_t> sector;
    models::SkylinkBytes skylink{};
    std::string skylink_text;
    uint64_t total_size = 0;
};

struct SkyfileContent {
    SkyfileLayout layout;
    std::string metadata;
    std::vector<uint8_t> data;
};

class Skyfile {
public:
    static LayoutBytes EncodeLayout(const SkyfileLayout& layout);
    static Result<SkyfileLayout, KernelFailure> DecodeLayout(std::span<const uint8_t> bytes);

    /**
     * @brief Header prepended to a base sector on /skynet/restore
     *
     * Three length-prefixed strings: "Skyfile Backup\n", "v1.5.5\n" and the
     * 46-character skylink.
     */
    static Result<UploadHeader, KernelFailure> BuildUploadHeader(std::string_view skylink_text);

    /**
     * @brief Lay out a small file in a base sector and compute its skylink
     *
     * Fails with DataTooLarge for files above 4,000,000 bytes or when
     * layout, metadata and data do not fit in one sector, and with
     * InvalidMetadata when the metadata is rejected.
     */
    static Result<BaseSector, KernelFailure> BuildBaseSector(
        std::span<const uint8_t> file_data,
        const nlohmann::json& metadata);

    /// Splits the bytes addressed by a v1 skylink into layout, metadata and data.
    static Result<SkyfileContent, KernelFailure> ExtractContent(std::span<const uint8_t> fetched);
private:
    Skyfile() = delete;
};
}
