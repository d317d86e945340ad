#pragma once

#include "skykernel/core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace skykernel::configuration {

/// Portal list and limits a kernel instance runs with
///
/// @example
/// ```cpp
/// auto config = KernelConfig::Default();
/// auto local = KernelConfig::WithPortals({"localhost:9980"});
/// ```
class KernelConfig {
public:
    static constexpr size_t kMaxRegistryDataSize = RegistryConstants::MAX_DATA_SIZE;
    static constexpr uint64_t kMaxUploadSize = SkyfileConstants::MAX_UPLOAD_SIZE;
    static constexpr uint64_t kSectorSize = SkylinkConstants::SECTOR_SIZE;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Public portals in the order they are tried
    [[nodiscard]] static KernelConfig Default() {
        return KernelConfig({"siasky.net", "eu-ger-12.siasky.net"});
    }

    /// Custom portal list; an empty list makes every fetch fail immediately
    [[nodiscard]] static KernelConfig WithPortals(std::vector<std::string> portals) {
        return KernelConfig(std::move(portals));
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const std::vector<std::string>& Portals() const noexcept {
        return portals_;
    }

    [[nodiscard]] bool HasPortals() const noexcept {
        return !portals_.empty();
    }

    bool operator==(const KernelConfig&) const = default;

private:
    explicit KernelConfig(std::vector<std::string> portals)
        : portals_(std::move(portals)) {}

    std::vector<std::string> portals_;
};

} // namespace skykernel::configuration
