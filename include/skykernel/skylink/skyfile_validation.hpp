#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string_view>
namespace skykernel::skylink {
class SkyfileValidation {
public:
    /**
     * @brief Reject blank, absolute and traversing skyfile paths
     *
     * No "." or ".." path, no leading "/", "./" or "../", and no empty,
     * "." or ".." segment.
     */
    static Result<Unit, KernelFailure> ValidateSkyfilePath(std::string_view path);

    /// Only single-file metadata with a valid Filename is accepted.
    static Result<Unit, KernelFailure> ValidateSkyfileMetadata(const nlohmann::json& metadata);
    static Result<Unit, KernelFailure> ValidateSkyfileMetadataJson(std::string_view metadata_json);
private:
    SkyfileValidation() = delete;
};
}
