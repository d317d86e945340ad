#include "skykernel/skylink/skyfile_validation.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace skykernel::skylink {
    namespace {
        Result<Unit, KernelFailure> PathError(const char* message) {
            return Result<Unit, KernelFailure>::Err(KernelFailure::InvalidPath(message));
        }

        Result<Unit, KernelFailure> MetadataError(const char* message) {
            return Result<Unit, KernelFailure>::Err(KernelFailure::InvalidMetadata(message));
        }
    }

    Result<Unit, KernelFailure> SkyfileValidation::ValidateSkyfilePath(const std::string_view path) {
        if (path.empty()) {
            return PathError("path cannot be blank");
        }
        if (path == "..") {
            return PathError("path cannot be ..");
        }
        if (path == ".") {
            return PathError("path cannot be .");
        }
        if (path.starts_with("/")) {
            return PathError("metadata.Filename cannot start with /");
        }
        if (path.starts_with("../")) {
            return PathError("metadata.Filename cannot start with ../");
        }
        if (path.starts_with("./")) {
            return PathError("metadata.Filename cannot start with ./");
        }

        size_t start = 0;
        while (true) {
            const auto slash = path.find('/', start);
            const auto element = path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
            if (element == ".") {
                return PathError("path cannot have a . element");
            }
            if (element == "..") {
                return PathError("path cannot have a .. element");
            }
            if (element.empty()) {
                return PathError("path cannot have an empty element, cannot contain //");
            }
            if (slash == std::string_view::npos) {
                break;
            }
            start = slash + 1;
        }
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    Result<Unit, KernelFailure> SkyfileValidation::ValidateSkyfileMetadata(const nlohmann::json& metadata) {
        if (!metadata.is_object()) {
            return MetadataError("metadata must be a JSON object");
        }
        const auto filename = metadata.find("Filename");
        if (filename == metadata.end()) {
            return MetadataError("metadata.Filename does not exist");
        }
        if (!filename->is_string()) {
            return MetadataError("metadata.Filename is not a string");
        }
        if (auto path = ValidateSkyfilePath(filename->get<std::string>()); path.IsErr()) {
            return Result<Unit, KernelFailure>::Err(KernelFailure::InvalidMetadata(
                path.UnwrapErr().WithContext("metadata.Filename does not have a valid path").message));
        }

        if (metadata.contains("Subfiles")) {
            return MetadataError("cannot upload files that have subfiles");
        }
        if (metadata.contains("DisableDefaultPath") && metadata.contains("DefaultPath")) {
            return MetadataError("cannot set both a DefaultPath and also DisableDefaultPath");
        }
        if (metadata.contains("DefaultPath")) {
            return MetadataError("cannot set a default path if there are no subfiles");
        }

        if (const auto try_files = metadata.find("TryFiles"); try_files != metadata.end()) {
            if (!try_files->is_array()) {
                return MetadataError("metadata.TryFiles must be an array");
            }
            if (try_files->empty()) {
                return MetadataError("metadata.TryFiles should not be empty");
            }
            if (metadata.contains("DisableDefaultPath")) {
                return MetadataError("metadata.TryFiles cannot be used alongside DisableDefaultPath");
            }
            return MetadataError("TryFiles is not supported at this time");
        }
        if (metadata.contains("ErrorPages")) {
            return MetadataError("ErrorPages is not supported at this time");
        }
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    Result<Unit, KernelFailure> SkyfileValidation::ValidateSkyfileMetadataJson(const std::string_view metadata_json) {
        const auto parsed = nlohmann::json::parse(metadata_json.begin(), metadata_json.end(), nullptr, false);
        if (parsed.is_discarded()) {
            return MetadataError("metadata is not valid JSON");
        }
        return ValidateSkyfileMetadata(parsed);
    }
}
