#include "skykernel/registry/registry_wire.hpp"
#include "skykernel/encoding/encoding.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <algorithm>

namespace skykernel::registry {
    using encoding::Encoding;
    using json = nlohmann::json;

    namespace {
        Result<uint64_t, KernelFailure> DecodeRevision(const json& value) {
            if (value.is_number_unsigned()) {
                return Result<uint64_t, KernelFailure>::Ok(value.get<uint64_t>());
            }
            if (value.is_number_integer()) {
                return Result<uint64_t, KernelFailure>::Err(
                    KernelFailure::Range("revision is negative"));
            }
            if (value.is_string()) {
                return Encoding::ParseU64(value.get<std::string>()).Context("revision");
            }
            return Result<uint64_t, KernelFailure>::Err(
                KernelFailure::Decode("revision must be an unsigned integer or a decimal string"));
        }

        Result<std::vector<uint8_t>, KernelFailure> DecodeHexField(const json& object, const char* field) {
            const auto it = object.find(field);
            if (it == object.end() || !it->is_string()) {
                return Result<std::vector<uint8_t>, KernelFailure>::Err(
                    KernelFailure::Decode(fmt::format("field '{}' is missing or not a string", field)));
            }
            return Encoding::HexToBuf(it->get<std::string>()).Context(field);
        }

        Result<std::vector<uint8_t>, KernelFailure> DecodeByteField(const json& value, const char* field) {
            if (value.is_string()) {
                return Encoding::B64ToBuf(value.get<std::string>()).Context(field);
            }
            if (!value.is_array()) {
                return Result<std::vector<uint8_t>, KernelFailure>::Err(
                    KernelFailure::Decode(fmt::format("field '{}' must be a byte array", field)));
            }
            std::vector<uint8_t> bytes;
            bytes.reserve(value.size());
            for (const auto& element : value) {
                if (!element.is_number_unsigned() || element.get<uint64_t>() > 0xFF) {
                    return Result<std::vector<uint8_t>, KernelFailure>::Err(
                        KernelFailure::Decode(fmt::format("field '{}' contains a non-byte value", field)));
                }
                bytes.push_back(static_cast<uint8_t>(element.get<uint64_t>()));
            }
            return Result<std::vector<uint8_t>, KernelFailure>::Ok(std::move(bytes));
        }

        template<size_t N>
        Result<std::array<uint8_t, N>, KernelFailure> ToFixed(
            const std::vector<uint8_t>& bytes, const char* field) {
            if (bytes.size() != N) {
                return Result<std::array<uint8_t, N>, KernelFailure>::Err(
                    KernelFailure::Decode(fmt::format(
                        "field '{}' has {} bytes, expected {}", field, bytes.size(), N)));
            }
            std::array<uint8_t, N> fixed{};
            std::copy(bytes.begin(), bytes.end(), fixed.begin());
            return Result<std::array<uint8_t, N>, KernelFailure>::Ok(fixed);
        }

        Result<json, KernelFailure> ParseObject(const std::string_view text) {
            auto parsed = json::parse(text.begin(), text.end(), nullptr, false);
            if (parsed.is_discarded()) {
                return Result<json, KernelFailure>::Err(KernelFailure::Decode("body is not valid JSON"));
            }
            if (!parsed.is_object()) {
                return Result<json, KernelFailure>::Err(KernelFailure::Decode("body is not a JSON object"));
            }
            return Result<json, KernelFailure>::Ok(std::move(parsed));
        }

        Result<models::RegistryEntry, KernelFailure> DecodeProofEntry(const json& object) {
            if (!object.is_object()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(
                    KernelFailure::Decode("proof element is not an object"));
            }
            models::RegistryEntry entry;

            auto data = DecodeHexField(object, "data");
            if (data.IsErr()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(data.UnwrapErr());
            }
            entry.data = std::move(data).Unwrap();

            const auto revision_it = object.find("revision");
            if (revision_it == object.end()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(
                    KernelFailure::Decode("field 'revision' is missing"));
            }
            auto revision = DecodeRevision(*revision_it);
            if (revision.IsErr()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(revision.UnwrapErr());
            }
            entry.revision = revision.Unwrap();

            auto datakey = DecodeHexField(object, "datakey")
                .Bind([](std::vector<uint8_t> bytes) { return ToFixed<RegistryConstants::DATAKEY_SIZE>(bytes, "datakey"); });
            if (datakey.IsErr()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(datakey.UnwrapErr());
            }
            entry.datakey = datakey.Unwrap();

            auto signature = DecodeHexField(object, "signature")
                .Bind([](std::vector<uint8_t> bytes) { return ToFixed<Constants::ED_25519_SIGNATURE_SIZE>(bytes, "signature"); });
            if (signature.IsErr()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(signature.UnwrapErr());
            }
            entry.signature = signature.Unwrap();

            const auto pk_it = object.find("publickey");
            if (pk_it == object.end() || !pk_it->is_object() || !pk_it->contains("key") ||
                !pk_it->contains("algorithm") || !pk_it->at("algorithm").is_string() ||
                pk_it->at("algorithm").get<std::string>() != RegistryConstants::ALGORITHM) {
                return Result<models::RegistryEntry, KernelFailure>::Err(
                    KernelFailure::Decode("field 'publickey' must be an ed25519 key object"));
            }
            auto public_key = DecodeByteField(pk_it->at("key"), "publickey")
                .Bind([](std::vector<uint8_t> bytes) { return ToFixed<Constants::ED_25519_PUBLIC_KEY_SIZE>(bytes, "publickey"); });
            if (public_key.IsErr()) {
                return Result<models::RegistryEntry, KernelFailure>::Err(public_key.UnwrapErr());
            }
            entry.public_key = public_key.Unwrap();
            return Result<models::RegistryEntry, KernelFailure>::Ok(std::move(entry));
        }
    }

    std::string RegistryWire::BuildReadEndpoint(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> datakey) {
        return fmt::format("{}?publickey={}{}&datakey={}",
                           RegistryConstants::ENDPOINT,
                           RegistryConstants::PUBKEY_PREFIX,
                           Encoding::BufToHex(public_key),
                           Encoding::BufToHex(datakey));
    }

    Result<RegistryReadResponse, KernelFailure> RegistryWire::ParseReadResponse(const std::string_view body) {
        auto parsed = ParseObject(body);
        if (parsed.IsErr()) {
            return Result<RegistryReadResponse, KernelFailure>::Err(parsed.UnwrapErr());
        }
        const auto& object = parsed.Unwrap();
        RegistryReadResponse response;

        auto data = DecodeHexField(object, "data");
        if (data.IsErr()) {
            return Result<RegistryReadResponse, KernelFailure>::Err(data.UnwrapErr());
        }
        response.data = std::move(data).Unwrap();
        if (response.data.size() > RegistryConstants::MAX_DATA_SIZE) {
            return Result<RegistryReadResponse, KernelFailure>::Err(
                KernelFailure::DataTooLarge(std::string(ErrorMessages::REGISTRY_DATA_TOO_LARGE)));
        }

        const auto revision_it = object.find("revision");
        if (revision_it == object.end()) {
            return Result<RegistryReadResponse, KernelFailure>::Err(
                KernelFailure::Decode("field 'revision' is missing"));
        }
        auto revision = DecodeRevision(*revision_it);
        if (revision.IsErr()) {
            return Result<RegistryReadResponse, KernelFailure>::Err(revision.UnwrapErr());
        }
        response.revision = revision.Unwrap();

        auto signature = DecodeHexField(object, "signature")
            .Bind([](std::vector<uint8_t> bytes) { return ToFixed<Constants::ED_25519_SIGNATURE_SIZE>(bytes, "signature"); });
        if (signature.IsErr()) {
            return Result<RegistryReadResponse, KernelFailure>::Err(signature.UnwrapErr());
        }
        response.signature = signature.Unwrap();
        return Result<RegistryReadResponse, KernelFailure>::Ok(std::move(response));
    }

    std::string RegistryWire::BuildWriteBody(const models::RegistryEntry& entry) {
        const json body = {
            {"publickey", {
                {"algorithm", std::string(RegistryConstants::ALGORITHM)},
                {"key", std::vector<uint8_t>(entry.public_key.begin(), entry.public_key.end())}
            }},
            {"datakey", Encoding::BufToHex(entry.datakey)},
            {"revision", entry.revision},
            {"data", entry.data},
            {"signature", std::vector<uint8_t>(entry.signature.begin(), entry.signature.end())}
        };
        return body.dump();
    }

    Result<models::RegistryEntry, KernelFailure> RegistryWire::ParseWriteBody(const std::string_view body) {
        auto parsed = ParseObject(body);
        if (parsed.IsErr()) {
            return Result<models::RegistryEntry, KernelFailure>::Err(parsed.UnwrapErr());
        }
        const auto& object = parsed.Unwrap();
        if (!object.contains("publickey") || !object.contains("data") ||
            !object.contains("signature") || !object.contains("revision")) {
            return Result<models::RegistryEntry, KernelFailure>::Err(
                KernelFailure::Decode("write body is missing a field"));
        }
        // Reuse the proof decoder by normalizing byte arrays to hex.
        json normalized = object;
        auto data = DecodeByteField(object.at("data"), "data");
        if (data.IsErr()) {
            return Result<models::RegistryEntry, KernelFailure>::Err(data.UnwrapErr());
        }
        auto signature = DecodeByteField(object.at("signature"), "signature");
        if (signature.IsErr()) {
            return Result<models::RegistryEntry, KernelFailure>::Err(signature.UnwrapErr());
        }
        normalized["data"] = Encoding::BufToHex(data.Unwrap());
        normalized["signature"] = Encoding::BufToHex(signature.Unwrap());
        return DecodeProofEntry(normalized).Context("invalid registry write body");
    }

    Result<std::vector<models::RegistryEntry>, KernelFailure> RegistryWire::ParseProofChain(
        const std::string_view header) {
        auto parsed = json::parse(header.begin(), header.end(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array()) {
            return Result<std::vector<models::RegistryEntry>, KernelFailure>::Err(
                KernelFailure::Decode("proof is not a JSON array"));
        }
        std::vector<models::RegistryEntry> chain;
        chain.reserve(parsed.size());
        for (size_t i = 0; i < parsed.size(); ++i) {
            auto entry = DecodeProofEntry(parsed[i]);
            if (entry.IsErr()) {
                return Result<std::vector<models::RegistryEntry>, KernelFailure>::Err(
                    entry.UnwrapErr().WithContext(fmt::format("proof element {}", i)));
            }
            chain.push_back(std::move(entry).Unwrap());
        }
        return Result<std::vector<models::RegistryEntry>, KernelFailure>::Ok(std::move(chain));
    }
}
