#pragma once
#include <string>
#include <string_view>
namespace skykernel {
enum class SodiumFailureType {
    InitializationFailed
};
enum class KernelFailureType {
    Generic,
    InvalidInput,
    Range,
    Decode,
    WordNotFound,
    InvalidChecksum,
    InvalidSeedLength,
    TagTooLong,
    InvalidKeyLength,
    DataTooLarge,
    InvalidBitfield,
    InvalidPath,
    InvalidMetadata,
    KeyGeneration,
    Signature,
    Transport,
    Verification,
    NotFound,
    NotAuthenticated,
    Cancelled
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
};
class KernelFailure {
public:
    KernelFailureType type;
    std::string message;
    KernelFailure(const KernelFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    /// Returns a copy whose message reads "<context>: <message>". The kind is
    /// kept so callers can still branch on the original failure.
    [[nodiscard]] KernelFailure WithContext(std::string_view context) const {
        std::string annotated(context);
        annotated += ": ";
        annotated += message;
        return {type, std::move(annotated)};
    }

    static KernelFailure Generic(std::string msg) {
        return {KernelFailureType::Generic, std::move(msg)};
    }
    static KernelFailure InvalidInput(std::string msg) {
        return {KernelFailureType::InvalidInput, std::move(msg)};
    }
    static KernelFailure Range(std::string msg) {
        return {KernelFailureType::Range, std::move(msg)};
    }
    static KernelFailure Decode(std::string msg) {
        return {KernelFailureType::Decode, std::move(msg)};
    }
    static KernelFailure WordNotFound(std::string msg) {
        return {KernelFailureType::WordNotFound, std::move(msg)};
    }
    static KernelFailure InvalidChecksum(std::string msg) {
        return {KernelFailureType::InvalidChecksum, std::move(msg)};
    }
    static KernelFailure InvalidSeedLength(std::string msg) {
        return {KernelFailureType::InvalidSeedLength, std::move(msg)};
    }
    static KernelFailure TagTooLong(std::string msg) {
        return {KernelFailureType::TagTooLong, std::move(msg)};
    }
    static KernelFailure InvalidKeyLength(std::string msg) {
        return {KernelFailureType::InvalidKeyLength, std::move(msg)};
    }
    static KernelFailure DataTooLarge(std::string msg) {
        return {KernelFailureType::DataTooLarge, std::move(msg)};
    }
    static KernelFailure InvalidBitfield(std::string msg) {
        return {KernelFailureType::InvalidBitfield, std::move(msg)};
    }
    static KernelFailure InvalidPath(std::string msg) {
        return {KernelFailureType::InvalidPath, std::move(msg)};
    }
    static KernelFailure InvalidMetadata(std::string msg) {
        return {KernelFailureType::InvalidMetadata, std::move(msg)};
    }
    static KernelFailure KeyGeneration(std::string msg) {
        return {KernelFailureType::KeyGeneration, std::move(msg)};
    }
    static KernelFailure Signature(std::string msg) {
        return {KernelFailureType::Signature, std::move(msg)};
    }
    static KernelFailure Transport(std::string msg) {
        return {KernelFailureType::Transport, std::move(msg)};
    }
    static KernelFailure Verification(std::string msg) {
        return {KernelFailureType::Verification, std::move(msg)};
    }
    static KernelFailure NotFound(std::string msg) {
        return {KernelFailureType::NotFound, std::move(msg)};
    }
    static KernelFailure NotAuthenticated(std::string msg) {
        return {KernelFailureType::NotAuthenticated, std::move(msg)};
    }
    static KernelFailure Cancelled(std::string msg) {
        return {KernelFailureType::Cancelled, std::move(msg)};
    }
    static KernelFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic("libsodium: " + sf.message);
    }
};
}
