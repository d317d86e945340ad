#include "skykernel/seed/user_seed_store.hpp"
#include "skykernel/seed/seed_phrase.hpp"
#include "skykernel/crypto/sodium_interop.hpp"
#include "skykernel/debug/trace_logger.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace skykernel::seed {
    UserSeedStore::UserSeedStore(std::shared_ptr<interfaces::IKeyValueStorage> storage)
        : storage_(std::move(storage)) {
        if (!storage_) {
            throw std::invalid_argument("UserSeedStore requires a storage backend");
        }
    }

    Result<models::Seed, KernelFailure> UserSeedStore::LoadSeed() const {
        auto stored = storage_->Get(StorageConstants::USER_SEED_KEY);
        if (stored.IsErr()) {
            return Result<models::Seed, KernelFailure>::Err(
                stored.UnwrapErr().WithContext("unable to read user seed"));
        }
        auto& value = stored.Unwrap();
        if (!value.has_value()) {
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::NotAuthenticated(std::string(ErrorMessages::NO_USER_SEED)));
        }
        if (value->size() != SeedConstants::SEED_BYTES) {
            const auto size = value->size();
            crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(value->data()), value->size()));
            return Result<models::Seed, KernelFailure>::Err(
                KernelFailure::InvalidSeedLength(fmt::format(
                    "stored user seed has {} bytes, expected {}", size, SeedConstants::SEED_BYTES)));
        }
        models::Seed seed{};
        std::transform(value->begin(), value->end(), seed.begin(),
                       [](const char c) { return static_cast<uint8_t>(c); });
        crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(value->data()), value->size()));
        return Result<models::Seed, KernelFailure>::Ok(seed);
    }

    Result<Unit, KernelFailure> UserSeedStore::StoreSeed(const std::span<const uint8_t> seed) {
        if (seed.size() != SeedConstants::SEED_BYTES) {
            return Result<Unit, KernelFailure>::Err(
                KernelFailure::InvalidSeedLength(fmt::format(
                    "{}: {}", ErrorMessages::SEED_WRONG_LENGTH, seed.size())));
        }
        std::string value(reinterpret_cast<const char*>(seed.data()), seed.size());
        SKY_LOG_MSG(debug::Component::Storage, "storing user seed");
        return storage_->Set(StorageConstants::USER_SEED_KEY, std::move(value))
            .Context("unable to store user seed");
    }

    Result<Unit, KernelFailure> UserSeedStore::LogIn(const std::string_view seed_phrase) {
        auto seed = SeedPhrase::SeedPhraseToSeed(seed_phrase);
        if (seed.IsErr()) {
            return Result<Unit, KernelFailure>::Err(
                seed.UnwrapErr().WithContext("invalid seed phrase"));
        }
        auto result = StoreSeed(seed.Unwrap());
        crypto::SodiumInterop::SecureWipe(seed.Unwrap());
        return result;
    }

    Result<Unit, KernelFailure> UserSeedStore::LogOut() {
        SKY_LOG_MSG(debug::Component::Storage, "clearing local storage");
        return storage_->Clear().Context("unable to clear local storage");
    }

    Result<bool, KernelFailure> UserSeedStore::IsAuthenticated() const {
        auto stored = storage_->Get(StorageConstants::USER_SEED_KEY);
        if (stored.IsErr()) {
            return Result<bool, KernelFailure>::Err(stored.UnwrapErr());
        }
        return Result<bool, KernelFailure>::Ok(stored.Unwrap().has_value());
    }
}
