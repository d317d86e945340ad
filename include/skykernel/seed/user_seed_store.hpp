#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/interfaces/i_key_value_storage.hpp"
#include "skykernel/models/seed.hpp"
#include <memory>
#include <span>
#include <string_view>
namespace skykernel::seed {
/**
 * @brief Persists the user seed under the "v1-seed" storage key
 *
 * The stored value is the raw 16 seed bytes carried in a string. A missing
 * key means the user has not logged in.
 */
class UserSeedStore {
public:
    explicit UserSeedStore(std::shared_ptr<interfaces::IKeyValueStorage> storage);

    /// Ok(seed), Err(NotAuthenticated) when no seed is stored.
    [[nodiscard]] Result<models::Seed, KernelFailure> LoadSeed() const;

    [[nodiscard]] Result<Unit, KernelFailure> StoreSeed(std::span<const uint8_t> seed);

    /// Validates the phrase and stores the seed it encodes.
    [[nodiscard]] Result<Unit, KernelFailure> LogIn(std::string_view seed_phrase);

    /// Clears all local storage, not just the seed.
    [[nodiscard]] Result<Unit, KernelFailure> LogOut();

    [[nodiscard]] Result<bool, KernelFailure> IsAuthenticated() const;
private:
    std::shared_ptr<interfaces::IKeyValueStorage> storage_;
};
}
