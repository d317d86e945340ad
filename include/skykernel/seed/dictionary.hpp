#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/constants.hpp"
#include <array>
#include <cstdint>
#include <string_view>
namespace skykernel::seed {
using WordList = std::array<std::string_view, SeedConstants::DICTIONARY_SIZE>;

/**
 * @brief The 1024-word seed phrase dictionary
 *
 * Every word has a unique three-character prefix, so a phrase word only has
 * to match on its first three characters. The table order is part of the
 * seed phrase format and must never change.
 */
class Dictionary {
public:
    static const WordList& Words() noexcept;

    static std::string_view WordAt(uint16_t index) noexcept;

    /// Finds the index of the dictionary word sharing the prefix of word.
    static Result<uint16_t, KernelFailure> IndexOf(std::string_view word);

    static std::string_view Prefix(std::string_view word) noexcept;
private:
    Dictionary() = delete;
};
}
