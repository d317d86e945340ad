#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/option.hpp"
#include <string>
#include <string_view>
namespace skykernel::interfaces {
/// Local client storage holding string values under string keys.
class IKeyValueStorage {
public:
    virtual ~IKeyValueStorage() = default;
    [[nodiscard]] virtual Result<Option<std::string>, KernelFailure> Get(std::string_view key) = 0;
    [[nodiscard]] virtual Result<Unit, KernelFailure> Set(std::string_view key, std::string value) = 0;
    [[nodiscard]] virtual Result<Unit, KernelFailure> Remove(std::string_view key) = 0;
    [[nodiscard]] virtual Result<Unit, KernelFailure> Clear() = 0;
};
}
