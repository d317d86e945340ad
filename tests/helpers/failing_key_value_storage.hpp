#pragma once
#include "skykernel/interfaces/i_key_value_storage.hpp"
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/core/option.hpp"
#include <string>

namespace skykernel::test_helpers {

/// Storage whose every operation fails, for checking error propagation.
class FailingKeyValueStorage : public interfaces::IKeyValueStorage {
public:
    [[nodiscard]] Result<Option<std::string>, KernelFailure> Get(std::string_view) override {
        return Result<Option<std::string>, KernelFailure>::Err(KernelFailure::Generic("disk unavailable"));
    }
    [[nodiscard]] Result<Unit, KernelFailure> Set(std::string_view, std::string) override {
        return Result<Unit, KernelFailure>::Err(KernelFailure::Generic("disk unavailable"));
    }
    [[nodiscard]] Result<Unit, KernelFailure> Remove(std::string_view) override {
        return Result<Unit, KernelFailure>::Err(KernelFailure::Generic("disk unavailable"));
    }
    [[nodiscard]] Result<Unit, KernelFailure> Clear() override {
        return Result<Unit, KernelFailure>::Err(KernelFailure::Generic("disk unavailable"));
    }
};

} // namespace skykernel::test_helpers
