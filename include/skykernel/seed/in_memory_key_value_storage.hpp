#pragma once
#include "skykernel/interfaces/i_key_value_storage.hpp"
#include <map>
#include <mutex>
#include <string>
namespace skykernel::seed {
class InMemoryKeyValueStorage final : public interfaces::IKeyValueStorage {
public:
    InMemoryKeyValueStorage() = default;
    ~InMemoryKeyValueStorage() override;

    [[nodiscard]] Result<Option<std::string>, KernelFailure> Get(std::string_view key) override;
    [[nodiscard]] Result<Unit, KernelFailure> Set(std::string_view key, std::string value) override;
    [[nodiscard]] Result<Unit, KernelFailure> Remove(std::string_view key) override;
    [[nodiscard]] Result<Unit, KernelFailure> Clear() override;

    [[nodiscard]] size_t Size() const;
private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> values_;
};
}
