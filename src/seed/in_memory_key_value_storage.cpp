#include "skykernel/seed/in_memory_key_value_storage.hpp"
#include "skykernel/crypto/sodium_interop.hpp"

namespace skykernel::seed {
    namespace {
        void WipeValue(std::string& value) {
            crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(value.data()), value.size()));
        }
    }

    InMemoryKeyValueStorage::~InMemoryKeyValueStorage() {
        for (auto& [key, value] : values_) {
            WipeValue(value);
        }
    }

    Result<Option<std::string>, KernelFailure> InMemoryKeyValueStorage::Get(const std::string_view key) {
        std::lock_guard lock(mutex_);
        const auto it = values_.find(key);
        if (it == values_.end()) {
            return Result<Option<std::string>, KernelFailure>::Ok(None<std::string>());
        }
        return Result<Option<std::string>, KernelFailure>::Ok(Some(it->second));
    }

    Result<Unit, KernelFailure> InMemoryKeyValueStorage::Set(const std::string_view key, std::string value) {
        std::lock_guard lock(mutex_);
        const auto it = values_.find(key);
        if (it != values_.end()) {
            WipeValue(it->second);
            it->second = std::move(value);
        } else {
            values_.emplace(std::string(key), std::move(value));
        }
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    Result<Unit, KernelFailure> InMemoryKeyValueStorage::Remove(const std::string_view key) {
        std::lock_guard lock(mutex_);
        const auto it = values_.find(key);
        if (it != values_.end()) {
            WipeValue(it->second);
            values_.erase(it);
        }
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    Result<Unit, KernelFailure> InMemoryKeyValueStorage::Clear() {
        std::lock_guard lock(mutex_);
        for (auto& [key, value] : values_) {
            WipeValue(value);
        }
        values_.clear();
        return Result<Unit, KernelFailure>::Ok(unit);
    }

    size_t InMemoryKeyValueStorage::Size() const {
        std::lock_guard lock(mutex_);
        return values_.size();
    }
}
