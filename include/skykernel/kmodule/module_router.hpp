#pragma once

#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/kmodule/messages.pb.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace skykernel::registry {
class RegistryClient;
}

namespace skykernel::kmodule {

/// Turns a query's data into response data.
using MethodHandler = std::function<Result<std::string, KernelFailure>(const std::string& data)>;

/**
 * @brief Dispatches module queries by method name
 *
 * Every query gets exactly one response carrying its nonce: the handler's
 * data, or an err for unknown methods, handler failures and handler
 * exceptions.
 */
class ModuleRouter {
public:
    static constexpr std::string_view READ_ENTRY_METHOD = "readEntry";

    /// Err(InvalidInput) when the method name is empty or already taken.
    [[nodiscard]] Result<Unit, KernelFailure> RegisterMethod(std::string method, MethodHandler handler);

    [[nodiscard]] bool HasMethod(std::string_view method) const;

    [[nodiscard]] proto::ModuleMessage HandleMessage(const proto::ModuleMessage& query) const;

    /**
     * @brief Parse a serialized query and return the serialized response
     *
     * @return Err(Decode) only when the bytes are not a ModuleMessage, since
     *         no nonce is available to answer
     */
    [[nodiscard]] Result<std::string, KernelFailure> HandleMessageBytes(std::string_view bytes) const;

private:
    std::map<std::string, MethodHandler, std::less<>> handlers_;
};

/// Registers readEntry (ReadEntryRequest in, ReadEntryResponse out).
[[nodiscard]] Result<Unit, KernelFailure> RegisterReadEntry(
    ModuleRouter& router,
    std::shared_ptr<const registry::RegistryClient> client);

} // namespace skykernel::kmodule
