#pragma once

#include "umcp/server/handler.hpp"

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace umcp {

/// Raised for a bad registration. Surfaces at startup, never per request.
class RegistrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// Handler Registry
// ─────────────────────────────────────────────────────────────────────────────

/// Method name to handler. Filled before the server accepts connections and
/// read-only afterwards, so lookups take no lock.
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;
    HandlerRegistry(HandlerRegistry&&) = delete;
    HandlerRegistry& operator=(HandlerRegistry&&) = delete;

    /// Bind method to handler. Re-registering the same handler object is a
    /// no-op; binding a different one to a taken name throws.
    void register_handler(std::string method, std::shared_ptr<IHandler> handler);

    /// Construct and register in one step.
    template <typename Handler, typename... Args>
        requires std::derived_from<Handler, IHandler>
    std::shared_ptr<Handler> emplace(std::string method, Args&&... args) {
        auto handler = std::make_shared<Handler>(std::forward<Args>(args)...);
        register_handler(std::move(method), handler);
        return handler;
    }

    /// Returns false when nothing was registered under the name.
    bool unregister_handler(std::string_view method);

    [[nodiscard]] std::shared_ptr<IHandler> find(std::string_view method) const;
    [[nodiscard]] bool contains(std::string_view method) const;
    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> methods() const;

private:
    std::map<std::string, std::shared_ptr<IHandler>, std::less<>> handlers_;
};

}  // namespace umcp
