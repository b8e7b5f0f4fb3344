#include "umcp/server/handler_registry.hpp"

#include "umcp/log/logger.hpp"

namespace umcp {

void HandlerRegistry::register_handler(std::string method, std::shared_ptr<IHandler> handler) {
    if (method.empty()) {
        throw RegistrationError("Handler method name must not be empty");
    }
    if (handler == nullptr) {
        throw RegistrationError("Handler for method " + method + " must not be null");
    }

    const auto it = handlers_.find(method);
    if (it != handlers_.end()) {
        const bool same_handler = (it->second == handler);
        if (same_handler) {
            return;
        }
        throw RegistrationError("A different handler is already registered for method " + method);
    }

    UMCP_LOG_DEBUG("Registered handler for method: {}", method);
    handlers_.emplace(std::move(method), std::move(handler));
}

bool HandlerRegistry::unregister_handler(std::string_view method) {
    const auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return false;
    }
    handlers_.erase(it);
    UMCP_LOG_DEBUG("Unregistered handler for method: {}", method);
    return true;
}

std::shared_ptr<IHandler> HandlerRegistry::find(std::string_view method) const {
    const auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool HandlerRegistry::contains(std::string_view method) const {
    return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> HandlerRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace umcp
