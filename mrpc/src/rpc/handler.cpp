#include "handler.hpp"

#include <stdexcept>

namespace mrpc::rpc {

void HandlerRegistry::add(const std::string& method, std::shared_ptr<Handler> handler) {
    if (method.empty()) {
        throw std::invalid_argument("mrpc: handler method name is empty");
    }
    if (!handler) {
        throw std::invalid_argument("mrpc: null handler for " + method);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.insert_or_assign(method, std::move(handler));
}

std::shared_ptr<Handler> HandlerRegistry::find(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace mrpc::rpc
