#include "errors.hpp"
#include "logger.hpp"
#include "rpc/endpoint.hpp"
#include "transport.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

/// Key/value store shared by every connection.
class Store {
public:
    void set(const std::string& key, const mrpc::codec::Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    mrpc::codec::Value get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw mrpc::ApplicationError(mrpc::ErrorKind::validation, "no such key: " + key);
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, mrpc::codec::Value> values_;
};

void register_handlers(mrpc::rpc::Endpoint& endpoint, Store& store) {
    endpoint.register_handler("add", [](std::int64_t a, std::int64_t b) { return a + b; });
    endpoint.register_handler("echo", [](const mrpc::codec::Value& value) { return value; });
    endpoint.register_handler("concat", [](const std::string& a, const std::string& b) { return a + b; });
    endpoint.register_handler("sleep", [](std::int64_t millis) {
        std::this_thread::sleep_for(std::chrono::milliseconds(millis));
    });
    endpoint.register_handler("fail", [](int kind, const std::string& message) {
        throw mrpc::ApplicationError(static_cast<mrpc::ErrorKind>(kind), message);
    });
    endpoint.register_handler("set", [&store](const std::string& key, const mrpc::codec::Value& value) {
        store.set(key, value);
    });
    endpoint.register_handler("get", [&store](const std::string& key) { return store.get(key); });

    // Sends `method` back to the caller as a notification carrying `value`.
    endpoint.register_handler("emit", [&endpoint](const std::string& method, const mrpc::codec::Value& value) {
        endpoint.notify(method, value);
    });

    endpoint.register_atomic_handler();
}

int serve_connection(mrpc::transport::FdStream& stream, Store& store) {
    mrpc::rpc::Endpoint endpoint(stream, stream, &stream);
    register_handlers(endpoint, store);
    try {
        endpoint.serve();
    } catch (const mrpc::TransportError& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Connection failed: " << exc.what());
        return 1;
    }
    LOG4CPLUS_DEBUG(core_logger(), "Connection closed");
    return 0;
}

int serve_socket(const std::string& socket_path, Store& store) {
    mrpc::transport::Listener listener(socket_path);
    if (!listener.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to listen on " << socket_path);
        return 1;
    }

    LOG4CPLUS_INFO(core_logger(), "Listening at " << socket_path);

    for (;;) {
        std::unique_ptr<mrpc::transport::FdStream> stream;
        try {
            stream = listener.accept();
        } catch (const mrpc::TransportError& exc) {
            LOG4CPLUS_ERROR(core_logger(), exc.what());
            return 1;
        }
        if (!stream) {
            return 0;
        }
        std::thread([stream = std::move(stream), &store]() mutable { serve_connection(*stream, store); }).detach();
    }
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string socket_path;
    std::string config_path = "log4cplus.ini";

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << MRPC_VERSION_STRING << std::endl;
            std::cout << "Commit: " << MRPC_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << MRPC_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--socket=", 9) == 0) {
            socket_path = argv[i] + 9;
            continue;
        }

        std::cerr << "Unknown option: " << argv[i] << std::endl;
        return 2;
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    // Write errors surface as TransportError instead.
    ::signal(SIGPIPE, SIG_IGN);

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "mrpc_peer starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << MRPC_VERSION_STRING << ", Commit: " << MRPC_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << MRPC_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Transport: " << (socket_path.empty() ? std::string("stdio") : socket_path));
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    Store store;
    if (!socket_path.empty()) {
        return serve_socket(socket_path, store);
    }

    mrpc::transport::FdStream stdio(STDIN_FILENO, STDOUT_FILENO, false);
    return serve_connection(stdio, store);
}
