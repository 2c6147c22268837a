#include "transport.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace mrpc::transport {

namespace {

std::string errno_message(const char* what) {
    return std::string("mrpc: ") + what + ": " + std::strerror(errno);
}

bool is_socket(int fd) {
    int type = 0;
    socklen_t len = sizeof(type);
    return ::getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &len) == 0;
}

std::unique_ptr<FdStream> dial_unix(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw TransportError(errno_message("socket"));
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        ::close(fd);
        throw TransportError("mrpc: socket path too long: " + path);
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string message = errno_message("connect");
        ::close(fd);
        throw TransportError(message + " (" + path + ")");
    }

    return std::make_unique<FdStream>(fd);
}

std::unique_ptr<FdStream> dial_tcp(const std::string& address) {
    auto colon = address.rfind(':');
    std::string host = address.substr(0, colon);
    std::string port = address.substr(colon + 1);
    if (host.empty()) {
        host = "127.0.0.1";
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError(std::string("mrpc: getaddrinfo: ") + ::gai_strerror(rc) + " (" + address + ")");
    }

    std::string last_error = "mrpc: no address for " + address;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_message("socket");
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            ::freeaddrinfo(result);
            return std::make_unique<FdStream>(fd);
        }
        last_error = errno_message("connect");
        ::close(fd);
    }

    ::freeaddrinfo(result);
    throw TransportError(last_error + " (" + address + ")");
}

} // namespace

FdStream::FdStream(int fd, bool owns_fds) : FdStream(fd, fd, owns_fds) {}

FdStream::FdStream(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {}

FdStream::~FdStream() {
    close();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        release_write_fd();
    }
    if (owns_fds_ && read_fd_ >= 0) {
        ::close(read_fd_);
    }
}

std::size_t FdStream::read(char* data, std::size_t size) {
    for (;;) {
        ssize_t n = ::read(read_fd_, data, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (closed_ && (errno == EBADF || errno == ECONNRESET)) {
            return 0;
        }
        throw TransportError(errno_message("read"));
    }
}

void FdStream::write(const char* data, std::size_t size) {
    std::unique_lock<std::mutex> lock(write_mutex_);

    // Runs on every exit path. A close() that arrived mid-write left the
    // write descriptor to us.
    struct ExitGuard {
        FdStream& stream;
        std::unique_lock<std::mutex>& lock;
        ~ExitGuard() {
            lock.unlock();
            if (stream.closed_) {
                stream.try_release_write_fd();
            }
        }
    } exit_guard{*this, lock};

    if (closed_) {
        throw ClosedError();
    }

    std::size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::send(write_fd_, data + offset, size - offset, MSG_NOSIGNAL);
        if (n < 0 && errno == ENOTSOCK) {
            n = ::write(write_fd_, data + offset, size - offset);
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(errno_message("write"));
        }
        offset += static_cast<std::size_t>(n);
    }
}

void FdStream::close() {
    if (closed_.exchange(true)) {
        return;
    }

    // Unblocks readers and writers parked on a socket.
    if (read_fd_ >= 0 && is_socket(read_fd_)) {
        ::shutdown(read_fd_, SHUT_RDWR);
    }

    try_release_write_fd();
}

void FdStream::try_release_write_fd() {
    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (lock.owns_lock()) {
        release_write_fd();
    }
}

void FdStream::release_write_fd() {
    if (owns_fds_ && write_fd_ >= 0 && write_fd_ != read_fd_) {
        if (::close(write_fd_) < 0) {
            LOG4CPLUS_WARN(core_logger(), errno_message("close"));
        }
    }
    write_fd_ = -1;
}

std::unique_ptr<FdStream> dial(const std::string& address) {
    if (address.find(':') != std::string::npos) {
        return dial_tcp(address);
    }
    return dial_unix(address);
}

void make_socket_pair(std::unique_ptr<FdStream>& first, std::unique_ptr<FdStream>& second) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        throw TransportError(errno_message("socketpair"));
    }
    first = std::make_unique<FdStream>(fds[0]);
    second = std::make_unique<FdStream>(fds[1]);
}

Listener::Listener(std::string socket_path) : socket_path_(std::move(socket_path)) {}

Listener::~Listener() {
    stop();
}

bool Listener::start() {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG4CPLUS_ERROR(core_logger(), errno_message("socket"));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG4CPLUS_ERROR(core_logger(), "Socket path too long: " << socket_path_);
        ::close(fd);
        return false;
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    ::unlink(socket_path_.c_str());

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(core_logger(), errno_message("bind") << " (" << socket_path_ << ")");
        ::close(fd);
        return false;
    }

    if (::listen(fd, 8) < 0) {
        LOG4CPLUS_ERROR(core_logger(), errno_message("listen"));
        ::close(fd);
        return false;
    }

    server_fd_ = fd;
    return true;
}

std::unique_ptr<FdStream> Listener::accept() {
    for (;;) {
        int server_fd = server_fd_;
        if (server_fd < 0) {
            return nullptr;
        }
        int fd = ::accept4(server_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) {
            return std::make_unique<FdStream>(fd);
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (server_fd_ < 0) {
            return nullptr;
        }
        throw TransportError(errno_message("accept"));
    }
}

void Listener::stop() {
    int fd = server_fd_.exchange(-1);
    if (fd < 0) {
        return;
    }
    // shutdown() wakes a thread blocked in accept().
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
    ::unlink(socket_path_.c_str());
}

} // namespace mrpc::transport
