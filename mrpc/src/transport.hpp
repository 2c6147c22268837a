#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace mrpc::transport {

class Reader {
public:
    virtual ~Reader() = default;

    /// Reads up to `size` bytes. Returns 0 at end of input.
    /// Throws TransportError on failure.
    virtual std::size_t read(char* data, std::size_t size) = 0;
};

class Writer {
public:
    virtual ~Writer() = default;

    /// Writes all `size` bytes or throws TransportError.
    virtual void write(const char* data, std::size_t size) = 0;
};

class Closer {
public:
    virtual ~Closer() = default;
    virtual void close() = 0;
};

/**
 * Byte stream over file descriptors.
 *
 * Either one duplex descriptor (a connected socket) or a read/write pair
 * (pipes to a child process, or stdin/stdout). The stream owns the
 * descriptors unless constructed with `owns_fds = false`.
 */
class FdStream final : public Reader, public Writer, public Closer {
public:
    explicit FdStream(int fd, bool owns_fds = true);
    FdStream(int read_fd, int write_fd, bool owns_fds = true);
    ~FdStream() override;

    FdStream(const FdStream&) = delete;
    FdStream& operator=(const FdStream&) = delete;

    std::size_t read(char* data, std::size_t size) override;
    void write(const char* data, std::size_t size) override;

    /// Shuts down sockets and closes the write side, so a blocked reader
    /// (ours or the peer's) sees end of input. The read descriptor itself
    /// is released by the destructor. Never waits for a writer: when a
    /// write is in flight, that writer closes the write side on its way out.
    void close() override;

private:
    /// Caller holds write_mutex_.
    void release_write_fd();
    void try_release_write_fd();

    int read_fd_ = -1;
    int write_fd_ = -1;
    bool owns_fds_ = true;
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;
};

/**
 * Unix domain socket listener accepting one FdStream per connection.
 */
class Listener {
public:
    explicit Listener(std::string socket_path);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /// Binds and listens, replacing a stale socket file.
    bool start();

    /// Blocks for the next connection. Returns nullptr once stopped.
    std::unique_ptr<FdStream> accept();

    /// Unblocks accept() and removes the socket file.
    void stop();

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    std::atomic<int> server_fd_{-1};
};

/// Connects to "host:port" over TCP, anything else is a Unix socket path.
std::unique_ptr<FdStream> dial(const std::string& address);

/// Creates a connected pair of Unix stream sockets.
void make_socket_pair(std::unique_ptr<FdStream>& first, std::unique_ptr<FdStream>& second);

} // namespace mrpc::transport
