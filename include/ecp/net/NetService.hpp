#pragma once
#include "ecp/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace ecp::net {

/**
 * @brief Owns the `io_context` and the one thread that runs it.
 *
 * `with_deadline` blocks the caller until a handler on this thread releases
 * it, so every socket the library opens must be bound to this context. The
 * work guard keeps `run()` alive between discovery rounds when nothing is
 * pending.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    std::shared_ptr<asio::io_context> context() const { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread runner_;
};

/// Context of the process-wide service, started on first use. Clients hold
/// the returned pointer; the service itself lives until static destruction.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace ecp::net
