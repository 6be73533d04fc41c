#include "ecp/net/NetService.hpp"
#include "ecp/log/Log.hpp"

namespace ecp::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>(1))
, guard_(asio::make_work_guard(*io_))
{
    runner_ = std::thread([io = io_] {
        io->run();
        logDebug("[NetService] I/O loop finished\n");
    });
}

NetService::~NetService() {
    guard_.reset();
    io_->stop();
    if (runner_.joinable()) {
        runner_.join();
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    static NetService service;
    return service.context();
}

} // namespace ecp::net
