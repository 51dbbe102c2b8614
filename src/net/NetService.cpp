#include "anthem/net/NetService.hpp"
#include "anthem/log/Log.hpp"

#include <exception>

namespace anthem::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ runLoop(); })
{
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

void NetService::runLoop() {
    // A throwing handler must not take the I/O thread down with it; log and
    // resume until the context is stopped.
    while (!io_->stopped()) {
        try {
            io_->run();
        } catch (const std::exception& e) {
            logError("[NetService] handler threw: ", e.what(), "\n");
        }
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace anthem::net
