#include "qlink/net/NetService.hpp"
#include "qlink/log/Log.hpp"

namespace qlink::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>(1))
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ io_->run(); })
{
    logDebug("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace qlink::net
