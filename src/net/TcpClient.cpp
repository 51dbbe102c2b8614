#include "anthem/net/TcpClient.hpp"

#include "anthem/net/Deadline.hpp"
#include "anthem/net/NetService.hpp"
#include "anthem/net/Resolve.hpp"
#include "anthem/log/Log.hpp"

namespace anthem::net {

TcpClient::TcpClient()
: TcpClient(shared_io_context())
{}

TcpClient::TcpClient(std::shared_ptr<asio::io_context> io)
: io_(std::move(io))
, strand_(asio::make_strand(*io_))
, socket_(strand_)
{}

TcpClient::~TcpClient() {
    close();
}

std::error_code TcpClient::connect(const std::string& host,
                                   std::uint16_t port,
                                   duration timeout) {
    tcp::resolver::results_type results;
    if (auto ec = resolve(*io_, host, port, results); ec) {
        logError("[TcpClient] cannot resolve ", host, ": ", ec.message(), "\n");
        return ec;
    }

    std::error_code last = asio::error::host_not_found;
    for (const auto& entry : results) {
        auto ec = connect(entry.endpoint(), timeout);
        if (!ec) return ec;   // success
        last = ec;            // remember last error and try the next address
    }
    return last;
}

std::error_code TcpClient::connect(const tcp::endpoint& endpoint, duration timeout) {
    close();
    cancelRequested_ = false;
    auto ec = connectOne(endpoint, timeout);
    open_ = !ec;
    return ec;
}

std::error_code TcpClient::connectOne(const tcp::endpoint& endpoint, duration timeout) {
    auto result = with_deadline(strand_, sanitize(timeout),
        [this, endpoint](auto done) {
            socket_.async_connect(endpoint, [this, done](const std::error_code& ec) mutable {
                if (!ec && !socket_.is_open()) {
                    // Connected just as the deadline closed the socket.
                    done(asio::error::timed_out, 0);
                    return;
                }
                if (!ec) {
                    std::error_code opt_ec;
                    socket_.set_option(tcp::no_delay(true), opt_ec);
                    socket_.set_option(asio::socket_base::keep_alive(true), opt_ec);
                }
                done(ec, 0);
            });
        },
        [this] {
            // A half-open connect is useless after a timeout; drop it.
            std::error_code ec;
            socket_.close(ec);
        });
    return result.ec;
}

std::error_code TcpClient::readSome(char* buffer,
                                    std::size_t capacity,
                                    duration timeout,
                                    std::size_t& bytesRead) {
    bytesRead = 0;
    if (cancelRequested_) {
        return asio::error::operation_aborted;
    }

    auto result = with_deadline(strand_, sanitize(timeout),
        [this, buffer, capacity](auto done) {
            if (cancelRequested_) {
                done(asio::error::operation_aborted, 0);
                return;
            }
            socket_.async_read_some(asio::buffer(buffer, capacity),
                [done](const std::error_code& ec, std::size_t n) mutable {
                    done(ec, n);
                });
        },
        [this] {
            std::error_code ec;
            socket_.cancel(ec);
        });

    bytesRead = result.bytesTransferred;
    if (result.ec == asio::error::timed_out && cancelRequested_) {
        return asio::error::operation_aborted;
    }
    return result.ec;
}

std::error_code TcpClient::writeAll(std::string_view data) {
    // Owned copy: the bytes must stay alive until the write handler runs.
    auto payload = std::make_shared<std::string>(data);
    auto result = await_completion(strand_,
        [this, payload](auto done) {
            asio::async_write(socket_, asio::buffer(*payload),
                [done, payload](const std::error_code& ec, std::size_t n) mutable {
                    done(ec, n);
                });
        });
    return result.ec;
}

void TcpClient::cancel() {
    cancelRequested_ = true;
    asio::post(strand_, [this] {
        std::error_code ec;
        socket_.cancel(ec);
    });
}

void TcpClient::close() {
    open_ = false;
    // Round-trip through the strand so every handler posted before this call
    // has run by the time we return.
    await_completion(strand_, [this](auto done) {
        closeOnStrand();
        done(std::error_code{}, 0);
    });
}

void TcpClient::closeOnStrand() {
    if (!socket_.is_open()) return;
    std::error_code ec;
    // cancel -> shutdown -> close
    socket_.cancel(ec);
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    logInfo("[TcpClient] socket closed\n");
}

} // namespace anthem::net
