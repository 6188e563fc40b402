#include "plug_session/connection.hpp"

#include <spdlog/spdlog.h>

namespace plug_session {

using boost::asio::ip::tcp;

TcpConnection::TcpConnection()
    : socket_(ioContext_)
{
}

TcpConnection::~TcpConnection() {
    close();
}

bool TcpConnection::runFor(std::chrono::milliseconds timeout) {
    return runFor(timeout, [this] {
        boost::system::error_code ignored;
        socket_.close(ignored);
    });
}

bool TcpConnection::runFor(std::chrono::milliseconds timeout, const std::function<void()>& cancel) {
    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!ioContext_.stopped()) {
        // Cancel the outstanding operation and run until its handler has
        // been invoked with operation_aborted.
        cancel();
        ioContext_.run();
        return false;
    }
    return true;
}

VoidResult TcpConnection::connect(const std::string& host, uint16_t port,
                                  std::chrono::milliseconds timeout) {
    peer_ = host + ":" + std::to_string(port);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    tcp::resolver resolver(ioContext_);
    boost::system::error_code resolveError = boost::asio::error::would_block;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host, std::to_string(port),
        [&resolveError, &endpoints](const boost::system::error_code& error,
                                    tcp::resolver::results_type results) {
            resolveError = error;
            endpoints = std::move(results);
        });

    if (!runFor(timeout, [&resolver] { resolver.cancel(); })) {
        return makeErrorResult(ErrorCode::CONNECT_ERROR,
            "Timed out resolving " + host + " after " + std::to_string(timeout.count()) + "ms");
    }
    if (resolveError) {
        return makeErrorResult(ErrorCode::CONNECT_ERROR,
            "Failed to resolve " + host + ": " + resolveError.message());
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return makeErrorResult(ErrorCode::CONNECT_ERROR,
            "Connection to " + peer_ + " timed out after " + std::to_string(timeout.count()) + "ms");
    }

    boost::system::error_code connectError = boost::asio::error::would_block;
    boost::asio::async_connect(socket_, endpoints,
        [&connectError](const boost::system::error_code& error, const tcp::endpoint&) {
            connectError = error;
        });

    if (!runFor(remaining)) {
        return makeErrorResult(ErrorCode::CONNECT_ERROR,
            "Connection to " + peer_ + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (connectError) {
        return makeErrorResult(ErrorCode::CONNECT_ERROR,
            "Failed to connect to " + peer_ + ": " + connectError.message());
    }

    spdlog::debug("Connected to {}", peer_);
    return makeSuccessResult();
}

VoidResult TcpConnection::write(const std::vector<uint8_t>& data,
                                std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR, "Write on closed connection to " + peer_);
    }

    boost::system::error_code writeError = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(data),
        [&writeError](const boost::system::error_code& error, std::size_t) {
            writeError = error;
        });

    if (!runFor(timeout)) {
        return makeErrorResult(ErrorCode::TIMEOUT,
            "Write to " + peer_ + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (writeError) {
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR,
            "Write to " + peer_ + " failed: " + writeError.message());
    }

    spdlog::debug("Wrote {} bytes to {}", data.size(), peer_);
    return makeSuccessResult();
}

Result<std::vector<uint8_t>> TcpConnection::read(size_t maxBytes,
                                                 std::chrono::milliseconds timeout) {
    using ReadResult = Result<std::vector<uint8_t>>;

    if (!socket_.is_open()) {
        return ReadResult::error(ErrorCode::TRANSPORT_ERROR, "Read on closed connection to " + peer_);
    }

    std::vector<uint8_t> buffer(maxBytes);
    boost::system::error_code readError = boost::asio::error::would_block;
    std::size_t bytesRead = 0;
    socket_.async_read_some(boost::asio::buffer(buffer),
        [&readError, &bytesRead](const boost::system::error_code& error, std::size_t length) {
            readError = error;
            bytesRead = length;
        });

    if (!runFor(timeout)) {
        return ReadResult::error(ErrorCode::TIMEOUT,
            "Read from " + peer_ + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (readError && readError != boost::asio::error::eof) {
        return ReadResult::error(ErrorCode::TRANSPORT_ERROR,
            "Read from " + peer_ + " failed: " + readError.message());
    }

    buffer.resize(bytesRead);
    spdlog::debug("Read {} bytes from {}", bytesRead, peer_);
    return ReadResult::ok(buffer);
}

void TcpConnection::close() {
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

std::unique_ptr<IConnection> TcpConnectionFactory::createConnection() {
    return std::make_unique<TcpConnection>();
}

} // namespace plug_session
