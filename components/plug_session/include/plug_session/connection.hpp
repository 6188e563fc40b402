#pragma once

#include "plug_session/types.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace plug_session {

/**
 * @class IConnection
 * @brief One request/response stream to a plug
 *
 * Every call is bounded by the timeout it is given. Implementations must
 * not throw; failures come back as CONNECT_ERROR, TIMEOUT or
 * TRANSPORT_ERROR results.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Open the connection
     *
     * @param host IPv4 address or host name of the plug
     * @param port TCP port
     * @param timeout Deadline for the whole connect
     * @return VoidResult CONNECT_ERROR on failure or timeout
     */
    virtual VoidResult connect(const std::string& host, uint16_t port,
                               std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Write the whole buffer
     */
    virtual VoidResult write(const std::vector<uint8_t>& data,
                             std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Perform a single read of at most maxBytes
     *
     * An orderly close by the peer yields an empty buffer, not an error.
     */
    virtual Result<std::vector<uint8_t>> read(size_t maxBytes,
                                              std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @class IConnectionFactory
 * @brief Creates a fresh connection for each controller operation
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;
    virtual std::unique_ptr<IConnection> createConnection() = 0;
};

/**
 * @class TcpConnection
 * @brief Blocking-with-deadline TCP connection over a private io_context
 *
 * Each operation starts an asynchronous call and runs the io_context for at
 * most the timeout. If the call has not completed by then the socket is
 * closed, which aborts the pending handler.
 */
class TcpConnection : public IConnection {
public:
    TcpConnection();
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    VoidResult connect(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout) override;
    VoidResult write(const std::vector<uint8_t>& data,
                     std::chrono::milliseconds timeout) override;
    Result<std::vector<uint8_t>> read(size_t maxBytes,
                                      std::chrono::milliseconds timeout) override;
    void close() override;

    bool isOpen() const { return socket_.is_open(); }

private:
    // Returns false if the deadline passed before the pending operation finished
    bool runFor(std::chrono::milliseconds timeout);
    bool runFor(std::chrono::milliseconds timeout, const std::function<void()>& cancel);

    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::socket socket_;
    std::string peer_;
};

class TcpConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IConnection> createConnection() override;
};

} // namespace plug_session
