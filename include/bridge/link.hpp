#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <system_error>

#include <asio.hpp>
#include <nlohmann/json.hpp>

namespace nub::bridge
{

class ILinkListener
{
public:
    virtual ~ILinkListener() = default;

    virtual void OnLinkConnected() = 0;
    virtual void OnLinkRecord(const std::string& record) = 0;
    // Called exactly once per connection, synchronously from the point the loss was detected.
    virtual void OnLinkDisconnected() = 0;
};

class ILink
{
public:
    virtual ~ILink() = default;

    virtual std::error_code Listen(const std::string& address, uint16_t port) = 0;
    virtual void Write(const nlohmann::json& record) = 0;
    // Drops the active connection, the listener keeps accepting.
    virtual void Close() = 0;
    // Drops the active connection and stops listening.
    virtual void Stop() = 0;
    virtual bool Connected() const = 0;
};

// Single-client, newline-delimited JSON transport to the hook.
class TcpLink : public ILink, public std::enable_shared_from_this<TcpLink>
{
public:
    TcpLink(asio::io_context& io, ILinkListener& listener);
    ~TcpLink() override = default;

    std::error_code Listen(const std::string& address, uint16_t port) override;
    void Write(const nlohmann::json& record) override;
    void Close() override;
    void Stop() override;
    bool Connected() const override { return m_socket != nullptr; }

    uint16_t Port() const;

private:
    void Accept();
    void Read();
    void Flush();
    void Disconnect();

private:
    static constexpr size_t MAX_RECORD_SIZE = 64 * 1024 * 1024;

    ILinkListener& m_listener;

    asio::ip::tcp::acceptor m_acceptor;
    std::shared_ptr<asio::ip::tcp::socket> m_socket;

    asio::streambuf m_readBuffer{MAX_RECORD_SIZE};
    std::deque<std::string> m_writeQueue;
    bool m_writing = false;
    bool m_stopped = false;
};

}  // namespace nub::bridge
