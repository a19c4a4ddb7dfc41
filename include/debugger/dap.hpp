#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "debugger/editor_channel.hpp"

namespace nub
{
struct Configuration;
}

namespace nub::debugger
{
class Debugger;

// One editor connection: Content-Length framed DAP messages over TCP.
class DAPConnection : public IEditorChannel, public std::enable_shared_from_this<DAPConnection>
{
public:
    DAPConnection(asio::io_context& io, asio::ip::tcp::socket socket, const Configuration& configuration);
    ~DAPConnection() override;

    void Start(std::function<void()> onClosed);
    void Close();

    // IEditorChannel
    void SendResponse(const nlohmann::json& request, const nlohmann::json& body) override;
    void SendErrorResponse(const nlohmann::json& request, std::error_code ec) override;
    void SendEvent(const std::string& event, const nlohmann::json& body = {}) override;
    void SendRequest(const std::string& command, const nlohmann::json& arguments, ResponseHandler handler) override;

private:
    void ReadHeader();
    void ReadBody(size_t contentLength);
    void HandleMessage(const std::string& body);
    void SendMessage(const nlohmann::json& message);
    void Flush();

private:
    static constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

    asio::io_context& m_io;
    const Configuration& m_configuration;
    asio::ip::tcp::socket m_socket;
    asio::streambuf m_readBuffer{MAX_MESSAGE_SIZE};

    std::deque<std::string> m_writeQueue;
    bool m_writing = false;
    bool m_closed = false;

    int64_t m_seqCounter = 1;
    std::unordered_map<int64_t, ResponseHandler> m_pendingRequests;
    std::function<void()> m_onClosed;

    std::unique_ptr<Debugger> m_debugger;
};

// Accepts editor connections, one at a time.
class DAPServer
{
public:
    DAPServer(asio::io_context& io, const Configuration& configuration);
    ~DAPServer();

    std::error_code Start();
    void Stop();

    uint16_t Port() const;

private:
    void Accept();

private:
    asio::io_context& m_io;
    const Configuration& m_configuration;
    asio::ip::tcp::acceptor m_acceptor;
    std::shared_ptr<DAPConnection> m_client;
    bool m_running = false;
};

}  // namespace nub::debugger
