#include "nub_common.hpp"
#include "debugger/dap.hpp"

#include <istream>

#include "configuration.hpp"
#include "bridge/errors.hpp"
#include "bridge/link.hpp"
#include "debugger/debugger.hpp"

using json = nlohmann::json;

namespace nub::debugger
{

namespace
{
json FieldOr(const json& message, const char* key, json fallback)
{
    auto it = message.find(key);
    return it == message.end() ? fallback : *it;
}

std::string TakeFromBuffer(asio::streambuf& buffer, size_t length)
{
    std::string out(length, '\0');
    std::istream stream(&buffer);
    stream.read(&out[0], static_cast<std::streamsize>(length));
    return out;
}
}  // namespace

DAPConnection::DAPConnection(asio::io_context& io, asio::ip::tcp::socket socket, const Configuration& configuration)
    : m_io(io), m_configuration(configuration), m_socket(std::move(socket))
{
}

DAPConnection::~DAPConnection()
{
    m_closed = true;
    if (m_debugger)
    {
        m_debugger->Shutdown();
        m_debugger.reset();
    }
}

void DAPConnection::Start(std::function<void()> onClosed)
{
    m_onClosed = std::move(onClosed);

    asio::io_context& io = m_io;
    m_debugger = std::make_unique<Debugger>(m_io,
                                            m_configuration,
                                            *this,
                                            [&io](bridge::ILinkListener& listener)
                                            { return std::make_shared<bridge::TcpLink>(io, listener); });

    Log::Info("DAP client connected");
    ReadHeader();
}

void DAPConnection::Close()
{
    if (m_closed) return;
    m_closed = true;

    // Events the shutdown produces are dropped, the editor is gone.
    if (m_debugger)
    {
        m_debugger->Shutdown();
    }

    asio::error_code ec;
    m_socket.shutdown(asio::socket_base::shutdown_both, ec);
    m_socket.close(ec);

    m_writeQueue.clear();
    m_pendingRequests.clear();

    Log::Info("DAP client disconnected");

    auto onClosed = std::move(m_onClosed);
    if (onClosed)
    {
        onClosed();
    }
}

void DAPConnection::ReadHeader()
{
    auto self = shared_from_this();
    asio::async_read_until(m_socket,
                           m_readBuffer,
                           "\r\n\r\n",
                           [self](const asio::error_code& ec, size_t length)
                           {
                               if (ec == asio::error::operation_aborted || self->m_closed) return;

                               if (ec)
                               {
                                   if (ec != asio::error::eof)
                                   {
                                       Log::Error("Failed to read DAP header: {}", ec.message());
                                   }
                                   self->Close();
                                   return;
                               }

                               std::string headers = TakeFromBuffer(self->m_readBuffer, length);

                               size_t contentLengthPos = headers.find("Content-Length: ");
                               if (contentLengthPos == std::string::npos)
                               {
                                   Log::Error("DAP message missing Content-Length header");
                                   self->ReadHeader();
                                   return;
                               }

                               size_t valueStart = contentLengthPos + 16;
                               size_t valueEnd = headers.find("\r\n", valueStart);

                               size_t contentLength = 0;
                               try
                               {
                                   contentLength = std::stoul(headers.substr(valueStart, valueEnd - valueStart));
                               }
                               catch (const std::exception& e)
                               {
                                   Log::Error("Invalid DAP Content-Length: {}", e.what());
                                   self->Close();
                                   return;
                               }

                               if (contentLength > MAX_MESSAGE_SIZE)
                               {
                                   Log::Error("DAP message of {} bytes exceeds the limit", contentLength);
                                   self->Close();
                                   return;
                               }

                               self->ReadBody(contentLength);
                           });
}

void DAPConnection::ReadBody(size_t contentLength)
{
    if (m_readBuffer.size() >= contentLength)
    {
        HandleMessage(TakeFromBuffer(m_readBuffer, contentLength));
        if (!m_closed)
        {
            ReadHeader();
        }
        return;
    }

    auto self = shared_from_this();
    asio::async_read(m_socket,
                     m_readBuffer,
                     asio::transfer_exactly(contentLength - m_readBuffer.size()),
                     [self, contentLength](const asio::error_code& ec, size_t /*length*/)
                     {
                         if (ec == asio::error::operation_aborted || self->m_closed) return;

                         if (ec)
                         {
                             Log::Error("Failed to read DAP body: {}", ec.message());
                             self->Close();
                             return;
                         }

                         self->ReadBody(contentLength);
                     });
}

void DAPConnection::HandleMessage(const std::string& body)
{
    json message = json::parse(body, nullptr, false);
    if (message.is_discarded() || !message.is_object())
    {
        Log::Error("Dropping malformed DAP message: {}", body);
        return;
    }

    Log::Debug("RX editor: {}", body);

    try
    {
        std::string type = message.value("type", "");
        if (type == "request")
        {
            m_debugger->HandleRequest(message);
        }
        else if (type == "response")
        {
            int64_t requestSeq = message.value("request_seq", int64_t{0});
            auto it = m_pendingRequests.find(requestSeq);
            if (it == m_pendingRequests.end())
            {
                Log::Warn("Dropping editor response to unknown request {}", requestSeq);
                return;
            }

            ResponseHandler handler = std::move(it->second);
            m_pendingRequests.erase(it);
            handler(message);
        }
        else
        {
            Log::Warn("Unhandled DAP message type: {}", type);
        }
    }
    catch (const json::exception& e)
    {
        Log::Error("Exception handling DAP message: {}", e.what());
    }
}

void DAPConnection::SendResponse(const json& request, const json& body)
{
    SendMessage({{"seq", m_seqCounter++},
                 {"type", "response"},
                 {"request_seq", FieldOr(request, "seq", 0)},
                 {"success", true},
                 {"command", FieldOr(request, "command", "")},
                 {"body", body.is_null() ? json::object() : body}});
}

void DAPConnection::SendErrorResponse(const json& request, std::error_code ec)
{
    std::string message = ec.message();

    SendMessage({{"seq", m_seqCounter++},
                 {"type", "response"},
                 {"request_seq", FieldOr(request, "seq", 0)},
                 {"success", false},
                 {"command", FieldOr(request, "command", "")},
                 {"message", message},
                 {"body", {{"error", {{"id", DapErrorId(ec)}, {"format", message}}}}}});
}

void DAPConnection::SendEvent(const std::string& event, const json& body)
{
    json eventMessage = {{"seq", m_seqCounter++}, {"type", "event"}, {"event", event}};

    if (!body.empty())
    {
        eventMessage["body"] = body;
    }

    SendMessage(eventMessage);
}

void DAPConnection::SendRequest(const std::string& command, const json& arguments, ResponseHandler handler)
{
    int64_t seq = m_seqCounter++;
    m_pendingRequests[seq] = std::move(handler);

    SendMessage({{"seq", seq}, {"type", "request"}, {"command", command}, {"arguments", arguments}});
}

void DAPConnection::SendMessage(const json& message)
{
    if (m_closed) return;

    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);
    Log::Debug("TX editor: {}", body);

    m_writeQueue.push_back("Content-Length: " + std::to_string(body.length()) + "\r\n\r\n" + body);
    if (!m_writing)
    {
        Flush();
    }
}

void DAPConnection::Flush()
{
    if (m_closed || m_writeQueue.empty())
    {
        m_writing = false;
        return;
    }

    m_writing = true;
    auto self = shared_from_this();
    asio::async_write(m_socket,
                      asio::buffer(m_writeQueue.front()),
                      [self](const asio::error_code& ec, size_t /*length*/)
                      {
                          if (ec == asio::error::operation_aborted || self->m_closed) return;

                          if (ec)
                          {
                              Log::Error("Failed to send DAP message: {}", ec.message());
                              self->Close();
                              return;
                          }

                          self->m_writeQueue.pop_front();
                          self->Flush();
                      });
}

DAPServer::DAPServer(asio::io_context& io, const Configuration& configuration)
    : m_io(io), m_configuration(configuration), m_acceptor(io)
{
}

DAPServer::~DAPServer() { Stop(); }

std::error_code DAPServer::Start()
{
    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), m_configuration.editorPort);

    m_acceptor.open(endpoint.protocol(), ec);
    NUB_VERIFY(ec, "Failed to open DAP listener")
    m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    NUB_VERIFY(ec, "Failed to set reuse_address on DAP listener")
    m_acceptor.bind(endpoint, ec);
    NUB_VERIFY(ec, fmt::format("Failed to bind DAP listener to port {}", m_configuration.editorPort))
    m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
    NUB_VERIFY(ec, "Failed to listen for DAP clients")

    m_running = true;
    Log::Info("nub-dap DAP server listening on port {}", Port());

    Accept();
    return {};
}

void DAPServer::Stop()
{
    if (!m_running) return;
    m_running = false;

    asio::error_code ec;
    m_acceptor.close(ec);

    std::shared_ptr<DAPConnection> client = std::move(m_client);
    if (client)
    {
        client->Close();
    }

    Log::Info("DAP server stopped");
}

uint16_t DAPServer::Port() const
{
    asio::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void DAPServer::Accept()
{
    m_acceptor.async_accept(
        [this](const asio::error_code& ec, asio::ip::tcp::socket socket)
        {
            if (ec == asio::error::operation_aborted || !m_running) return;

            if (ec)
            {
                Log::Error("Accept failed: {}", ec.message());
            }
            else if (m_client)
            {
                Log::Warn("Rejecting a second DAP client while one is connected");
                asio::error_code closeEc;
                socket.close(closeEc);
            }
            else
            {
                m_client = std::make_shared<DAPConnection>(m_io, std::move(socket), m_configuration);
                m_client->Start([this]() { m_client.reset(); });
            }

            Accept();
        });
}

}  // namespace nub::debugger
