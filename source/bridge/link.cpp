#include "nub_common.hpp"
#include "bridge/link.hpp"

#include <istream>

namespace nub::bridge
{

TcpLink::TcpLink(asio::io_context& io, ILinkListener& listener) : m_listener(listener), m_acceptor(io) {}

std::error_code TcpLink::Listen(const std::string& address, uint16_t port)
{
    if (m_acceptor.is_open()) return {};

    asio::error_code ec;
    asio::ip::address bindAddress = asio::ip::make_address(address, ec);
    NUB_VERIFY(ec, fmt::format("Invalid hook address '{}'", address))

    asio::ip::tcp::endpoint endpoint(bindAddress, port);
    m_acceptor.open(endpoint.protocol(), ec);
    NUB_VERIFY(ec, "Failed to open hook listener")
    m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    NUB_VERIFY(ec, "Failed to set reuse_address on hook listener")
    m_acceptor.bind(endpoint, ec);
    NUB_VERIFY(ec, fmt::format("Failed to bind hook listener to {}:{}", address, port))
    m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
    NUB_VERIFY(ec, "Failed to listen for the hook")

    m_stopped = false;
    Log::Info("Waiting for Vim on {}:{}", address, Port());

    Accept();
    return {};
}

uint16_t TcpLink::Port() const
{
    asio::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void TcpLink::Accept()
{
    auto self = shared_from_this();
    m_acceptor.async_accept(
        [self](const asio::error_code& ec, asio::ip::tcp::socket socket)
        {
            if (ec == asio::error::operation_aborted || self->m_stopped) return;

            if (ec)
            {
                Log::Error("Accepting the hook connection failed: {}", ec.message());
            }
            else if (self->m_socket)
            {
                Log::Warn("Ignoring a second hook connection while one is active");
                asio::error_code closeEc;
                socket.close(closeEc);
            }
            else
            {
                asio::error_code optionEc;
                socket.set_option(asio::ip::tcp::no_delay(true), optionEc);

                self->m_socket = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
                self->m_readBuffer.consume(self->m_readBuffer.size());
                Log::Info("Vim connected");

                self->m_listener.OnLinkConnected();
                self->Read();
            }

            self->Accept();
        });
}

void TcpLink::Read()
{
    if (!m_socket) return;

    auto self = shared_from_this();
    auto socket = m_socket;
    asio::async_read_until(*socket,
                           m_readBuffer,
                           '\n',
                           [self, socket](const asio::error_code& ec, size_t length)
                           {
                               if (ec == asio::error::operation_aborted || self->m_stopped) return;
                               if (socket != self->m_socket) return;

                               if (ec)
                               {
                                   if (ec != asio::error::eof)
                                   {
                                       Log::Error("Reading from Vim failed: {}", ec.message());
                                   }
                                   self->Disconnect();
                                   return;
                               }

                               std::string record(length, '\0');
                               std::istream stream(&self->m_readBuffer);
                               stream.read(&record[0], static_cast<std::streamsize>(length));

                               while (!record.empty() && (record.back() == '\n' || record.back() == '\r'))
                               {
                                   record.pop_back();
                               }

                               if (!record.empty())
                               {
                                   Log::Debug("RX Vim: {}", record);
                                   self->m_listener.OnLinkRecord(record);
                               }

                               self->Read();
                           });
}

void TcpLink::Write(const nlohmann::json& record)
{
    if (!m_socket)
    {
        Log::Warn("Dropping record for Vim, no connection: {}", record.dump());
        return;
    }

    std::string line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Log::Debug("TX Vim: {}", line);
    line += '\n';

    m_writeQueue.push_back(std::move(line));
    if (!m_writing)
    {
        Flush();
    }
}

void TcpLink::Flush()
{
    if (!m_socket || m_writeQueue.empty())
    {
        m_writing = false;
        return;
    }

    m_writing = true;
    auto self = shared_from_this();
    auto socket = m_socket;
    asio::async_write(*socket,
                      asio::buffer(m_writeQueue.front()),
                      [self, socket](const asio::error_code& ec, size_t /*length*/)
                      {
                          if (ec == asio::error::operation_aborted || self->m_stopped) return;
                          if (socket != self->m_socket) return;

                          if (ec)
                          {
                              Log::Error("Writing to Vim failed: {}", ec.message());
                              self->Disconnect();
                              return;
                          }

                          self->m_writeQueue.pop_front();
                          self->Flush();
                      });
}

void TcpLink::Disconnect()
{
    if (!m_socket) return;

    asio::error_code ec;
    m_socket->shutdown(asio::socket_base::shutdown_both, ec);
    m_socket->close(ec);
    m_socket.reset();

    m_writeQueue.clear();
    m_writing = false;
    m_readBuffer.consume(m_readBuffer.size());

    Log::Info("Vim disconnected");
    m_listener.OnLinkDisconnected();
}

void TcpLink::Close() { Disconnect(); }

void TcpLink::Stop()
{
    if (m_stopped) return;

    // Listener callbacks are still delivered for the active connection, later completions are ignored.
    Disconnect();
    m_stopped = true;

    asio::error_code ec;
    m_acceptor.close(ec);
}

}  // namespace nub::bridge
