#include "nub_common.hpp"

#include <csignal>

#include <asio.hpp>

#include "configuration.hpp"
#include "debugger/dap.hpp"

int main(int argc, char** argv)
{
    auto configuration = nub::Configuration::FromCommandLine(argc, argv);
    if (!configuration)
    {
        return 1;
    }

    if (!nub::Log::SetDestination(configuration->logFile))
    {
        return 1;
    }
    nub::Log::EnableTrace(configuration->trace);

    asio::io_context io;

    nub::debugger::DAPServer server(io, *configuration);
    if (std::error_code ec = server.Start())
    {
        nub::Log::Critical("nub-dap cannot serve the editor: {}", ec.message());
        return 1;
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const asio::error_code& ec, int signal)
        {
            if (ec) return;

            nub::Log::Info("Received signal {}, shutting down", signal);
            server.Stop();
            io.stop();
        });

    io.run();
    return 0;
}
