#include "nub_common.hpp"
#include "bridge/errors.hpp"

namespace
{

class BridgeCategory : public std::error_category
{
public:
    const char* name() const noexcept override { return "nub"; }

    std::string message(int value) const override
    {
        switch (static_cast<nub::errc>(value))
        {
            case nub::errc::no_session: return "Vim is not connected";
            case nub::errc::not_paused: return "Vim is not paused";
            case nub::errc::not_configuring: return "Vim is not waiting for configuration";
            case nub::errc::not_running: return "Vim is not running";
            case nub::errc::slot_busy: return "A command request is already pending";
            case nub::errc::slot_mismatch: return "The pending command request is of a different kind";
            case nub::errc::connection_closed: return "Connection to Vim closed";
            case nub::errc::timed_out: return "Vim did not reply in time";
            case nub::errc::malformed_reply: return "Malformed reply from Vim";
            case nub::errc::malformed_request: return "Malformed request";
            case nub::errc::invalid_frame: return "Invalid frame";
            case nub::errc::invalid_reference: return "Invalid variables reference";
            case nub::errc::remote_error: return "Vim reported an error";
            case nub::errc::unknown_command: return "Unrecognised command";
            case nub::errc::launch_failed: return "Could not launch Vim";
        }

        return "Unknown error";
    }
};

}  // namespace

const std::error_category& nub::bridge_category() noexcept
{
    static BridgeCategory category;
    return category;
}

int nub::DapErrorId(std::error_code ec)
{
    if (ec.category() != bridge_category()) return 199;

    switch (static_cast<errc>(ec.value()))
    {
        case errc::not_paused:
        case errc::not_configuring:
        case errc::not_running:
        case errc::slot_busy:
        case errc::slot_mismatch: return 100;
        case errc::invalid_frame: return 101;
        case errc::no_session: return 102;
        case errc::invalid_reference: return 103;
        case errc::connection_closed:
        case errc::timed_out: return 104;
        case errc::malformed_reply:
        case errc::remote_error: return 105;
        case errc::malformed_request:
        case errc::unknown_command: return 106;
        case errc::launch_failed: return 107;
    }

    return 199;
}
