#pragma once
#include <string>
#include <system_error>

namespace nub
{

enum class errc
{
    no_session = 1,
    not_paused,
    not_configuring,
    not_running,
    slot_busy,
    slot_mismatch,
    connection_closed,
    timed_out,
    malformed_reply,
    malformed_request,
    invalid_frame,
    invalid_reference,
    remote_error,
    unknown_command,
    launch_failed
};

const std::error_category& bridge_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept { return {static_cast<int>(e), bridge_category()}; }

// Stable numeric id reported to the editor in DAP error responses.
int DapErrorId(std::error_code ec);

}  // namespace nub

namespace std
{
template <>
struct is_error_code_enum<nub::errc> : true_type
{
};
}  // namespace std
