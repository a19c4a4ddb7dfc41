#include "tools/log.hpp"

bool nub::Log::SetDestination(const std::string& path)
{
    if (s_out)
    {
        fclose(s_out);
        s_out = nullptr;
    }

    if (path.empty()) return true;

    s_out = fopen(path.c_str(), "a");
    if (!s_out)
    {
        Error("Could not open log file '{}'", path);
        return false;
    }

    return true;
}

void nub::Log::Write(const char* color, const char* tag, const std::string& message)
{
    // Colour codes only make sense on a terminal, log files get the plain tag.
    if (s_out)
    {
        fmt::print(s_out, "[{}] {}\n", tag, message);
        fflush(s_out);
        return;
    }

    fmt::print("[{}{}{}] {}\n", color, tag, reset, message);
    fflush(stdout);
}
