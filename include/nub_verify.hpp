#pragma once

// Logs and returns a failed asio setup call from the enclosing function.
#define NUB_VERIFY(ec, msg)                             \
    {                                                   \
        if (ec)                                         \
        {                                               \
            Log::Error("{}: {}", msg, (ec).message());  \
            return ec;                                  \
        }                                               \
    }
