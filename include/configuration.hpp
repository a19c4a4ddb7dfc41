#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace nub
{

struct Configuration
{
    // Editor side
    uint16_t editorPort = 4711;

    // Hook side
    std::string hookAddress = "127.0.0.1";
    uint16_t hookPort = 4321;
    std::chrono::seconds handshakeTimeout{30};
    std::chrono::seconds requestTimeout{10};

    // Launch
    std::string interpreter = "vim";
    std::string nubScript = "runtime/nub.vim";

    // Logging
    std::string logFile;
    bool trace = false;

    static std::optional<Configuration> Load(const std::string& path);

    // Flags override the file given with --config. Returns nullopt after reporting a bad command line.
    static std::optional<Configuration> FromCommandLine(int argc, const char* const* argv);
};

void from_json(const nlohmann::json& j, Configuration& configuration);

}  // namespace nub
