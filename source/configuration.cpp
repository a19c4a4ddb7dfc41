#include "nub_common.hpp"
#include "configuration.hpp"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace
{
bool ParsePort(const std::string& text, uint16_t& port)
{
    try
    {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > std::numeric_limits<uint16_t>::max()) return false;
        port = static_cast<uint16_t>(value);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

// nlohmann converts a wider number into uint16_t by truncation, so ports are checked before conversion.
bool PortsInRange(const json& document, const std::string& path)
{
    for (const char* key : {"editorPort", "hookPort"})
    {
        auto it = document.find(key);
        if (it == document.end()) continue;

        if (!it->is_number_integer() || *it < 0 || *it > std::numeric_limits<uint16_t>::max())
        {
            nub::Log::Error("Invalid {} {} in '{}'", key, it->dump(), path);
            return false;
        }
    }

    return true;
}

void PrintUsage(const char* program)
{
    fmt::print("Usage: {} [--config FILE] [--port N] [--hook-port N] [--log FILE] [--trace]\n", program);
}
}  // namespace

void nub::from_json(const json& j, Configuration& configuration)
{
    configuration.editorPort = j.value("editorPort", configuration.editorPort);
    configuration.hookAddress = j.value("hookAddress", configuration.hookAddress);
    configuration.hookPort = j.value("hookPort", configuration.hookPort);
    configuration.handshakeTimeout =
        std::chrono::seconds(j.value("handshakeTimeout", static_cast<int64_t>(configuration.handshakeTimeout.count())));
    configuration.requestTimeout =
        std::chrono::seconds(j.value("requestTimeout", static_cast<int64_t>(configuration.requestTimeout.count())));
    configuration.interpreter = j.value("interpreter", configuration.interpreter);
    configuration.nubScript = j.value("nubScript", configuration.nubScript);
    configuration.logFile = j.value("logFile", configuration.logFile);
    configuration.trace = j.value("trace", configuration.trace);
}

std::optional<nub::Configuration> nub::Configuration::Load(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        Log::Error("Could not open configuration '{}'", path);
        return std::nullopt;
    }

    try
    {
        json document = json::parse(file);
        if (!PortsInRange(document, path)) return std::nullopt;

        Configuration configuration = document.get<Configuration>();
        if (configuration.handshakeTimeout.count() <= 0 || configuration.requestTimeout.count() <= 0)
        {
            Log::Error("Timeouts in '{}' must be positive", path);
            return std::nullopt;
        }

        return configuration;
    }
    catch (const json::exception& e)
    {
        Log::Error("Invalid configuration '{}': {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<nub::Configuration> nub::Configuration::FromCommandLine(int argc, const char* const* argv)
{
    Configuration configuration;

    // --config is applied first so that the other flags win regardless of their position.
    for (int i = 1; i + 1 < argc; i++)
    {
        if (std::string_view(argv[i]) == "--config")
        {
            auto loaded = Load(argv[i + 1]);
            if (!loaded) return std::nullopt;
            configuration = *loaded;
        }
    }

    for (int i = 1; i < argc; i++)
    {
        std::string_view flag = argv[i];

        if (flag == "--trace")
        {
            configuration.trace = true;
            continue;
        }

        if (flag == "--help" || flag == "-h")
        {
            PrintUsage(argv[0]);
            return std::nullopt;
        }

        if (i + 1 >= argc)
        {
            Log::Error("Missing value for '{}'", flag);
            PrintUsage(argv[0]);
            return std::nullopt;
        }

        std::string value = argv[++i];
        if (flag == "--config")
        {
            continue;
        }
        else if (flag == "--port")
        {
            if (!ParsePort(value, configuration.editorPort))
            {
                Log::Error("Invalid port '{}'", value);
                return std::nullopt;
            }
        }
        else if (flag == "--hook-port")
        {
            if (!ParsePort(value, configuration.hookPort))
            {
                Log::Error("Invalid hook port '{}'", value);
                return std::nullopt;
            }
        }
        else if (flag == "--log")
        {
            configuration.logFile = value;
        }
        else
        {
            Log::Error("Unknown option '{}'", flag);
            PrintUsage(argv[0]);
            return std::nullopt;
        }
    }

    return configuration;
}
