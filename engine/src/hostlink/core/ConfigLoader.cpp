#include <hostlink/core/ConfigLoader.hpp>

#include <hostlink/EngineConfig.hpp>
#include <hostlink/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace hostlink;
using namespace hostlink::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

std::uint16_t checkedPortFromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > 65535)
        throw std::invalid_argument(std::string(key) + " out of range (0..65535): " +
                                    std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

std::uint32_t checkedU32FromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " +
                                    std::to_string(v));
    return static_cast<std::size_t>(v);
}

const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

// 오타 난 키가 조용히 무시되지 않도록 경고만 남긴다.
void warnUnknownKeys(const toml::table &section, const char *sectionName,
                     std::initializer_list<std::string_view> known)
{
    for (auto &&[key, node] : section)
    {
        (void)node;
        bool found = false;
        for (auto k : known)
        {
            if (key.str() == k)
            {
                found = true;
                break;
            }
        }
        if (!found)
        {
            SLOG_WARN("ConfigLoader", "UnknownKey", "section={} key={}", sectionName, key.str());
        }
    }
}

// -----------------------------------------------------------------------------
// Section Parsing
// -----------------------------------------------------------------------------

void applyEngineToml(GlobalConfig &cfg, const toml::table &root)
{
    const toml::table &engine = requireTable(root, "engine");

    warnUnknownKeys(engine, "engine",
                    {"listen_address", "listen_port", "listen_backlog", "log_level",
                     "log_file_path", "idle_timeout_ms", "tick_resolution_ms", "timer_slots",
                     "max_epoll_events"});

    if (auto s = engine["listen_address"].value<std::string>())
        cfg.engine.listenAddress = *s;
    if (auto v = engine["listen_port"].value<std::int64_t>())
        cfg.engine.listenPort = checkedPortFromI64(*v, "listen_port");
    if (auto v = engine["listen_backlog"].value<std::int64_t>())
        cfg.engine.listenBacklog = checkedU32FromI64(*v, "listen_backlog");

    if (auto s = engine["log_level"].value<std::string>())
        cfg.engine.logLevel = parseLogLevel(*s);
    if (auto s = engine["log_file_path"].value<std::string>())
        cfg.engine.logFilePath = *s;

    if (auto v = engine["idle_timeout_ms"].value<std::int64_t>())
        cfg.engine.idleTimeoutMs = checkedU32FromI64(*v, "idle_timeout_ms");

    // Tuning Params
    if (auto v = engine["tick_resolution_ms"].value<std::int64_t>())
        cfg.engine.tickResolutionMs = checkedU32FromI64(*v, "tick_resolution_ms");
    if (auto v = engine["timer_slots"].value<std::int64_t>())
        cfg.engine.timerSlots = checkedSizeFromI64(*v, "timer_slots");
    if (auto v = engine["max_epoll_events"].value<std::int64_t>())
        cfg.engine.maxEpollEvents = checkedU32FromI64(*v, "max_epoll_events");
}

void applyTransferToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *transfer = root["transfer"].as_table();
    if (!transfer)
        return; // [transfer]는 선택

    warnUnknownKeys(*transfer, "transfer", {"receive_dir", "chunk_size"});

    if (auto s = (*transfer)["receive_dir"].value<std::string>())
        cfg.transfer.receiveDir = *s;
    if (auto v = (*transfer)["chunk_size"].value<std::int64_t>())
        cfg.transfer.chunkSize = checkedSizeFromI64(*v, "chunk_size");
}

void validateFailFast(const GlobalConfig &cfg)
{
    validateEngineConfig(cfg.engine);
    validateTransferConfig(cfg.transfer);
}

} // namespace

namespace hostlink::core
{

CommandLine ConfigLoader::parseCommandLine(int argc, char **argv)
{
    CommandLine out;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            out.helpRequested = true;
            continue;
        }
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            out.configPath = argv[++i];
            continue;
        }
        out.positional.emplace_back(a);
    }
    return out;
}

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    const CommandLine cli = parseCommandLine(argc, argv);
    if (cli.configPath.empty())
    {
        GlobalConfig cfg{};
        validateFailFast(cfg);
        return cfg;
    }
    return loadFile(cli.configPath);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg{};
    applyEngineToml(cfg, root);
    applyTransferToml(cfg, root);

    validateFailFast(cfg);

    SLOG_INFO("ConfigLoader", "Loaded", "path='{}'", path);
    return cfg;
}

} // namespace hostlink::core
