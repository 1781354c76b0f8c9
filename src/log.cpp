// =============================================================================
// log.cpp - spdlog sink and named loggers
// =============================================================================

#include "pairamm/log.hpp"
#include "pairamm/types.hpp"

#include <mutex>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pairamm {
namespace log {

namespace {

constexpr const char* DEFAULT_PATTERN = "%^%-5l %Y-%m-%dT%T.%f %-8n ] %v%$";

struct Registry {
    std::mutex mutex;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sink;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum level = spdlog::level::info;
};

Registry& registry() {
    // Leaked so loggers stay usable during static destruction
    static Registry* the = new Registry;
    return *the;
}

// Caller holds the registry mutex
std::shared_ptr<spdlog::sinks::stderr_color_sink_mt>& sink_locked(Registry& r) {
    if (!r.sink) {
        r.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        r.sink->set_color(spdlog::level::debug, r.sink->green);
        r.sink->set_color(spdlog::level::info, r.sink->reset);
        r.sink->set_color(spdlog::level::warn, r.sink->yellow);
        r.sink->set_color(spdlog::level::err, r.sink->red);
        r.sink->set_pattern(DEFAULT_PATTERN);
    }
    return r.sink;
}

} // namespace

spdlog::level::level_enum parse_level(const std::string& level) {
    // from_str maps every unrecognized name to off
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw AMMError(errors::INVALID_CONFIG, "unknown log level: " + level);
    }
    return lvl;
}

void init(const std::string& level) {
    auto lvl = parse_level(level);

    Registry& r = registry();
    std::lock_guard<std::mutex> guard(r.mutex);
    sink_locked(r);
    r.level = lvl;
    for (auto& [name, logger] : r.loggers) {
        logger->set_level(lvl);
    }
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    Registry& r = registry();
    std::lock_guard<std::mutex> guard(r.mutex);

    auto it = r.loggers.find(name);
    if (it != r.loggers.end()) return it->second;

    auto logger = std::make_shared<spdlog::logger>(name, sink_locked(r));
    logger->set_level(r.level);
    r.loggers.emplace(name, logger);
    return logger;
}

} // namespace log
} // namespace pairamm
