#ifndef PAIRAMM_LOG_HPP
#define PAIRAMM_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pairamm {
namespace log {

// Install the shared stderr sink and set the level of every pairamm logger.
// Level names as spdlog spells them: trace, debug, info, warn (warning),
// error (err), critical, off.
// Throws AMMError(INVALID_CONFIG) on an unknown name.
void init(const std::string& level = "info");

// Named logger sharing the pairamm sink, created on first use
std::shared_ptr<spdlog::logger> get(const std::string& name);

spdlog::level::level_enum parse_level(const std::string& level);

} // namespace log
} // namespace pairamm

#endif // PAIRAMM_LOG_HPP
