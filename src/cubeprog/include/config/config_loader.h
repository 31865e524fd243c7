#ifndef CUBEPROG_CONFIG_LOADER_H
#define CUBEPROG_CONFIG_LOADER_H

#include "api/stlink_probe.h"
#include "config/programmer_properties.h"
#include <string>
#include <vector>

namespace cubeprog {

/**
 * @brief Environment variable naming the configuration file
 */
constexpr const char* CONFIG_ENV_VAR = "CUBEPROG_CONFIG";

constexpr const char* DEFAULT_CONFIG_PATH = "./config/cubeprog.json";

/**
 * @brief Pick the configuration file: explicit path, then $CUBEPROG_CONFIG,
 *        then ./config/cubeprog.json
 */
std::string resolveConfigPath(const std::string& explicitPath = "");

/**
 * @brief Settings from a JSON document
 *
 * Layout:
 * @code
 * {
 *   "programmer": { "install_dir": "...", "verbosity": 1 },
 *   "probe":      { "index": 0, "serial": "", "connection_mode": "UNDER_RESET",
 *                   "reset_mode": "HARDWARE_RESET", "access_port": 0, "frequency": 4000 },
 *   "download":   { "verify": true, "skip_erase": false },
 *   "logging":    { "level": "INFO" }
 * }
 * @endcode
 *
 * Absent sections and keys keep their defaults.
 *
 * @throws nlohmann::json::exception on malformed JSON or mistyped values
 */
ProgrammerProperties parseProgrammerConfig(const std::string& jsonText);

/**
 * @brief Settings from a JSON file
 *
 * A missing or unreadable file is logged and yields the defaults.
 */
ProgrammerProperties loadProgrammerConfig(const std::string& path);

/**
 * @brief Copy connection settings (mode, reset, access port, frequency)
 *        onto an enumerated probe
 */
void applyProbeSettings(const ProgrammerProperties& props, StLinkProbe& probe);

/**
 * @brief The configured probe: by serial number when set, else by position
 *
 * @return nullptr if no probe matches
 */
const StLinkProbe* selectProbe(const std::vector<StLinkProbe>& probes,
                               const ProgrammerProperties& props);

} // namespace cubeprog

#endif // CUBEPROG_CONFIG_LOADER_H
