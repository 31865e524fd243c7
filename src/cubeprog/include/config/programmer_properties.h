#ifndef CUBEPROG_PROGRAMMER_PROPERTIES_H
#define CUBEPROG_PROGRAMMER_PROPERTIES_H

#include "api/cubeprog_types.h"
#include "utils/log.h"
#include "utils/properties.h"
#include <string>

namespace cubeprog {

/**
 * @brief Settings of a programming session
 *
 * Extends Properties with typed accessors for the keys below. Enum-valued
 * settings are stored by name ("UNDER_RESET", "HARDWARE_RESET", ...).
 */
class ProgrammerProperties : public Properties {
public:
    static constexpr const char* PROP_INSTALL_DIR = "cubeprog.install.dir";
    static constexpr const char* PROP_VERBOSITY = "cubeprog.verbosity";
    static constexpr const char* PROP_LOG_LEVEL = "cubeprog.log.level";

    static constexpr const char* PROP_PROBE_INDEX = "cubeprog.probe.index";
    static constexpr const char* PROP_PROBE_SERIAL = "cubeprog.probe.serial";
    static constexpr const char* PROP_CONNECTION_MODE = "cubeprog.connection.mode";
    static constexpr const char* PROP_RESET_MODE = "cubeprog.reset.mode";
    static constexpr const char* PROP_ACCESS_PORT = "cubeprog.access.port";
    static constexpr const char* PROP_FREQUENCY = "cubeprog.frequency";

    static constexpr const char* PROP_DOWNLOAD_VERIFY = "cubeprog.download.verify";
    static constexpr const char* PROP_DOWNLOAD_SKIP_ERASE = "cubeprog.download.skip_erase";

    /**
     * @brief Construct with default values
     */
    ProgrammerProperties();

    /**
     * @brief Construct from base Properties, filling in missing defaults
     */
    explicit ProgrammerProperties(const Properties& props);

    /**
     * @brief Default installation directory ($HOME/STMicroelectronics/STM32Cube/STM32CubeProgrammer)
     */
    static std::string defaultInstallDir();

    std::string getInstallDir() const;
    void setInstallDir(const std::string& dir);

    Verbosity getVerbosity() const;
    void setVerbosity(Verbosity verbosity);

    /**
     * @throws std::invalid_argument if the stored name is not a log level
     */
    utils::LogLevel getLogLevel() const;
    void setLogLevel(const std::string& level);

    int getProbeIndex() const;
    void setProbeIndex(int index);

    /**
     * @brief Serial number selecting the probe; empty selects by index
     */
    std::string getProbeSerial() const;
    void setProbeSerial(const std::string& serial);

    /**
     * @throws std::invalid_argument if the stored name is unknown
     */
    ConnectionMode getConnectionMode() const;
    void setConnectionMode(ConnectionMode mode);

    /**
     * @throws std::invalid_argument if the stored name is unknown
     */
    ResetMode getResetMode() const;
    void setResetMode(ResetMode mode);

    int getAccessPort() const;
    void setAccessPort(int accessPort);

    /**
     * @brief Debug frequency in kHz, 0 keeps the probe default
     */
    int getFrequency() const;
    void setFrequency(int frequency);

    bool isDownloadVerifyEnabled() const;
    void setDownloadVerifyEnabled(bool enabled);

    bool isDownloadSkipEraseEnabled() const;
    void setDownloadSkipEraseEnabled(bool enabled);

    /**
     * @brief Check every setting is present and in range
     */
    bool validate() const;

    void loadDefaults();
};

/**
 * @brief Name parsers for settings and command arguments (case-insensitive)
 *
 * @throws std::invalid_argument for unknown names
 */
ConnectionMode parseConnectionMode(const std::string& name);
ResetMode parseResetMode(const std::string& name);
CortexRegister parseRegister(const std::string& name);
utils::LogLevel parseLogLevel(const std::string& name);
Verbosity parseVerbosity(int level);

} // namespace cubeprog

#endif // CUBEPROG_PROGRAMMER_PROPERTIES_H
