#include "config/config_loader.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cubeprog {

namespace {

void applyJson(const nlohmann::json& config, ProgrammerProperties& props) {
    if (config.contains("programmer")) {
        auto& programmer = config["programmer"];
        if (programmer.contains("install_dir")) props.setInstallDir(programmer["install_dir"].get<std::string>());
        if (programmer.contains("verbosity")) props.set(ProgrammerProperties::PROP_VERBOSITY, programmer["verbosity"].get<int>());
    }

    if (config.contains("probe")) {
        auto& probe = config["probe"];
        if (probe.contains("index")) props.setProbeIndex(probe["index"].get<int>());
        if (probe.contains("serial")) props.setProbeSerial(probe["serial"].get<std::string>());
        if (probe.contains("connection_mode")) props.set(ProgrammerProperties::PROP_CONNECTION_MODE, probe["connection_mode"].get<std::string>());
        if (probe.contains("reset_mode")) props.set(ProgrammerProperties::PROP_RESET_MODE, probe["reset_mode"].get<std::string>());
        if (probe.contains("access_port")) props.setAccessPort(probe["access_port"].get<int>());
        if (probe.contains("frequency")) props.setFrequency(probe["frequency"].get<int>());
    }

    if (config.contains("download")) {
        auto& download = config["download"];
        if (download.contains("verify")) props.setDownloadVerifyEnabled(download["verify"].get<bool>());
        if (download.contains("skip_erase")) props.setDownloadSkipEraseEnabled(download["skip_erase"].get<bool>());
    }

    if (config.contains("logging")) {
        auto& logging = config["logging"];
        if (logging.contains("level")) props.setLogLevel(logging["level"].get<std::string>());
    }
}

} // anonymous namespace

std::string resolveConfigPath(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return explicitPath;
    }

    const char* envPath = std::getenv(CONFIG_ENV_VAR);
    if (envPath != nullptr && envPath[0] != '\0') {
        return envPath;
    }

    return DEFAULT_CONFIG_PATH;
}

ProgrammerProperties parseProgrammerConfig(const std::string& jsonText) {
    nlohmann::json config = nlohmann::json::parse(jsonText);

    ProgrammerProperties props;
    applyJson(config, props);
    return props;
}

ProgrammerProperties loadProgrammerConfig(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        LOGW_FMT("Configuration file not found: " << path << ", using defaults");
        return ProgrammerProperties();
    }

    std::stringstream buffer;
    buffer << configFile.rdbuf();

    try {
        ProgrammerProperties props = parseProgrammerConfig(buffer.str());
        LOGI_FMT("Loaded configuration from: " << path);
        return props;
    } catch (const nlohmann::json::exception& e) {
        LOGE_FMT("Failed to load configuration file: " << e.what() << ", using defaults");
        return ProgrammerProperties();
    }
}

void applyProbeSettings(const ProgrammerProperties& props, StLinkProbe& probe) {
    probe.setConnectionMode(props.getConnectionMode());
    probe.setResetMode(props.getResetMode());
    probe.setAccessPort(props.getAccessPort());

    if (props.getFrequency() > 0) {
        probe.setFrequency(props.getFrequency());
    }
}

const StLinkProbe* selectProbe(const std::vector<StLinkProbe>& probes,
                               const ProgrammerProperties& props) {
    std::string serial = props.getProbeSerial();
    if (!serial.empty()) {
        for (const auto& probe : probes) {
            if (probe.getSerialNumber() == serial) {
                return &probe;
            }
        }
        LOGW_FMT("No ST-LINK with serial number " << serial);
        return nullptr;
    }

    int index = props.getProbeIndex();
    if (index < 0 || static_cast<size_t>(index) >= probes.size()) {
        LOGW_FMT("No ST-LINK at index " << index << " (" << probes.size() << " found)");
        return nullptr;
    }
    return &probes[static_cast<size_t>(index)];
}

} // namespace cubeprog
