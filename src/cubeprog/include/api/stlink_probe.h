#ifndef CUBEPROG_STLINK_PROBE_H
#define CUBEPROG_STLINK_PROBE_H

#include "api/cubeprog_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace cubeprog {

/**
 * @brief One ST-LINK debug probe as reported by enumeration
 *
 * Holds its own copy of the vendor record, so it stays valid after the
 * enumeration list is released. The connection settings (access port,
 * frequency, connection and reset mode) can be edited before the probe is
 * passed to CubeProgrammerApi::connect().
 */
class StLinkProbe {
public:
    StLinkProbe();

    explicit StLinkProbe(const abi::DebugConnectParameters& parameters);

    std::string getFirmwareVersion() const;
    std::string getSerialNumber() const;
    std::string getBoard() const;

    /**
     * @brief Target supply voltage measured by the probe, in volts
     *
     * @return 0.0 when the probe reports no voltage
     */
    double getTargetVoltage() const;

    ConnectionMode getConnectionMode() const;
    ResetMode getResetMode() const;
    int32_t getAccessPort() const;
    int32_t getIndex() const;
    int32_t getAccessPortCount() const;
    DebugPort getDebugPort() const;

    /**
     * @brief Requested SWD/JTAG frequency in kHz, 0 for the probe default
     */
    int32_t getFrequency() const;
    int32_t getSpeed() const;

    bool isOldFirmware() const;
    bool isBridge() const;
    bool isShared() const;
    bool isDebugSleep() const;

    /**
     * @brief Frequencies supported over JTAG, in kHz
     */
    std::vector<uint32_t> getJtagFrequencies() const;

    /**
     * @brief Frequencies supported over SWD, in kHz
     */
    std::vector<uint32_t> getSwdFrequencies() const;

    void setAccessPort(int32_t accessPort);
    void setFrequency(int32_t frequency);
    void setResetMode(ResetMode mode);
    void setConnectionMode(ConnectionMode mode);
    void setDebugPort(DebugPort port);

    const abi::DebugConnectParameters& getParameters() const { return parameters_; }

    /**
     * @brief Multi-line "Key: value" description
     */
    std::string toString() const;

private:
    abi::DebugConnectParameters parameters_;
};

} // namespace cubeprog

#endif // CUBEPROG_STLINK_PROBE_H
