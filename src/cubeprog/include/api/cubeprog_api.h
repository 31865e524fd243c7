#ifndef CUBEPROG_API_H
#define CUBEPROG_API_H

#include "api/cubeprog_types.h"
#include "api/cubeprog_error.h"
#include "api/programmer_backend.h"
#include "api/stlink_probe.h"
#include "api/target_info.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cubeprog {

/**
 * @brief Host side session with STM32CubeProgrammer over an ST-LINK probe
 *
 * Wraps the vendor programmer API: probe discovery, connection, flash
 * download and erase, memory and core register access, reset.
 *
 * Every operation returning a vendor status throws CubeProgrammerException
 * when the status is not 0.
 *
 * Thread-Safety: calls are serialised; the vendor library is not re-entrant.
 * The display callbacks are process wide, so only one instance should be
 * alive at a time.
 *
 * Usage:
 * @code
 * cubeprog::CubeProgrammerApi api("/opt/st/stm32cubeprogrammer");
 * auto probes = api.find();
 * api.connect(probes.at(0));
 * std::cout << api.info().getName() << std::endl;
 * api.download("app.hex", 0x08000000, false, true);
 * api.disconnect();
 * @endcode
 */
class CubeProgrammerApi {
public:
    /**
     * @brief Load the programmer API from an STM32CubeProgrammer installation
     *
     * @param installDir Installation root (contains api/lib and bin)
     * @throws std::runtime_error if the host platform is not supported
     * @throws platform::DynamicLoaderException if the library cannot be bound
     */
    explicit CubeProgrammerApi(const std::string& installDir);

    /**
     * @brief Run over an already bound backend
     *
     * @param backend Vendor entry points
     * @param loadersPath Directory of the external flash loaders
     * @throws std::invalid_argument if backend is null
     */
    CubeProgrammerApi(std::unique_ptr<IProgrammerBackend> backend, const std::string& loadersPath);

    ~CubeProgrammerApi();

    CubeProgrammerApi(const CubeProgrammerApi&) = delete;
    CubeProgrammerApi& operator=(const CubeProgrammerApi&) = delete;

    /**
     * @brief Full enumeration of attached ST-LINK probes
     *
     * Slower than find(); also reports probes whose firmware must be
     * refreshed.
     */
    std::vector<StLinkProbe> probe();

    /**
     * @brief Quick enumeration of attached ST-LINK probes
     */
    std::vector<StLinkProbe> find();

    /**
     * @brief Connect to the target behind a probe
     */
    void connect(const StLinkProbe& probe);

    /**
     * @brief Program a firmware file into the connected target
     *
     * @param path Image file (.bin, .hex, .elf, .srec)
     * @param address Load address; used for .bin images only
     * @param skipErase Do not erase the affected sectors first
     * @param verify Read back and compare after programming
     * @throws CubeProgrammerException NO_FILE if path does not exist
     */
    void download(const std::string& path, uint32_t address, bool skipErase, bool verify);

    /**
     * @brief Information about the connected device
     *
     * @throws CubeProgrammerException DEVICE_NOT_CONNECTED without a target
     */
    TargetInfo info();

    void massErase();

    /**
     * @brief Read target memory
     *
     * @return Exactly size bytes
     */
    std::vector<uint8_t> readMemory(uint32_t address, uint32_t size);

    void writeMemory(uint32_t address, const std::vector<uint8_t>& data);

    uint32_t readRegister(CortexRegister reg);

    void writeRegister(CortexRegister reg, uint32_t value);

    void disconnect();

    void reset(ResetMode mode);

    /**
     * @brief Whether a target is currently connected
     */
    bool connected();

    /**
     * @brief Start the firmware upgrade service on STM32WB devices
     */
    void startFus();

    void setVerbosity(Verbosity verbosity);

    const std::string& getLoadersPath() const { return loadersPath_; }

private:
    std::unique_ptr<IProgrammerBackend> backend_;
    std::string loadersPath_;
    std::mutex mutex_;

    void initialize();

    using EnumerateFn = int32_t (IProgrammerBackend::*)(abi::DebugConnectParameters**, int32_t);
    std::vector<StLinkProbe> enumerate(EnumerateFn enumerateFn, const char* operation);
};

} // namespace cubeprog

#endif // CUBEPROG_API_H
