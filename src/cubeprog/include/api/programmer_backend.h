#ifndef CUBEPROG_PROGRAMMER_BACKEND_H
#define CUBEPROG_PROGRAMMER_BACKEND_H

#include "api/cubeprog_types.h"
#include <cstdint>
#include <string>

namespace cubeprog {

/**
 * @brief Entry points of the vendor programmer API
 *
 * One method per exported C function, with the vendor's return conventions
 * left intact (0 = success for status returning calls). CubeProgrammerApi
 * performs the error mapping on top of this table.
 *
 * Implementations:
 * - CubeProgrammerLibrary: binds the functions from the shared library
 * - test fakes
 */
class IProgrammerBackend {
public:
    virtual ~IProgrammerBackend() = default;

    virtual void setLoadersPath(const std::string& path) = 0;
    virtual void setDisplayCallbacks(const abi::DisplayCallbacks& callbacks) = 0;
    virtual void setVerbosityLevel(int32_t level) = 0;

    /**
     * @brief Enumerate ST-LINK probes (full enumeration, slower)
     *
     * @param list Receives a library owned array of records
     * @param shared Non-zero to include probes in shared mode
     * @return Number of records, negative on failure
     */
    virtual int32_t getStLinkEnumerationList(abi::DebugConnectParameters** list, int32_t shared) = 0;

    /**
     * @brief Enumerate ST-LINK probes (quick lookup)
     *
     * Same contract as getStLinkEnumerationList().
     */
    virtual int32_t getStLinkList(abi::DebugConnectParameters** list, int32_t shared) = 0;

    /**
     * @brief Release the array returned by the enumeration calls
     */
    virtual void deleteInterfaceList() = 0;

    virtual int32_t connectStLink(const abi::DebugConnectParameters& parameters) = 0;
    virtual void disconnect() = 0;

    /**
     * @return 1 when a target is connected
     */
    virtual int32_t checkDeviceConnection() = 0;

    /**
     * @return Library owned record, or nullptr without a connected target
     */
    virtual const abi::GeneralInfo* getDeviceGeneralInf() = 0;

    virtual int32_t downloadFile(const std::wstring& filePath,
                                 uint32_t address,
                                 uint32_t skipErase,
                                 uint32_t verify,
                                 const std::wstring& binPath) = 0;

    virtual int32_t massErase() = 0;

    /**
     * @param data Receives a library allocated buffer of size bytes,
     *             released with freeLibraryMemory()
     */
    virtual int32_t readMemory(uint32_t address, uint8_t** data, uint32_t size) = 0;
    virtual int32_t writeMemory(uint32_t address, const uint8_t* data, uint32_t size) = 0;
    virtual void freeLibraryMemory(void* ptr) = 0;

    virtual int32_t readCortexReg(uint32_t reg, uint32_t* data) = 0;
    virtual int32_t writeCortexRegistres(uint32_t reg, uint32_t data) = 0;

    virtual int32_t reset(int32_t mode) = 0;

    /**
     * @brief Start the wireless stack firmware upgrade service (STM32WB)
     *
     * @return 1 on success, 0 on failure
     */
    virtual int32_t startFus() = 0;
};

} // namespace cubeprog

#endif // CUBEPROG_PROGRAMMER_BACKEND_H
