#ifndef CUBEPROG_API_ERROR_H
#define CUBEPROG_API_ERROR_H

#include <stdexcept>
#include <string>

namespace cubeprog {

/**
 * @brief Status codes returned by the vendor programmer API
 */
enum class StatusCode : int {
    OK = 0,
    DEVICE_NOT_CONNECTED = -1,
    NO_DEVICE_FOUND = -2,
    CONNECTION_ERROR = -3,
    NO_FILE = -4,
    NOT_SUPPORTED = -5,
    INTERFACE_NOT_SUPPORTED = -6,
    NO_MEMORY = -7,
    WRONG_PARAMETERS = -8,
    READ_MEMORY_FAILED = -9,
    WRITE_MEMORY_FAILED = -10,
    ERASE_MEMORY_FAILED = -11,
    UNSUPPORTED_FILE_FORMAT = -12,
    REFRESH_REQUIRED = -13,
    NO_SECURITY = -14,
    FREQUENCY_ERROR = -15,
    RDP_ENABLED = -16,
    OTHER = -99
};

/**
 * @brief Human readable text for a raw status code
 *
 * @return "Unknown error occurred." for codes outside the vendor table
 */
const char* statusMessage(int statusCode);

inline const char* statusMessage(StatusCode statusCode) {
    return statusMessage(static_cast<int>(statusCode));
}

/**
 * @brief Thrown when a programmer operation returns a failure status
 *
 * what() reads "<message> (Status code: <code>)".
 */
class CubeProgrammerException : public std::runtime_error {
public:
    explicit CubeProgrammerException(int statusCode);

    explicit CubeProgrammerException(StatusCode statusCode)
        : CubeProgrammerException(static_cast<int>(statusCode)) {}

    int getStatusCode() const { return statusCode_; }

    StatusCode getStatus() const { return static_cast<StatusCode>(statusCode_); }

    /**
     * @brief Message without the status code suffix
     */
    const char* getMessage() const { return statusMessage(statusCode_); }

private:
    int statusCode_;
};

/**
 * @brief Throw CubeProgrammerException unless statusCode is 0
 *
 * @param operation Name of the failed call, used for the error log
 */
void checkStatus(int statusCode, const char* operation);

} // namespace cubeprog

#endif // CUBEPROG_API_ERROR_H
