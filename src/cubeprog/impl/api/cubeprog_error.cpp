#include "api/cubeprog_error.h"
#include "utils/log.h"
#include <map>

namespace cubeprog {

namespace {

std::string formatMessage(int statusCode) {
    return std::string(statusMessage(statusCode)) +
           " (Status code: " + std::to_string(statusCode) + ")";
}

} // anonymous namespace

const char* statusMessage(int statusCode) {
    static const std::map<int, const char*> messages = {
        {-1,  "Device not connected"},
        {-2,  "Device not found"},
        {-3,  "Device connection error"},
        {-4,  "No such file"},
        {-5,  "Operation not supported or unimplemented on this interface"},
        {-6,  "Interface not supported or unimplemented on this platform"},
        {-7,  "Insufficient memory"},
        {-8,  "Wrong parameters"},
        {-9,  "Memory read failure"},
        {-10, "Memory write failure"},
        {-11, "Memory erase failure"},
        {-12, "File format not supported for this kind of device"},
        {-13, "Refresh required"},
        {-14, "No security"},
        {-15, "Changing frequency problem"},
        {-16, "RDP Enabled error"},
        {-99, "Other error"},
    };

    auto it = messages.find(statusCode);
    if (it == messages.end()) {
        return "Unknown error occurred.";
    }
    return it->second;
}

CubeProgrammerException::CubeProgrammerException(int statusCode)
    : std::runtime_error(formatMessage(statusCode))
    , statusCode_(statusCode) {
}

void checkStatus(int statusCode, const char* operation) {
    if (statusCode == 0) {
        return;
    }

    LOGE_FMT(operation << " failed: " << statusMessage(statusCode)
             << " (" << statusCode << ")");
    throw CubeProgrammerException(statusCode);
}

} // namespace cubeprog
