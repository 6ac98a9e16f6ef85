#include "types.h"

#include <unordered_map>

namespace kvbench {

const std::string& toString(ErrorCode errorCode) noexcept {
    static const std::unordered_map<ErrorCode, std::string> errorCodeMap = {
        {ErrorCode::OK, "OK"},
        {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
        {ErrorCode::INVALID_PARAMS, "INVALID_PARAMS"},
        {ErrorCode::INVALID_CONFIG, "INVALID_CONFIG"},
        {ErrorCode::BACKEND_UNAVAILABLE, "BACKEND_UNAVAILABLE"},
        {ErrorCode::BACKEND_INIT_FAIL, "BACKEND_INIT_FAIL"},
        {ErrorCode::BACKEND_READ_FAIL, "BACKEND_READ_FAIL"},
        {ErrorCode::BACKEND_WRITE_FAIL, "BACKEND_WRITE_FAIL"}};

    auto it = errorCodeMap.find(errorCode);
    static const std::string unknownError = "UNKNOWN_ERROR";
    return (it != errorCodeMap.end()) ? it->second : unknownError;
}

int32_t toInt(ErrorCode errorCode) noexcept {
    return static_cast<int32_t>(errorCode);
}

ErrorCode fromInt(int32_t errorCode) noexcept {
    return static_cast<ErrorCode>(errorCode);
}

}  // namespace kvbench
