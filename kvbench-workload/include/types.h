#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <ylt/util/tl/expected.hpp>

namespace kvbench {

// Latency histogram bounds, in microseconds.
static constexpr uint64_t DEFAULT_HISTOGRAM_LOWEST_US = 1;
static constexpr uint64_t DEFAULT_HISTOGRAM_HIGHEST_US = 10'000'000;  // 10s
static constexpr uint8_t DEFAULT_HISTOGRAM_SIGNIFICANT_DIGITS = 3;

// Skew exponent of every Zipf distribution used by the generators.
static constexpr double DEFAULT_ZIPF_EXPONENT = 1.0;

using Bytes = std::vector<uint8_t>;

/**
 * @brief Half-open range [min, max) of value byte lengths.
 */
struct ValueSizeRange {
    uint64_t min{0};
    uint64_t max{0};

    uint64_t Width() const { return max > min ? max - min : 0; }
};

/**
 * @brief Error codes for benchmark operations
 */
enum class ErrorCode : int32_t {
    OK = 0,               ///< Operation successful.
    INTERNAL_ERROR = -1,  ///< Internal error occurred.

    // Parameter errors (Range: -100 to -199)
    INVALID_PARAMS = -100,  ///< Invalid distribution or histogram parameters.
    INVALID_CONFIG = -101,  ///< Invalid workload descriptor or properties.

    // Backend errors (Range: -200 to -299)
    BACKEND_UNAVAILABLE = -200,  ///< Backend not compiled into this binary.
    BACKEND_INIT_FAIL = -201,    ///< Backend initialization failed.
    BACKEND_READ_FAIL = -202,    ///< Backend get failed.
    BACKEND_WRITE_FAIL = -203,   ///< Backend set failed.
};

int32_t toInt(ErrorCode errorCode) noexcept;
ErrorCode fromInt(int32_t errorCode) noexcept;

const std::string& toString(ErrorCode errorCode) noexcept;

inline std::ostream& operator<<(std::ostream& os,
                                const ErrorCode& errorCode) noexcept {
    return os << toString(errorCode);
}

}  // namespace kvbench
