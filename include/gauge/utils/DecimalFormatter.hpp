#pragma once

#include "gauge/types/Measurement.hpp"
#include <ios>
#include <string>

namespace gauge::utils {
    constexpr int LIMIT_PRECISION = 2;

    /**
     * @brief Formatta un decimale in virgola fissa, default 2 decimali (es. "12.50", "-3.00").
     */
    inline std::string formatFixed(const types::Decimal &value, int precision = LIMIT_PRECISION) {
        std::string result = value.str(precision, std::ios_base::fixed);

        // "-0.00" is not a meaningful limit value
        if (result.find_first_not_of("-0.") == std::string::npos && !result.empty() && result.front() == '-') {
            result.erase(0, 1);
        }
        return result;
    }
} // namespace gauge::utils
