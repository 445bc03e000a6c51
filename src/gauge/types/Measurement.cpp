#include "gauge/types/Measurement.hpp"
#include "gauge/types/Error.hpp"

#include <limits>
#include <regex>
#include <utility>

namespace gauge::types {

    namespace {
        const std::regex MEASURE_PATTERN(R"(^([+-])([0-9]+\.[0-9]+)([A-Z])([A-Z])([A-Z])$)");

        // Digits between the first and last non-zero digit, decimal point excluded
        size_t significantDigits(const std::string &magnitude) {
            auto first = magnitude.find_first_not_of("0.");
            if (first == std::string::npos) {
                return 0;
            }
            auto last = magnitude.find_last_not_of("0.");
            size_t count = last - first + 1;
            auto point = magnitude.find('.');
            if (point > first && point < last) {
                --count;
            }
            return count;
        }
    }

    Measurement::Measurement(Decimal value, Unit unit, Mode mode, State state, std::string raw)
            : value_(std::move(value)), unit_(unit), mode_(mode), state_(state), raw_(std::move(raw)) {}

    Measurement Measurement::parse(const std::string &raw) {
        std::smatch match;
        if (!std::regex_match(raw, match, MEASURE_PATTERN)) {
            throw ParseErrorException(raw);
        }

        auto unit = unitFromWireCode(match[3].str().front());
        auto mode = modeFromWireCode(match[4].str().front());
        auto state = stateFromWireCode(match[5].str().front());
        if (!unit || !mode || !state) {
            throw ParseErrorException(raw);
        }

        // Longer magnitudes would be rounded silently by Decimal
        if (significantDigits(match[2].str()) > static_cast<size_t>(std::numeric_limits<Decimal>::digits10)) {
            throw ParseErrorException(raw);
        }

        Decimal value(match[2].str());
        if (match[1].str() == "-") {
            value = -value;
        }

        return {std::move(value), *unit, *mode, *state, raw};
    }

    std::string Measurement::toString() const {
        return value_.str() + " " + types::toString(unit_) +
               " (" + types::toString(mode_) + ", " + types::toString(state_) + ")";
    }

} // namespace gauge::types
