#include "gauge/types/WireCodes.hpp"
#include "gauge/types/Error.hpp"

#include <array>
#include <utility>

namespace gauge::types {

    namespace {
        constexpr std::array<std::pair<Unit, char>, 2> UNIT_CODES{{
                {Unit::Newton, 'N'},
                {Unit::Kilograms, 'K'},
        }};

        constexpr std::array<std::pair<Mode, char>, 2> MODE_CODES{{
                {Mode::Realtime, 'T'},
                {Mode::Peak, 'P'},
        }};

        constexpr std::array<std::pair<State, char>, 4> STATE_CODES{{
                {State::BelowLimit, 'L'},
                {State::Good, 'O'},
                {State::AboveLimit, 'H'},
                {State::Overload, 'E'},
        }};

        template<typename Enum, std::size_t N>
        char encode(const std::array<std::pair<Enum, char>, N> &table, Enum value) {
            for (const auto &[variant, code]: table) {
                if (variant == value) return code;
            }
            // Only reachable with a value cast from outside the enumeration
            throw GaugeException("Enumeration value without wire code: " +
                                 std::to_string(static_cast<int>(value)));
        }

        template<typename Enum, std::size_t N>
        std::optional<Enum> decode(const std::array<std::pair<Enum, char>, N> &table, char code) {
            for (const auto &[variant, wire]: table) {
                if (wire == code) return variant;
            }
            return std::nullopt;
        }
    }

    char toWireCode(Unit unit) {
        return encode(UNIT_CODES, unit);
    }

    char toWireCode(Mode mode) {
        return encode(MODE_CODES, mode);
    }

    char toWireCode(State state) {
        return encode(STATE_CODES, state);
    }

    std::optional<Unit> unitFromWireCode(char code) {
        return decode(UNIT_CODES, code);
    }

    std::optional<Mode> modeFromWireCode(char code) {
        return decode(MODE_CODES, code);
    }

    std::optional<State> stateFromWireCode(char code) {
        return decode(STATE_CODES, code);
    }

    Unit parseUnit(char code) {
        auto unit = unitFromWireCode(code);
        if (!unit) throw UnknownWireCodeException("unit", code);
        return *unit;
    }

    Mode parseMode(char code) {
        auto mode = modeFromWireCode(code);
        if (!mode) throw UnknownWireCodeException("mode", code);
        return *mode;
    }

    State parseState(char code) {
        auto state = stateFromWireCode(code);
        if (!state) throw UnknownWireCodeException("state", code);
        return *state;
    }

    std::string toString(Unit unit) {
        switch (unit) {
            case Unit::Newton:
                return "Newton";
            case Unit::Kilograms:
                return "Kilograms";
            default:
                return "Unknown";
        }
    }

    std::string toString(Mode mode) {
        switch (mode) {
            case Mode::Realtime:
                return "Realtime";
            case Mode::Peak:
                return "Peak";
            default:
                return "Unknown";
        }
    }

    std::string toString(State state) {
        switch (state) {
            case State::BelowLimit:
                return "BelowLimit";
            case State::Good:
                return "Good";
            case State::AboveLimit:
                return "AboveLimit";
            case State::Overload:
                return "Overload";
            default:
                return "Unknown";
        }
    }

} // namespace gauge::types
