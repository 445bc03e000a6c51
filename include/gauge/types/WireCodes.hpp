#pragma once

#include <optional>
#include <string>

namespace gauge::types {

    enum class Unit {
        Newton,     // N
        Kilograms   // K
    };

    enum class Mode {
        Realtime,   // T
        Peak        // P
    };

    enum class State {
        BelowLimit, // L
        Good,       // O
        AboveLimit, // H
        Overload    // E
    };

    /**
     * @brief Codice a un carattere usato sul filo per ogni valore.
     */
    char toWireCode(Unit unit);

    char toWireCode(Mode mode);

    char toWireCode(State state);

    /**
     * @brief Lookup inverso, std::nullopt se il codice non appartiene alla tabella.
     */
    std::optional<Unit> unitFromWireCode(char code);

    std::optional<Mode> modeFromWireCode(char code);

    std::optional<State> stateFromWireCode(char code);

    /**
     * @brief Come sopra ma lancia UnknownWireCodeException.
     */
    Unit parseUnit(char code);

    Mode parseMode(char code);

    State parseState(char code);

    std::string toString(Unit unit);

    std::string toString(Mode mode);

    std::string toString(State state);

}
