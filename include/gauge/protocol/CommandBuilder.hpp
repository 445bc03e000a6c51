#pragma once

#include "gauge/types/Measurement.hpp"
#include "gauge/types/WireCodes.hpp"
#include <string>

namespace gauge::protocol {

    /**
     * @brief Ordine dei due campi del comando "E" sul filo.
     *
     * Nessun valore di default: l'ordine corretto va verificato sul manuale
     * comandi IMADA e scelto esplicitamente dal chiamante.
     */
    enum class LimitFieldOrder {
        HighThenLow,
        LowThenHigh
    };

    /**
     * @brief Costruisce le stringhe di comando da inviare al dinamometro.
     *
     * Le stringhe non includono il terminatore '\r', aggiunto al momento dell'invio.
     */
    class CommandBuilder {
    public:
        static constexpr char TERMINATOR = '\r';

        static constexpr const char *ZERO = "Z";
        static constexpr const char *MEASURE = "D";
        static constexpr const char *STORE = "OM";
        static constexpr const char *CLEAR_LAST = "OC0";
        static constexpr const char *CLEAR_ALL = "OC1";
        static constexpr const char *POWER_OFF = "Q";
        static constexpr const char *SET_LIMITS = "E";

        static constexpr const char *ACK = "R";
        static constexpr const char *REJECTED = "E";

        static std::string setMode(types::Mode mode);

        static std::string setUnit(types::Unit unit);

        /**
         * @brief Comando "E" con le due soglie in virgola fissa a 2 decimali.
         * @param low Soglia bassa.
         * @param high Soglia alta.
         * @param order Ordine dei campi sul filo.
         */
        static std::string setLimitPoints(const types::Decimal &low, const types::Decimal &high,
                                          LimitFieldOrder order);

        /**
         * @brief Aggiunge il terminatore al comando.
         */
        static std::string frame(const std::string &command);
    };

}
