#pragma once

#include "gauge/types/WireCodes.hpp"
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <string>

namespace gauge::types {

    /**
     * @brief Decimale in base 10, nessun arrotondamento binario sulle cifre ricevute.
     *
     * Esatto fino a digits10 (50) cifre significative; Measurement::parse rifiuta
     * le risposte più lunghe invece di arrotondarle.
     */
    using Decimal = boost::multiprecision::cpp_dec_float_50;

    /**
     * @brief Misura restituita dal dispositivo in risposta al comando "D".
     *
     * Immutabile. Si costruisce solo tramite parse(), mai parzialmente.
     * Formato: <sign><digits>.<digits><unit><mode><state>, es. "+001.23NTO".
     */
    class Measurement {
    public:
        /**
         * @brief Interpreta una risposta già ripulita dagli spazi.
         * @param raw Riga ricevuta.
         * @throws ParseErrorException se la riga non rispetta la grammatica,
         *         contiene un codice fuori tabella o ha più cifre significative
         *         di quante Decimal ne rappresenti esattamente.
         */
        static Measurement parse(const std::string &raw);

        const Decimal &value() const { return value_; }

        Unit unit() const { return unit_; }

        Mode mode() const { return mode_; }

        State state() const { return state_; }

        const std::string &raw() const { return raw_; }

        std::string toString() const;

    private:
        Measurement(Decimal value, Unit unit, Mode mode, State state, std::string raw);

        Decimal value_;
        Unit unit_;
        Mode mode_;
        State state_;
        std::string raw_;
    };

}
