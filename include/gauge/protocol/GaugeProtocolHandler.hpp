#pragma once

#include "gauge/serial/SerialPort.hpp"
#include "gauge/protocol/CommandBuilder.hpp"
#include "gauge/types/Measurement.hpp"
#include "gauge/types/WireCodes.hpp"
#include <mutex>
#include <string>

namespace gauge::protocol {

    enum class ProtocolState {
        AwaitingBanner, // transport just opened, "Gauge Started." not consumed yet
        Ready,
        PoweredOff,     // terminal, after "Q"
        TransportClosed // terminal, the owning session closed the port
    };

    /**
     * @brief Gestisce il protocollo ASCII dei dinamometri DST/DSV.
     *
     * Uno scambio alla volta: scrive il comando terminato da '\r', legge una sola
     * linea di risposta, "E" significa comando rifiutato. Gli scambi sono serializzati
     * da un mutex interno e l'handler non è copiabile né spostabile.
     *
     * Non possiede la porta: il chiamante (DeviceSession) ne garantisce la durata.
     */
    class GaugeProtocolHandler {
    public:
        explicit GaugeProtocolHandler(serial::SerialPort &port);

        GaugeProtocolHandler(const GaugeProtocolHandler &) = delete;

        GaugeProtocolHandler &operator=(const GaugeProtocolHandler &) = delete;

        /**
         * @brief Consuma la linea di avvio ("Gauge Started.") senza validarla.
         *
         * Va chiamato una sola volta, subito dopo l'apertura e prima di ogni altra operazione.
         * @return La linea letta, ripulita dagli spazi.
         * @throws ProtocolStateException se il banner è già stato consumato.
         */
        std::string readStartLine();

        /**
         * @brief Azzera la misura ("Z").
         */
        void zero();

        /**
         * @brief Richiede una misura ("D").
         * @throws ParseErrorException se la risposta non rispetta la grammatica.
         */
        types::Measurement measure();

        void setMode(types::Mode mode);

        void setUnit(types::Unit unit);

        /**
         * @brief Imposta le soglie del comparatore ("E" + due campi a 2 decimali).
         * @param order Ordine dei campi sul filo, sempre esplicito.
         */
        void setLimitPoints(const types::Decimal &low, const types::Decimal &high, LimitFieldOrder order);

        /**
         * @brief Salva la misura corrente nella memoria interna ("OM").
         */
        void store();

        /**
         * @brief Cancella l'ultima misura salvata ("OC0").
         */
        void clearLast();

        /**
         * @brief Cancella tutte le misure salvate ("OC1").
         */
        void clearAll();

        /**
         * @brief Spegne il dispositivo ("Q"), nessuna risposta attesa.
         *
         * Stato terminale: ogni chiamata successiva lancia ProtocolStateException.
         */
        void powerOff();

        /**
         * @brief Porta l'handler nello stato terminale TransportClosed.
         *
         * Chiamato dalla sessione prima di chiudere la porta: chi conserva ancora un
         * riferimento all'handler riceve ProtocolStateException invece di un errore di trasporto.
         */
        void markTransportClosed() noexcept;

        ProtocolState state() const;

        static std::string stateToString(ProtocolState state);

    private:
        serial::SerialPort &port_;
        ProtocolState state_;
        mutable std::mutex exchangeMutex_;

        void requireState(ProtocolState expected, const std::string &operation) const;

        void transmit(const std::string &command);

        std::string receive();

        /**
         * @brief Scambio completo: invio, lettura di una linea, controllo del rifiuto "E".
         */
        std::string request(const std::string &command);

        /**
         * @brief Come request(), ma pretende l'ACK "R".
         */
        void requestAck(const std::string &operation, const std::string &command);
    };

} // namespace gauge::protocol
