#pragma once

#include <string>

namespace gauge::serial {

/**
 * @brief Interfaccia per la comunicazione seriale con il dinamometro.
 */
    class SerialPort {
    public:
        virtual ~SerialPort() = default;

        /**
         * @brief Invia una stringa sulla porta seriale, senza aggiungere terminatori.
         * @param data Byte da inviare.
         * @throws TransportException se la scrittura fallisce o il collegamento è perso.
         */
        virtual void send(const std::string &data) = 0;

        /**
         * @brief Riceve una linea terminata da '\r'.
         *
         * Allo scadere del timeout restituisce quanto accumulato fino a quel momento
         * (anche vuoto) senza lanciare eccezioni.
         * @return Linea ricevuta, terminatore incluso se presente.
         * @throws TransportException se il collegamento è perso.
         */
        virtual std::string receiveLine() = 0;

        virtual bool isOpen() const = 0;

        virtual void close() noexcept = 0;
    };

} // namespace gauge::serial
