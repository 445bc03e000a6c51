#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gauge::serial {

    /**
     * @brief Configurazione del trasporto per un profilo di connessione.
     *
     * USB e RS232C differiscono solo per questi valori.
     */
    struct SerialConfig {
        std::string name;
        uint32_t baudrate = 19200;
        bool hardwareFlowControl = false;
        std::chrono::milliseconds readTimeout{100};

        static SerialConfig usbProfile();

        static SerialConfig rs232cProfile();

        /**
         * @brief Risolve un profilo per nome ("usb" / "rs232c", case insensitive).
         * @throws std::invalid_argument per nomi sconosciuti.
         */
        static SerialConfig fromProfileName(const std::string &profile);

        std::string describe() const;
    };

} // namespace gauge::serial
