#pragma once

#include <cstdint>
#include <string>

namespace gauge::serial::detail {

    /**
     * @brief Imposta un baudrate fuori dalla tabella termios standard (es. 256000).
     *
     * Linux usa termios2/BOTHER. Sulle altre piattaforme restituisce false.
     * @param fd Descrittore nativo della porta.
     * @param baudrate Velocità richiesta.
     * @param error Messaggio di errore in caso di fallimento.
     */
    bool setCustomBaudrate(int fd, uint32_t baudrate, std::string &error);

}
