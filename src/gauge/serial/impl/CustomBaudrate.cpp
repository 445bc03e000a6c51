// Kept in its own translation unit: <asm/termbits.h> clashes with <termios.h>,
// which Boost.Asio pulls in.

#include "CustomBaudrate.hpp"

#ifdef __linux__

#include <asm/termbits.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstring>

#endif

namespace gauge::serial::detail {

#ifdef __linux__

    bool setCustomBaudrate(int fd, uint32_t baudrate, std::string &error) {
        struct termios2 tio{};
        if (ioctl(fd, TCGETS2, &tio) != 0) {
            error = std::string("TCGETS2 failed: ") + std::strerror(errno);
            return false;
        }

        tio.c_cflag &= ~CBAUD;
        tio.c_cflag |= BOTHER;
        tio.c_ispeed = baudrate;
        tio.c_ospeed = baudrate;

        if (ioctl(fd, TCSETS2, &tio) != 0) {
            error = std::string("TCSETS2 failed: ") + std::strerror(errno);
            return false;
        }
        return true;
    }

#else

    bool setCustomBaudrate(int, uint32_t baudrate, std::string &error) {
        error = "Baudrate " + std::to_string(baudrate) + " not supported on this platform";
        return false;
    }

#endif

} // namespace gauge::serial::detail
