#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gauge::discovery {

    struct SerialPortInfo {
        std::string path;         // e.g. /dev/ttyACM0
        std::string description;  // manufacturer + product, when reported
        uint16_t vendorId = 0;
        uint16_t productId = 0;
    };

    /**
     * @brief Elenca le porte seriali USB e filtra quelle dei dinamometri IMADA DST/DSV.
     *
     * Linux only: legge /sys/class/tty. Le radici sono parametri per poter usare
     * un albero finto nei test.
     */
    class DeviceDiscovery {
    public:
        static constexpr uint16_t IMADA_VENDOR_ID = 0x1412;

        static const std::set<uint16_t> &supportedProductIds();

        explicit DeviceDiscovery(std::string ttyClassRoot = "/sys/class/tty", std::string devRoot = "/dev");

        /**
         * @brief Tutte le porte tty con un dispositivo USB a monte.
         */
        std::vector<SerialPortInfo> listUsbSerialPorts() const;

        /**
         * @brief Solo le porte con VID IMADA e PID supportato.
         */
        std::vector<SerialPortInfo> findDevices() const;

    private:
        std::string ttyClassRoot_;
        std::string devRoot_;

        std::optional<SerialPortInfo> inspectPort(const std::string &ttyName) const;
    };

    /**
     * @brief Scorciatoia su DeviceDiscovery con le radici di sistema.
     */
    std::vector<SerialPortInfo> findDevices();

} // namespace gauge::discovery
