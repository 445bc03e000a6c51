#include "gauge/discovery/DeviceDiscovery.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace gauge::discovery {

    namespace {
        // Hops from the tty's device node up to the USB device carrying idVendor
        constexpr int MAX_PARENT_HOPS = 4;

        std::string readAttribute(const fs::path &file) {
            std::ifstream in(file);
            std::string value;
            std::getline(in, value);

            auto end = value.find_last_not_of(" \t\r\n");
            return end == std::string::npos ? "" : value.substr(0, end + 1);
        }

        std::optional<uint16_t> readHexId(const fs::path &file) {
            std::string text = readAttribute(file);
            if (text.empty()) return std::nullopt;
            try {
                size_t consumed = 0;
                unsigned long value = std::stoul(text, &consumed, 16);
                if (consumed != text.size() || value > 0xFFFF) return std::nullopt;
                return static_cast<uint16_t>(value);
            } catch (const std::logic_error &) {
                return std::nullopt;
            }
        }
    }

    const std::set<uint16_t> &DeviceDiscovery::supportedProductIds() {
        static const std::set<uint16_t> ids{
                0x0200 // DST/DSV series
        };
        return ids;
    }

    DeviceDiscovery::DeviceDiscovery(std::string ttyClassRoot, std::string devRoot)
            : ttyClassRoot_(std::move(ttyClassRoot)), devRoot_(std::move(devRoot)) {}

    std::vector<SerialPortInfo> DeviceDiscovery::listUsbSerialPorts() const {
        std::vector<SerialPortInfo> ports;

        std::error_code ec;
        fs::directory_iterator it(ttyClassRoot_, ec);
        if (ec) {
            Logger::logWarning("[DeviceDiscovery] Cannot list " + ttyClassRoot_ + ": " + ec.message());
            return ports;
        }

        for (const auto &entry: it) {
            auto info = inspectPort(entry.path().filename().string());
            if (info) {
                ports.push_back(std::move(*info));
            }
        }

        std::sort(ports.begin(), ports.end(), [](const SerialPortInfo &a, const SerialPortInfo &b) {
            return a.path < b.path;
        });
        return ports;
    }

    std::vector<SerialPortInfo> DeviceDiscovery::findDevices() const {
        std::vector<SerialPortInfo> devices;
        const auto &productIds = supportedProductIds();

        for (auto &port: listUsbSerialPorts()) {
            if (port.vendorId == IMADA_VENDOR_ID && productIds.count(port.productId) > 0) {
                devices.push_back(std::move(port));
            }
        }

        Logger::logInfo("[DeviceDiscovery] Found " + std::to_string(devices.size()) + " compatible device(s)");
        return devices;
    }

    std::optional<SerialPortInfo> DeviceDiscovery::inspectPort(const std::string &ttyName) const {
        std::error_code ec;
        fs::path deviceLink = fs::path(ttyClassRoot_) / ttyName / "device";
        if (!fs::exists(deviceLink, ec)) {
            return std::nullopt; // virtual terminal, no hardware behind it
        }

        fs::path node = fs::canonical(deviceLink, ec);
        if (ec) {
            return std::nullopt;
        }

        for (int hop = 0; hop <= MAX_PARENT_HOPS && !node.empty(); ++hop) {
            if (fs::exists(node / "idVendor", ec) && fs::exists(node / "idProduct", ec)) {
                auto vid = readHexId(node / "idVendor");
                auto pid = readHexId(node / "idProduct");
                if (!vid || !pid) {
                    Logger::logWarning("[DeviceDiscovery] Unreadable USB ids under " + node.string());
                    return std::nullopt;
                }

                SerialPortInfo info;
                info.path = (fs::path(devRoot_) / ttyName).string();
                info.vendorId = *vid;
                info.productId = *pid;

                std::string manufacturer = readAttribute(node / "manufacturer");
                std::string product = readAttribute(node / "product");
                info.description = manufacturer.empty() ? product
                                                        : (product.empty() ? manufacturer
                                                                           : manufacturer + " " + product);
                if (info.description.empty()) {
                    info.description = ttyName;
                }
                return info;
            }

            if (node == node.parent_path()) break;
            node = node.parent_path();
        }

        return std::nullopt;
    }

    std::vector<SerialPortInfo> findDevices() {
        return DeviceDiscovery().findDevices();
    }

} // namespace gauge::discovery
