#pragma once

#include "gauge/protocol/GaugeProtocolHandler.hpp"
#include "gauge/serial/SerialConfig.hpp"
#include "gauge/serial/SerialPort.hpp"
#include <memory>
#include <string>
#include <utility>

namespace gauge::session {

    /**
     * @brief Sessione con un dinamometro: apre il trasporto, consuma il banner,
     * espone il GaugeProtocolHandler e chiude il trasporto in ogni caso.
     *
     * USB e RS232C sono solo due SerialConfig diversi (usbProfile / rs232cProfile).
     */
    class DeviceSession {
    public:
        /**
         * @brief Apre la porta reale con il profilo indicato.
         * @throws TransportException se l'apertura fallisce.
         */
        DeviceSession(const std::string &portPath, const serial::SerialConfig &config);

        /**
         * @brief Usa un trasporto già aperto (test, trasporti alternativi).
         */
        DeviceSession(std::unique_ptr<serial::SerialPort> port, const serial::SerialConfig &config);

        ~DeviceSession();

        DeviceSession(const DeviceSession &) = delete;

        DeviceSession &operator=(const DeviceSession &) = delete;

        /**
         * @throws ProtocolStateException se la sessione è già chiusa.
         */
        protocol::GaugeProtocolHandler &protocol();

        /**
         * @brief Chiude il trasporto. Idempotente.
         */
        void close() noexcept;

        bool isOpen() const;

        const serial::SerialConfig &config() const { return config_; }

        const std::string &banner() const { return banner_; }

    private:
        serial::SerialConfig config_;
        std::unique_ptr<serial::SerialPort> port_;
        std::unique_ptr<protocol::GaugeProtocolHandler> protocol_;
        std::string banner_;
        bool closed_ = false;

        void start();
    };

    /**
     * @brief Esegue fn(handler) dentro una sessione, chiusa all'uscita anche in caso di eccezione.
     */
    template<typename Fn>
    auto withDeviceSession(const std::string &portPath, const serial::SerialConfig &config, Fn &&fn)
    -> decltype(std::forward<Fn>(fn)(std::declval<protocol::GaugeProtocolHandler &>())) {
        DeviceSession session(portPath, config);
        return std::forward<Fn>(fn)(session.protocol());
    }

    template<typename Fn>
    auto withDeviceSession(std::unique_ptr<serial::SerialPort> port, const serial::SerialConfig &config, Fn &&fn)
    -> decltype(std::forward<Fn>(fn)(std::declval<protocol::GaugeProtocolHandler &>())) {
        DeviceSession session(std::move(port), config);
        return std::forward<Fn>(fn)(session.protocol());
    }

} // namespace gauge::session
