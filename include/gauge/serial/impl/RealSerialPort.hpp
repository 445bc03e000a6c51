#pragma once

#include "../SerialPort.hpp"
#include "../SerialConfig.hpp"
#include <boost/asio.hpp>
#include <string>
#include <memory>

namespace gauge::serial {

/**
 * @brief Implementazione di SerialPort usando Boost.Asio
 *
 * 8N1, baudrate e controllo di flusso dal profilo. Le letture scadono dopo
 * SerialConfig::readTimeout restituendo quanto ricevuto fino a quel momento.
 */
    class RealSerialPort : public SerialPort {
    public:
        /**
         * @throws TransportException se la porta non può essere aperta o configurata.
         */
        RealSerialPort(const std::string &portName, const SerialConfig &config);

        ~RealSerialPort() override;

        RealSerialPort(const RealSerialPort &) = delete;

        RealSerialPort &operator=(const RealSerialPort &) = delete;

        void send(const std::string &data) override;

        std::string receiveLine() override;

        bool isOpen() const override;

        void close() noexcept override;

        const std::string &portName() const { return portName_; }

    private:
        std::string portName_;
        SerialConfig config_;
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::string buffer_;

        void configurePort();

        void applyBaudrate();

        void ensureOpen(const char *operation) const;

        /**
         * @brief Estrae una linea completa da buffer_, se presente.
         */
        bool takeBufferedLine(std::string &line);
    };

} // namespace gauge::serial
