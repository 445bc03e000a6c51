#include "gauge/serial/impl/RealSerialPort.hpp"
#include "gauge/types/Error.hpp"
#include "logger/Logger.hpp"
#include "CustomBaudrate.hpp"
#include <boost/system/error_code.hpp>

namespace gauge::serial {

    namespace {
        constexpr char TERMINATOR = '\r';

        std::string printable(const std::string &data) {
            std::string out;
            for (char c: data) {
                if (c == '\r') out += "\\r";
                else if (c == '\n') out += "\\n";
                else out += c;
            }
            return out;
        }

        bool isLinkLost(const boost::system::error_code &ec) {
            return ec == boost::asio::error::eof ||
                   ec == boost::asio::error::broken_pipe ||
                   ec == boost::asio::error::connection_reset ||
                   ec == boost::asio::error::bad_descriptor;
        }
    }

    RealSerialPort::RealSerialPort(const std::string &portName, const SerialConfig &config)
            : portName_(portName), config_(config), io_context_(), serial_port_(nullptr) {
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, portName);
        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialPort] Failed to open " + portName + ": " + e.what());
            throw types::TransportException("Cannot open " + portName + ": " + e.what());
        }

        try {
            configurePort();
        } catch (const types::TransportException &) {
            close();
            throw;
        }

        Logger::logInfo("[SerialPort] Opened " + portName + " with profile " + config_.describe());
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    void RealSerialPort::configurePort() {
        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set character size: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set stop bits: " + ec.message());
        }

        const auto flow = config_.hardwareFlowControl
                          ? boost::asio::serial_port_base::flow_control::hardware
                          : boost::asio::serial_port_base::flow_control::none;
        serial_port_->set_option(boost::asio::serial_port_base::flow_control(flow), ec);
        if (ec) {
            throw types::TransportException("Cannot set flow control on " + portName_ + ": " + ec.message());
        }

        // Last: a later set_option would rewrite the speed bits through termios
        applyBaudrate();
    }

    void RealSerialPort::applyBaudrate() {
        boost::system::error_code ec;
        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(config_.baudrate), ec);
        if (!ec) return;

        // 256000 is not in the termios speed table
        Logger::logDebug("[SerialPort] Standard baud rate setting failed (" + ec.message() +
                         "), trying custom rate " + std::to_string(config_.baudrate));

        std::string error;
        if (!detail::setCustomBaudrate(serial_port_->native_handle(), config_.baudrate, error)) {
            throw types::TransportException("Cannot set baud rate " + std::to_string(config_.baudrate) +
                                            " on " + portName_ + ": " + error);
        }
    }

    void RealSerialPort::ensureOpen(const char *operation) const {
        if (!isOpen()) {
            throw types::TransportException(std::string("Serial port ") + portName_ +
                                            " not open during " + operation);
        }
    }

    bool RealSerialPort::takeBufferedLine(std::string &line) {
        auto pos = buffer_.find(TERMINATOR);
        if (pos == std::string::npos) {
            return false;
        }
        line = buffer_.substr(0, pos + 1);
        buffer_.erase(0, pos + 1);
        return true;
    }

    void RealSerialPort::send(const std::string &data) {
        ensureOpen("send");

        boost::system::error_code ec;
        size_t bytes_written = boost::asio::write(*serial_port_, boost::asio::buffer(data), ec);

        if (ec) {
            Logger::logError("[SerialPort] Write error: " + ec.message());
            throw types::TransportException("Write to " + portName_ + " failed: " + ec.message());
        }

        if (bytes_written != data.length()) {
            throw types::TransportException("Short write to " + portName_ + ": " +
                                            std::to_string(bytes_written) + "/" + std::to_string(data.length()));
        }

        Logger::logDebug("[TX] " + printable(data));
    }

    std::string RealSerialPort::receiveLine() {
        ensureOpen("receive");

        std::string line;
        if (takeBufferedLine(line)) {
            Logger::logDebug("[RX] " + printable(line));
            return line;
        }

        boost::system::error_code readError;
        bool completed = false;

        boost::asio::async_read_until(*serial_port_, boost::asio::dynamic_buffer(buffer_), TERMINATOR,
                                      [&](const boost::system::error_code &ec, std::size_t) {
                                          readError = ec;
                                          completed = true;
                                      });

        io_context_.restart();
        io_context_.run_for(config_.readTimeout);

        if (!completed) {
            // Timeout: abort the pending read and let its handler run
            boost::system::error_code cancelError;
            serial_port_->cancel(cancelError);
            io_context_.restart();
            io_context_.run();
        }

        if (readError && readError != boost::asio::error::operation_aborted) {
            Logger::logError("[SerialPort] Read error: " + readError.message());
            if (isLinkLost(readError)) {
                close();
            }
            throw types::TransportException("Read from " + portName_ + " failed: " + readError.message());
        }

        if (!takeBufferedLine(line)) {
            // Partial (or empty) data when the timeout elapsed
            line.swap(buffer_);
            Logger::logDebug("[SerialPort] Read timeout after " + std::to_string(config_.readTimeout.count()) +
                             "ms, got '" + printable(line) + "'");
            return line;
        }

        Logger::logDebug("[RX] " + printable(line));
        return line;
    }

    bool RealSerialPort::isOpen() const {
        return serial_port_ && serial_port_->is_open();
    }

    void RealSerialPort::close() noexcept {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            try {
                if (ec) {
                    Logger::logError("[SerialPort] Error closing port: " + ec.message());
                } else {
                    Logger::logInfo("[SerialPort] Closed " + portName_);
                }
            } catch (const std::exception &) {
                // Logging must not escape a noexcept close
            }
        }
    }
} // namespace gauge::serial
