#include "gauge/session/DeviceSession.hpp"
#include "gauge/serial/impl/RealSerialPort.hpp"
#include "gauge/types/Error.hpp"
#include "logger/Logger.hpp"

#include <stdexcept>

namespace gauge::session {

    DeviceSession::DeviceSession(const std::string &portPath, const serial::SerialConfig &config)
            : config_(config),
              port_(std::make_unique<serial::RealSerialPort>(portPath, config)) {
        start();
    }

    DeviceSession::DeviceSession(std::unique_ptr<serial::SerialPort> port, const serial::SerialConfig &config)
            : config_(config), port_(std::move(port)) {
        if (!port_) {
            throw std::invalid_argument("SerialPort cannot be null");
        }
        start();
    }

    DeviceSession::~DeviceSession() {
        close();
    }

    void DeviceSession::start() {
        if (!port_->isOpen()) {
            throw types::TransportException("Transport not open when starting session");
        }

        protocol_ = std::make_unique<protocol::GaugeProtocolHandler>(*port_);

        try {
            banner_ = protocol_->readStartLine();
        } catch (const std::exception &e) {
            Logger::logError("[DeviceSession] Failed to read start line: " + std::string(e.what()));
            close();
            throw;
        }

        Logger::logInfo("[DeviceSession] Session ready, profile " + config_.describe());
    }

    protocol::GaugeProtocolHandler &DeviceSession::protocol() {
        if (closed_ || !protocol_) {
            throw types::ProtocolStateException("protocol", "SessionClosed");
        }
        return *protocol_;
    }

    void DeviceSession::close() noexcept {
        if (closed_) return;
        closed_ = true;

        if (protocol_) {
            protocol_->markTransportClosed();
        }
        if (port_) {
            port_->close();
        }

        try {
            Logger::logInfo("[DeviceSession] Session closed");
        } catch (const std::exception &) {
            // Logging must not escape a noexcept close
        }
    }

    bool DeviceSession::isOpen() const {
        return !closed_ && port_ && port_->isOpen();
    }

} // namespace gauge::session
