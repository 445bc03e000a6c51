#include "gauge/protocol/GaugeProtocolHandler.hpp"
#include "gauge/protocol/CommandBuilder.hpp"
#include "gauge/types/Error.hpp"
#include "logger/Logger.hpp"

#include <system_error>

namespace gauge::protocol {

    namespace {
        std::string trim(const std::string &line) {
            const char *whitespace = " \t\r\n\v\f";
            auto first = line.find_first_not_of(whitespace);
            if (first == std::string::npos) {
                return "";
            }
            auto last = line.find_last_not_of(whitespace);
            return line.substr(first, last - first + 1);
        }
    }

    GaugeProtocolHandler::GaugeProtocolHandler(serial::SerialPort &port)
            : port_(port), state_(ProtocolState::AwaitingBanner) {}

    std::string GaugeProtocolHandler::readStartLine() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::AwaitingBanner, "readStartLine");

        std::string banner = trim(receive());
        state_ = ProtocolState::Ready;

        Logger::logInfo("[GaugeProtocol] Start line: '" + banner + "'");
        return banner;
    }

    void GaugeProtocolHandler::zero() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "zero");
        requestAck("zero", CommandBuilder::ZERO);
    }

    types::Measurement GaugeProtocolHandler::measure() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "measure");

        std::string response = request(CommandBuilder::MEASURE);
        try {
            return types::Measurement::parse(response);
        } catch (const types::ParseErrorException &e) {
            Logger::logWarning("[GaugeProtocol] " + std::string(e.what()));
            throw;
        }
    }

    void GaugeProtocolHandler::setMode(types::Mode mode) {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "setMode");
        requestAck("set mode to " + types::toString(mode), CommandBuilder::setMode(mode));
    }

    void GaugeProtocolHandler::setUnit(types::Unit unit) {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "setUnit");
        requestAck("set unit to " + types::toString(unit), CommandBuilder::setUnit(unit));
    }

    void GaugeProtocolHandler::setLimitPoints(const types::Decimal &low, const types::Decimal &high,
                                              LimitFieldOrder order) {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "setLimitPoints");
        requestAck("set limits (low " + low.str() + ", high " + high.str() + ")",
                   CommandBuilder::setLimitPoints(low, high, order));
    }

    void GaugeProtocolHandler::store() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "store");
        requestAck("store", CommandBuilder::STORE);
    }

    void GaugeProtocolHandler::clearLast() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "clearLast");
        requestAck("clear last", CommandBuilder::CLEAR_LAST);
    }

    void GaugeProtocolHandler::clearAll() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "clearAll");
        requestAck("clear all", CommandBuilder::CLEAR_ALL);
    }

    void GaugeProtocolHandler::powerOff() {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        requireState(ProtocolState::Ready, "powerOff");

        // Terminal even if the write below fails: the device may already be off
        state_ = ProtocolState::PoweredOff;
        transmit(CommandBuilder::POWER_OFF);
        Logger::logInfo("[GaugeProtocol] Power off sent, handler is now closed");
    }

    void GaugeProtocolHandler::markTransportClosed() noexcept {
        try {
            // Waits for an exchange in progress on another thread
            std::lock_guard<std::mutex> lock(exchangeMutex_);
            state_ = ProtocolState::TransportClosed;
        } catch (const std::system_error &) {
            state_ = ProtocolState::TransportClosed;
        }
    }

    ProtocolState GaugeProtocolHandler::state() const {
        std::lock_guard<std::mutex> lock(exchangeMutex_);
        return state_;
    }

    std::string GaugeProtocolHandler::stateToString(ProtocolState state) {
        switch (state) {
            case ProtocolState::AwaitingBanner:
                return "AwaitingBanner";
            case ProtocolState::Ready:
                return "Ready";
            case ProtocolState::PoweredOff:
                return "PoweredOff";
            case ProtocolState::TransportClosed:
                return "TransportClosed";
            default:
                return "Unknown";
        }
    }

    void GaugeProtocolHandler::requireState(ProtocolState expected, const std::string &operation) const {
        if (state_ != expected) {
            Logger::logError("[GaugeProtocol] '" + operation + "' called in state " + stateToString(state_));
            throw types::ProtocolStateException(operation, stateToString(state_));
        }
    }

    void GaugeProtocolHandler::transmit(const std::string &command) {
        port_.send(CommandBuilder::frame(command));
    }

    std::string GaugeProtocolHandler::receive() {
        return port_.receiveLine();
    }

    std::string GaugeProtocolHandler::request(const std::string &command) {
        transmit(command);
        std::string response = trim(receive());

        if (response == CommandBuilder::REJECTED) {
            Logger::logWarning("[GaugeProtocol] Command rejected by device: " + command);
            throw types::CommandRejectedException(command);
        }

        return response;
    }

    void GaugeProtocolHandler::requestAck(const std::string &operation, const std::string &command) {
        std::string response = request(command);
        if (response != CommandBuilder::ACK) {
            Logger::logWarning("[GaugeProtocol] Cannot " + operation + ", got response: '" + response + "'");
            throw types::AckMismatchException(command, response);
        }
        Logger::logDebug("[GaugeProtocol] " + operation + " acknowledged");
    }

} // namespace gauge::protocol
