#pragma once

#include <stdexcept>
#include <string>

namespace gauge::types {

    class GaugeException : public std::runtime_error {
    public:
        explicit GaugeException(const std::string &msg)
                : std::runtime_error(msg) {}
    };

    /**
     * @brief Il dispositivo ha risposto "E" al comando inviato.
     */
    class CommandRejectedException : public GaugeException {
    public:
        explicit CommandRejectedException(const std::string &command)
                : GaugeException("Invalid command: " + command), command_(command) {}

        const std::string &command() const noexcept { return command_; }

    private:
        std::string command_;
    };

    /**
     * @brief Risposta diversa dall'ACK "R" atteso.
     */
    class AckMismatchException : public GaugeException {
    public:
        AckMismatchException(const std::string &command, const std::string &response)
                : GaugeException("Unexpected response to " + command + ": '" + response + "'"),
                  command_(command), response_(response) {}

        const std::string &command() const noexcept { return command_; }

        const std::string &response() const noexcept { return response_; }

    private:
        std::string command_;
        std::string response_;
    };

    class ParseErrorException : public GaugeException {
    public:
        explicit ParseErrorException(const std::string &response)
                : GaugeException("Cannot parse measure response: '" + response + "'"), response_(response) {}

        const std::string &response() const noexcept { return response_; }

    private:
        std::string response_;
    };

    class UnknownWireCodeException : public GaugeException {
    public:
        UnknownWireCodeException(const std::string &table, char code)
                : GaugeException("Unknown " + table + " code: '" + std::string(1, code) + "'"),
                  table_(table), code_(code) {}

        const std::string &table() const noexcept { return table_; }

        char code() const noexcept { return code_; }

    private:
        std::string table_;
        char code_;
    };

    /**
     * @brief Operazione invocata nello stato sbagliato (prima del banner o dopo lo spegnimento).
     */
    class ProtocolStateException : public GaugeException {
    public:
        ProtocolStateException(const std::string &operation, const std::string &state)
                : GaugeException("Operation '" + operation + "' not allowed in state " + state),
                  operation_(operation) {}

        const std::string &operation() const noexcept { return operation_; }

    private:
        std::string operation_;
    };

    class TransportException : public GaugeException {
    public:
        explicit TransportException(const std::string &msg)
                : GaugeException(msg) {}
    };

}
