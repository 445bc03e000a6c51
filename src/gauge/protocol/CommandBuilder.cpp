#include "gauge/protocol/CommandBuilder.hpp"
#include "gauge/utils/DecimalFormatter.hpp"

namespace gauge::protocol {

    std::string CommandBuilder::setMode(types::Mode mode) {
        return std::string(1, types::toWireCode(mode));
    }

    std::string CommandBuilder::setUnit(types::Unit unit) {
        return std::string(1, types::toWireCode(unit));
    }

    std::string CommandBuilder::setLimitPoints(const types::Decimal &low, const types::Decimal &high,
                                               LimitFieldOrder order) {
        const std::string lowField = utils::formatFixed(low);
        const std::string highField = utils::formatFixed(high);

        if (order == LimitFieldOrder::LowThenHigh) {
            return std::string(SET_LIMITS) + lowField + highField;
        }
        return std::string(SET_LIMITS) + highField + lowField;
    }

    std::string CommandBuilder::frame(const std::string &command) {
        return command + TERMINATOR;
    }

} // namespace gauge::protocol
