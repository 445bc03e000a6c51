#include "gauge/protocol/CommandBuilder.hpp"
#include "gauge/utils/DecimalFormatter.hpp"

#include <gtest/gtest.h>

using namespace gauge;
using gauge::protocol::CommandBuilder;
using gauge::types::Decimal;

TEST(CommandBuilder, FixedCommands) {
  EXPECT_STREQ(CommandBuilder::ZERO, "Z");
  EXPECT_STREQ(CommandBuilder::MEASURE, "D");
  EXPECT_STREQ(CommandBuilder::STORE, "OM");
  EXPECT_STREQ(CommandBuilder::CLEAR_LAST, "OC0");
  EXPECT_STREQ(CommandBuilder::CLEAR_ALL, "OC1");
  EXPECT_STREQ(CommandBuilder::POWER_OFF, "Q");
}

TEST(CommandBuilder, ModeAndUnitUseWireCodes) {
  EXPECT_EQ(CommandBuilder::setMode(types::Mode::Realtime), "T");
  EXPECT_EQ(CommandBuilder::setMode(types::Mode::Peak), "P");
  EXPECT_EQ(CommandBuilder::setUnit(types::Unit::Newton), "N");
  EXPECT_EQ(CommandBuilder::setUnit(types::Unit::Kilograms), "K");
}

TEST(CommandBuilder, FrameAppendsCarriageReturn) {
  EXPECT_EQ(CommandBuilder::frame("OC1"), "OC1\r");
  EXPECT_EQ(CommandBuilder::frame(""), "\r");
}

TEST(CommandBuilder, LimitPointsHighThenLow) {
  EXPECT_EQ(CommandBuilder::setLimitPoints(Decimal("1.5"), Decimal("10"),
                                           protocol::LimitFieldOrder::HighThenLow),
            "E10.001.50");
}

TEST(CommandBuilder, LimitPointsLowThenHigh) {
  EXPECT_EQ(CommandBuilder::setLimitPoints(Decimal("1.5"), Decimal("10"),
                                           protocol::LimitFieldOrder::LowThenHigh),
            "E1.5010.00");
}

TEST(DecimalFormatter, TwoDecimalPlaces) {
  EXPECT_EQ(utils::formatFixed(Decimal("3")), "3.00");
  EXPECT_EQ(utils::formatFixed(Decimal("12.5")), "12.50");
  EXPECT_EQ(utils::formatFixed(Decimal("-7.25")), "-7.25");
  EXPECT_EQ(utils::formatFixed(Decimal("0")), "0.00");
}
