#include "gauge/types/Error.hpp"
#include "gauge/types/WireCodes.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace gauge::types;

TEST(WireCodes, UnitCodesRoundTrip) {
  for (char code : std::string("NK")) {
    EXPECT_EQ(toWireCode(parseUnit(code)), code);
  }
  EXPECT_EQ(toWireCode(Unit::Newton), 'N');
  EXPECT_EQ(toWireCode(Unit::Kilograms), 'K');
}

TEST(WireCodes, ModeCodesRoundTrip) {
  for (char code : std::string("TP")) {
    EXPECT_EQ(toWireCode(parseMode(code)), code);
  }
  EXPECT_EQ(toWireCode(Mode::Realtime), 'T');
  EXPECT_EQ(toWireCode(Mode::Peak), 'P');
}

TEST(WireCodes, StateCodesRoundTrip) {
  for (char code : std::string("LOHE")) {
    EXPECT_EQ(toWireCode(parseState(code)), code);
  }
  EXPECT_EQ(parseState('L'), State::BelowLimit);
  EXPECT_EQ(parseState('O'), State::Good);
  EXPECT_EQ(parseState('H'), State::AboveLimit);
  EXPECT_EQ(parseState('E'), State::Overload);
}

TEST(WireCodes, UnknownCodesAreRejected) {
  EXPECT_FALSE(unitFromWireCode('X').has_value());
  EXPECT_FALSE(unitFromWireCode('n').has_value());
  EXPECT_FALSE(modeFromWireCode('N').has_value());
  EXPECT_FALSE(stateFromWireCode('R').has_value());

  EXPECT_THROW(parseUnit('T'), UnknownWireCodeException);
  EXPECT_THROW(parseMode('K'), UnknownWireCodeException);
  EXPECT_THROW(parseState('\0'), UnknownWireCodeException);
}

TEST(WireCodes, UnknownCodeErrorCarriesTableAndCode) {
  try {
    parseMode('Z');
    FAIL() << "expected UnknownWireCodeException";
  } catch (const UnknownWireCodeException &e) {
    EXPECT_EQ(e.table(), "mode");
    EXPECT_EQ(e.code(), 'Z');
  }
}

TEST(WireCodes, EveryUppercaseLetterOutsideTablesFails) {
  const std::string units = "NK", modes = "TP", states = "LOHE";
  for (char c = 'A'; c <= 'Z'; ++c) {
    EXPECT_EQ(unitFromWireCode(c).has_value(), units.find(c) != std::string::npos) << c;
    EXPECT_EQ(modeFromWireCode(c).has_value(), modes.find(c) != std::string::npos) << c;
    EXPECT_EQ(stateFromWireCode(c).has_value(), states.find(c) != std::string::npos) << c;
  }
}

TEST(WireCodes, Names) {
  EXPECT_EQ(toString(Unit::Kilograms), "Kilograms");
  EXPECT_EQ(toString(Mode::Peak), "Peak");
  EXPECT_EQ(toString(State::AboveLimit), "AboveLimit");
}
