#include "../test_utils/MockSerialPort.hpp"
#include "gauge/serial/impl/RealSerialPort.hpp"
#include "gauge/session/DeviceSession.hpp"
#include "gauge/types/Error.hpp"

#include <gtest/gtest.h>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace gauge;
using gauge::protocol::GaugeProtocolHandler;
using gauge::session::DeviceSession;
using gauge::session::withDeviceSession;
using gauge::test::MockSerialPort;
using gauge::test::MockSerialState;

namespace {

std::unique_ptr<MockSerialPort> scriptedPort(const std::shared_ptr<MockSerialState> &state,
                                             std::initializer_list<const char *> lines) {
  auto port = std::make_unique<MockSerialPort>(state);
  for (const char *line : lines) {
    port->queue_line(line);
  }
  return port;
}

} // namespace

TEST(DeviceSession, ReadsBannerBeforeAnythingElse) {
  auto state = std::make_shared<MockSerialState>();
  DeviceSession session(scriptedPort(state, {"Gauge Started."}),
                        serial::SerialConfig::usbProfile());

  ASSERT_FALSE(state->events.empty());
  EXPECT_EQ(state->events.front(), "R");
  EXPECT_TRUE(state->written.empty());
  EXPECT_EQ(session.banner(), "Gauge Started.");
  EXPECT_EQ(session.protocol().state(), protocol::ProtocolState::Ready);
  EXPECT_TRUE(session.isOpen());
}

TEST(DeviceSession, KeepsConfig) {
  auto state = std::make_shared<MockSerialState>();
  DeviceSession session(scriptedPort(state, {"Gauge Started."}),
                        serial::SerialConfig::rs232cProfile());

  EXPECT_EQ(session.config().baudrate, 19200u);
  EXPECT_FALSE(session.config().hardwareFlowControl);
}

TEST(DeviceSession, DestructorClosesTransport) {
  auto state = std::make_shared<MockSerialState>();
  {
    DeviceSession session(scriptedPort(state, {"Gauge Started."}),
                          serial::SerialConfig::usbProfile());
    EXPECT_EQ(state->closeCount, 0);
  }
  EXPECT_EQ(state->closeCount, 1);
  EXPECT_FALSE(state->open);
}

TEST(DeviceSession, CloseIsIdempotent) {
  auto state = std::make_shared<MockSerialState>();
  {
    DeviceSession session(scriptedPort(state, {"Gauge Started."}),
                          serial::SerialConfig::usbProfile());
    session.close();
    session.close();
    EXPECT_FALSE(session.isOpen());
  }
  EXPECT_EQ(state->closeCount, 1);
}

TEST(DeviceSession, ProtocolAfterCloseIsMisuse) {
  auto state = std::make_shared<MockSerialState>();
  DeviceSession session(scriptedPort(state, {"Gauge Started."}),
                        serial::SerialConfig::usbProfile());
  session.close();

  EXPECT_THROW(session.protocol(), types::ProtocolStateException);
}

TEST(DeviceSession, HandlerKeptPastCloseReportsMisuse) {
  auto state = std::make_shared<MockSerialState>();
  DeviceSession session(scriptedPort(state, {"Gauge Started.", "R"}),
                        serial::SerialConfig::usbProfile());
  GaugeProtocolHandler &handler = session.protocol();

  session.close();

  EXPECT_EQ(handler.state(), protocol::ProtocolState::TransportClosed);
  EXPECT_THROW(handler.zero(), types::ProtocolStateException);
  EXPECT_THROW(handler.measure(), types::ProtocolStateException);
  EXPECT_TRUE(state->written.empty());
}

TEST(DeviceSession, CloseNeverThrows) {
  EXPECT_TRUE(noexcept(std::declval<DeviceSession &>().close()));
  EXPECT_TRUE(noexcept(std::declval<serial::RealSerialPort &>().close()));
  EXPECT_TRUE(noexcept(std::declval<GaugeProtocolHandler &>().markTransportClosed()));
}

TEST(DeviceSession, BannerFailureClosesAndPropagates) {
  auto state = std::make_shared<MockSerialState>();
  state->disconnectOnRead = true;

  EXPECT_THROW(DeviceSession(std::make_unique<MockSerialPort>(state),
                             serial::SerialConfig::usbProfile()),
               types::TransportException);
  EXPECT_EQ(state->closeCount, 1);
}

TEST(DeviceSession, NullTransportIsRejected) {
  EXPECT_THROW(DeviceSession(std::unique_ptr<serial::SerialPort>(), serial::SerialConfig::usbProfile()),
               std::invalid_argument);
}

TEST(DeviceSession, ClosedTransportIsRejected) {
  auto state = std::make_shared<MockSerialState>();
  state->open = false;

  EXPECT_THROW(DeviceSession(std::make_unique<MockSerialPort>(state),
                             serial::SerialConfig::usbProfile()),
               types::TransportException);
  EXPECT_TRUE(state->events.empty());
}

TEST(DeviceSession, MissingDevicePathFailsToOpen) {
  EXPECT_THROW(DeviceSession("/dev/does-not-exist-gauge0", serial::SerialConfig::rs232cProfile()),
               types::TransportException);
}

TEST(WithDeviceSession, ReturnsCallableResultAndCloses) {
  auto state = std::make_shared<MockSerialState>();
  auto port = scriptedPort(state, {"Gauge Started.", "R", "+001.23NTO"});

  auto value = withDeviceSession(std::move(port), serial::SerialConfig::usbProfile(),
                                 [](GaugeProtocolHandler &handler) {
                                   handler.zero();
                                   return handler.measure().value();
                                 });

  EXPECT_EQ(value, types::Decimal("1.23"));
  EXPECT_EQ(state->written, (std::vector<std::string>{"Z\r", "D\r"}));
  EXPECT_EQ(state->closeCount, 1);
  EXPECT_EQ(state->events.back(), "C");
}

TEST(WithDeviceSession, ClosesWhenCallableThrows) {
  auto state = std::make_shared<MockSerialState>();
  auto port = scriptedPort(state, {"Gauge Started.", "E"});

  EXPECT_THROW(withDeviceSession(std::move(port), serial::SerialConfig::usbProfile(),
                                 [](GaugeProtocolHandler &handler) { handler.store(); }),
               types::CommandRejectedException);
  EXPECT_EQ(state->closeCount, 1);
}

TEST(WithDeviceSession, PowerOffThenExitStillClosesOnce) {
  auto state = std::make_shared<MockSerialState>();
  auto port = scriptedPort(state, {"Gauge Started."});

  withDeviceSession(std::move(port), serial::SerialConfig::usbProfile(),
                    [](GaugeProtocolHandler &handler) { handler.powerOff(); });

  EXPECT_EQ(state->written, (std::vector<std::string>{"Q\r"}));
  EXPECT_EQ(state->closeCount, 1);
}
