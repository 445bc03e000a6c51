#include "gauge/serial/SerialConfig.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using gauge::serial::SerialConfig;

TEST(SerialConfig, UsbProfile) {
  auto usb = SerialConfig::usbProfile();
  EXPECT_EQ(usb.baudrate, 256000u);
  EXPECT_TRUE(usb.hardwareFlowControl);
  EXPECT_EQ(usb.readTimeout, std::chrono::milliseconds(100));
}

TEST(SerialConfig, Rs232cProfile) {
  auto rs232c = SerialConfig::rs232cProfile();
  EXPECT_EQ(rs232c.baudrate, 19200u);
  EXPECT_FALSE(rs232c.hardwareFlowControl);
  EXPECT_EQ(rs232c.readTimeout, std::chrono::milliseconds(100));
}

TEST(SerialConfig, FromProfileName) {
  EXPECT_EQ(SerialConfig::fromProfileName("USB").baudrate, 256000u);
  EXPECT_EQ(SerialConfig::fromProfileName("rs232c").baudrate, 19200u);
  EXPECT_EQ(SerialConfig::fromProfileName("Serial").baudrate, 19200u);
  EXPECT_THROW(SerialConfig::fromProfileName("bluetooth"), std::invalid_argument);
}

TEST(SerialConfig, Describe) {
  EXPECT_EQ(SerialConfig::rs232cProfile().describe(),
            "rs232c (19200 baud, flow control off, timeout 100ms)");
}
