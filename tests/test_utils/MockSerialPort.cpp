#include "MockSerialPort.hpp"
#include "gauge/types/Error.hpp"

#include <utility>

namespace gauge {
namespace test {

MockSerialPort::MockSerialPort(std::shared_ptr<MockSerialState> state)
    : state_(std::move(state)) {}

void MockSerialPort::queue_line(const std::string &line) {
  state_->responses.push_back(line + "\r");
}

void MockSerialPort::queue_raw(const std::string &bytes) {
  state_->responses.push_back(bytes);
}

void MockSerialPort::send(const std::string &data) {
  if (!state_->open) {
    throw types::TransportException("mock port closed");
  }
  state_->events.push_back("W:" + data);
  if (state_->failWrites) {
    throw types::TransportException("mock write failure");
  }
  state_->written.push_back(data);
}

std::string MockSerialPort::receiveLine() {
  if (!state_->open) {
    throw types::TransportException("mock port closed");
  }
  state_->events.push_back("R");
  state_->readCount++;

  if (state_->disconnectOnRead) {
    throw types::TransportException("mock link lost");
  }
  if (state_->responses.empty()) {
    return "";
  }

  std::string line = state_->responses.front();
  state_->responses.pop_front();
  return line;
}

bool MockSerialPort::isOpen() const { return state_->open; }

void MockSerialPort::close() noexcept {
  state_->events.push_back("C");
  state_->closeCount++;
  state_->open = false;
}

} // namespace test
} // namespace gauge
