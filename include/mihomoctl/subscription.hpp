#pragma once
#include "channel.hpp"

#include <optional>
#include <thread>

namespace mihomoctl {

// Consumer handle of one stream: the receiving end of its channel plus the
// task feeding it. Closing or destroying it cancels the task and waits for
// it to release its connection.
template <class T> class Subscription {
public:
  Subscription(Receiver<T> rx, std::thread task) : rx_(std::move(rx)), task_(std::move(task)) {}
  Subscription(Subscription &&) noexcept = default;
  Subscription &operator=(Subscription &&o) noexcept {
    if (this != &o) {
      close();
      rx_ = std::move(o.rx_);
      task_ = std::move(o.task_);
    }
    return *this;
  }
  ~Subscription() { close(); }

  // Next item; nullopt when the stream ended. Rethrows the error that ended it.
  std::optional<T> recv() { return rx_.recv(); }

  template <class Rep, class Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> d) { return rx_.recv_for(d); }

  bool is_open() const { return !rx_.finished(); }
  std::size_t dropped() const { return rx_.dropped(); }

  void close() {
    rx_.close();
    if (task_.joinable()) task_.join();
  }

private:
  Receiver<T> rx_;
  std::thread task_;
};

} // namespace mihomoctl
