#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace mihomoctl {

// What a full channel does with a new item.
enum class Overflow {
  Block,      // sender waits for room
  DropOldest, // oldest queued item is discarded
};

namespace detail {

template <class T> struct ChannelState {
  std::mutex m;
  std::condition_variable cv;
  std::deque<T> q;
  std::size_t cap = 1;
  Overflow policy = Overflow::Block;
  bool closed = false;          // no more items will be sent
  bool receiver_gone = false;   // consumer dropped its end
  std::exception_ptr error;     // delivered after the queue drains
  std::size_t dropped = 0;
};

} // namespace detail

template <class T> class Receiver;

// Producer end. Owned by the task that feeds the channel.
template <class T> class Sender {
public:
  Sender() = default;
  explicit Sender(std::shared_ptr<detail::ChannelState<T>> st) : st_(std::move(st)) {}

  // false once the receiver is gone; the item is then discarded.
  bool send(T item) {
    std::unique_lock<std::mutex> lk(st_->m);
    if (st_->receiver_gone || st_->closed) return false;
    if (st_->q.size() >= st_->cap) {
      if (st_->policy == Overflow::DropOldest) {
        st_->q.pop_front();
        ++st_->dropped;
      } else {
        st_->cv.wait(lk, [&] { return st_->receiver_gone || st_->q.size() < st_->cap; });
        if (st_->receiver_gone) return false;
      }
    }
    st_->q.push_back(std::move(item));
    st_->cv.notify_all();
    return true;
  }

  // Ends the stream; the receiver sees `error` (if any) after the last item.
  void close(std::exception_ptr error = nullptr) {
    std::lock_guard<std::mutex> lk(st_->m);
    if (st_->closed) return;
    st_->closed = true;
    st_->error = error;
    st_->cv.notify_all();
  }

  bool receiver_closed() const {
    std::lock_guard<std::mutex> lk(st_->m);
    return st_->receiver_gone;
  }

  // Sleeps up to `d`; returns true early if the receiver goes away.
  template <class Rep, class Period>
  bool wait_receiver_closed(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(st_->m);
    return st_->cv.wait_for(lk, d, [&] { return st_->receiver_gone; });
  }

private:
  std::shared_ptr<detail::ChannelState<T>> st_;
};

// Consumer end. Dropping it tells the producer to stop.
template <class T> class Receiver {
public:
  Receiver() = default;
  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> st) : st_(std::move(st)) {}
  Receiver(Receiver &&) noexcept = default;
  Receiver &operator=(Receiver &&o) noexcept {
    if (this != &o) {
      close();
      st_ = std::move(o.st_);
    }
    return *this;
  }
  Receiver(const Receiver &) = delete;
  Receiver &operator=(const Receiver &) = delete;
  ~Receiver() { close(); }

  // Blocks for the next item. nullopt once the stream ended cleanly; the
  // producer's error is rethrown instead when it closed with one.
  std::optional<T> recv() {
    std::unique_lock<std::mutex> lk(st_->m);
    st_->cv.wait(lk, [&] { return !st_->q.empty() || st_->closed || st_->receiver_gone; });
    return take(lk);
  }

  // As recv(), but gives up after `d` and returns nullopt.
  template <class Rep, class Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lk(st_->m);
    st_->cv.wait_for(lk, d, [&] { return !st_->q.empty() || st_->closed || st_->receiver_gone; });
    return take(lk);
  }

  // Stream ended and drained.
  bool finished() const {
    if (!st_) return true;
    std::lock_guard<std::mutex> lk(st_->m);
    return st_->q.empty() && (st_->closed || st_->receiver_gone);
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lk(st_->m);
    return st_->dropped;
  }

  void close() {
    if (!st_) return;
    std::lock_guard<std::mutex> lk(st_->m);
    st_->receiver_gone = true;
    st_->q.clear();
    st_->cv.notify_all();
  }

private:
  std::optional<T> take(std::unique_lock<std::mutex> &) {
    if (!st_->q.empty()) {
      T v = std::move(st_->q.front());
      st_->q.pop_front();
      st_->cv.notify_all();
      return v;
    }
    if (st_->closed && st_->error) std::rethrow_exception(st_->error);
    return std::nullopt;
  }

  std::shared_ptr<detail::ChannelState<T>> st_;
};

template <class T>
std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity, Overflow policy) {
  auto st = std::make_shared<detail::ChannelState<T>>();
  st->cap = capacity == 0 ? 1 : capacity;
  st->policy = policy;
  return {Sender<T>(st), Receiver<T>(st)};
}

} // namespace mihomoctl
