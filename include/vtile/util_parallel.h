#pragma once

#include <atomic>
#include <chrono>
#include <utility>
#include <vector>

#include "blockingconcurrentqueue.h"

namespace vtile {

template <typename T>
struct queue_wrapper {
  queue_wrapper() : pending_{0} {}

  void enqueue(T&& t) {
    ++pending_;
    queue_.enqueue(std::forward<T>(t));
  }

  bool dequeue(T& t) {
    return queue_.wait_dequeue_timed(t, std::chrono::milliseconds(10));
  }

  void finish() { --pending_; }
  bool finished() const { return pending_ == 0; }

  std::atomic_uint64_t pending_;
  moodycamel::BlockingConcurrentQueue<T> queue_;
};

}  // namespace vtile
