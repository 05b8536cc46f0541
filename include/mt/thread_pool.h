#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

// Runs `func` once for every queued value on up to `n_threads` workers.
// The destructor blocks until the queue is drained.
template <typename T>
  requires std::is_move_constructible_v<T>
class thread_pool {
  using Func = std::function<void(T&&)>;
  const Func func;

  std::vector<T> vals;
  std::mutex mtx;

  const size_t n_threads;
  std::latch latch;
  std::vector<std::jthread> threads;

  std::optional<T> pop() {
    std::lock_guard lk{mtx};
    if (vals.empty())
      return std::nullopt;
    auto t = std::move(vals.back());
    vals.pop_back();
    return t;
  }

  void worker_loop() {
    while (auto t = pop())
      func(std::move(*t));
    latch.count_down();
  }

 public:
  thread_pool(size_t n_threads, Func func, std::vector<T> vec)
      : func{std::move(func)},
        vals{std::move(vec)},
        n_threads{std::clamp<size_t>(vals.size(), 1,
                                     std::max<size_t>(n_threads, 1))},
        latch{static_cast<ptrdiff_t>(this->n_threads)}  //
  {
    // values are popped from the back
    std::reverse(vals.begin(), vals.end());

    threads.reserve(this->n_threads);
    for (size_t i = 0; i < this->n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this);
  }

  ~thread_pool() { wait(); }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  void wait() { latch.wait(); }
};
