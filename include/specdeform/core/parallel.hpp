#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <specdeform/core/config.hpp>

namespace specdeform::core {

/**
 * \brief Thread pool for index loops `[begin, end)`.
 *
 * The submitting thread works alongside the pool threads; indices are handed
 * out in chunks from a shared counter. An exception thrown by the loop body
 * on any participant stops further chunks from being claimed and is rethrown
 * to the submitter once every participant has left the loop. Loops submitted
 * from several threads run one after another.
 */
class ParallelWorkerPool {
public:
  /// \param participants Loop participants including the submitting thread.
  explicit ParallelWorkerPool(int participants) {
    const int n_threads = std::max(0, participants - 1);
    threads_.reserve(static_cast<size_t>(n_threads));
    for (int slot = 0; slot < n_threads; ++slot) {
      threads_.emplace_back([this, slot]() { worker_main(slot); });
    }
  }

  ~ParallelWorkerPool() {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      shutting_down_ = true;
    }
    wake_.notify_all();
    for (auto &thread : threads_) {
      thread.join();
    }
  }

  ParallelWorkerPool(const ParallelWorkerPool &) = delete;
  ParallelWorkerPool &operator=(const ParallelWorkerPool &) = delete;

  [[nodiscard]] int capacity() const { return static_cast<int>(threads_.size()) + 1; }

  /**
   * \brief Call `fn(i)` for every `i` in `[begin, end)` on up to
   * `requested` participants.
   * \throws Whatever `fn` throws first; the remaining indices may be skipped.
   */
  template <typename Fn> void run(int begin, int end, int requested, Fn &&fn) {
    if (end <= begin) {
      return;
    }

    const int total = end - begin;
    const int participants = std::max(1, std::min({requested, total, capacity()}));
    if (participants == 1) {
      for (int i = begin; i < end; ++i) {
        fn(i);
      }
      return;
    }

    std::lock_guard<std::mutex> submit_lock(submit_mutex_);

    const std::function<void(int)> body = [&fn](int i) { fn(i); };
    Loop loop;
    loop.end = end;
    loop.grain = std::max(1, total / (participants * 8));
    loop.next.store(begin, std::memory_order_relaxed);
    loop.pending.store(participants, std::memory_order_relaxed);
    loop.body = &body;

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current_ = &loop;
      enlisted_ = participants - 1;
      ++epoch_;
    }
    wake_.notify_all();

    drain(loop);

    {
      std::unique_lock<std::mutex> lock(state_mutex_);
      finished_.wait(lock, [&loop]() {
        return loop.pending.load(std::memory_order_acquire) == 0;
      });
      current_ = nullptr;
    }

    if (loop.error) {
      std::rethrow_exception(loop.error);
    }
  }

private:
  // State of one submitted loop; lives on the submitter's stack until every
  // participant has decremented `pending`.
  struct Loop {
    int end = 0;
    int grain = 1;
    std::atomic<int> next{0};
    std::atomic<int> pending{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr error;
    const std::function<void(int)> *body = nullptr;
  };

  void drain(Loop &loop) {
    while (!loop.failed.load(std::memory_order_relaxed)) {
      const int first = loop.next.fetch_add(loop.grain, std::memory_order_relaxed);
      if (first >= loop.end) {
        break;
      }
      const int last = std::min(loop.end, first + loop.grain);
      try {
        for (int i = first; i < last; ++i) {
          (*loop.body)(i);
        }
      } catch (...) {
        record_failure(loop, std::current_exception());
      }
    }

    // `loop` may be destroyed by the submitter right after this decrement.
    if (loop.pending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      finished_.notify_all();
    }
  }

  static void record_failure(Loop &loop, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(loop.error_mutex);
    if (!loop.error) {
      loop.error = std::move(error);
    }
    loop.failed.store(true, std::memory_order_relaxed);
  }

  void worker_main(int slot) {
    std::uint64_t seen_epoch = 0;
    while (true) {
      Loop *loop = nullptr;
      {
        std::unique_lock<std::mutex> lock(state_mutex_);
        wake_.wait(lock, [&]() { return shutting_down_ || epoch_ != seen_epoch; });
        if (shutting_down_) {
          return;
        }
        seen_epoch = epoch_;
        if (slot >= enlisted_) {
          continue;
        }
        loop = current_;
      }
      drain(*loop);
    }
  }

  std::vector<std::thread> threads_;

  std::mutex submit_mutex_;
  std::mutex state_mutex_;
  std::condition_variable wake_;
  std::condition_variable finished_;

  // Guarded by state_mutex_.
  Loop *current_ = nullptr;
  std::uint64_t epoch_ = 0;
  int enlisted_ = 0;
  bool shutting_down_ = false;
};

/// \return Process-wide pool sized to the hardware thread count.
inline ParallelWorkerPool &parallel_worker_pool() {
  static ParallelWorkerPool pool(hardware_thread_count());
  return pool;
}

/**
 * \brief Run `fn(i)` for `i` in `[begin, end)`, in parallel when `config`
 * allows it and the range has at least `min_parallel_range` indices.
 *
 * Each index must write disjoint output. An exception from `fn` reaches the
 * caller in both the serial and the parallel case.
 */
template <typename Fn>
void parallel_for_index(int begin, int end, Fn &&fn, const RuntimeConfig &config,
                        int min_parallel_range = 32) {
  if (end <= begin) {
    return;
  }

  const int workers = config.resolved_thread_count();
  if (workers <= 1 || end - begin < min_parallel_range) {
    for (int i = begin; i < end; ++i) {
      fn(i);
    }
    return;
  }

  parallel_worker_pool().run(begin, end, workers, std::forward<Fn>(fn));
}

} // namespace specdeform::core
