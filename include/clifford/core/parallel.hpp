#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace clifford::core {

/// \brief How batch operations are executed.
enum class ComputeBackend {
  Cpu,
  CpuParallel
};

/**
 * \brief Parse compute backend from `CLIFFORD_BACKEND`.
 *
 * `cpu` (any case) selects sequential execution; anything else, or unset, is
 * parallel.
 */
inline ComputeBackend compute_backend_from_env() {
  const char *raw = std::getenv("CLIFFORD_BACKEND");
  if (raw == nullptr) {
    return ComputeBackend::CpuParallel;
  }

  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "cpu" ? ComputeBackend::Cpu : ComputeBackend::CpuParallel;
}

/// \brief `std::thread::hardware_concurrency`, or `1` when unknown.
inline int hardware_thread_count() {
  return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

/// \brief Positive `CLIFFORD_NUM_THREADS`, else the hardware thread count.
inline int compute_thread_count() {
  if (const char *raw = std::getenv("CLIFFORD_NUM_THREADS")) {
    if (const int requested = std::atoi(raw); requested > 0) {
      return requested;
    }
  }
  return hardware_thread_count();
}

/**
 * \brief Fixed set of threads that run index loops together with the caller.
 *
 * Each call to `run` publishes one batch; participating threads claim chunks
 * of indices from the batch cursor until it passes the end. The first
 * exception thrown by a loop body is rethrown on the caller once every
 * participant has checked out; the remaining chunks are skipped.
 */
class ParallelWorkerPool {
public:
  /// \param max_workers Total participants including the caller thread.
  explicit ParallelWorkerPool(int max_workers) {
    const int background = std::max(0, max_workers - 1);
    threads_.reserve(static_cast<size_t>(background));
    for (int slot = 0; slot < background; ++slot) {
      threads_.emplace_back([this, slot]() { serve(slot); });
    }
  }

  ~ParallelWorkerPool() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_ = true;
      ++epoch_;
    }
    wake_.notify_all();
    for (auto &t : threads_) {
      t.join();
    }
  }

  ParallelWorkerPool(const ParallelWorkerPool &) = delete;
  ParallelWorkerPool &operator=(const ParallelWorkerPool &) = delete;

  /// \brief Participants available, the caller included.
  [[nodiscard]] int capacity() const { return static_cast<int>(threads_.size()) + 1; }

  /**
   * \brief Call `fn(i)` for every `i` in `[begin, end)`.
   *
   * A call made from inside a loop body runs on the calling thread alone,
   * since the pool is busy with the outer batch.
   * \param requested_workers Upper bound on participants, caller included.
   */
  template <typename Fn>
  void run(int begin, int end, int requested_workers, Fn &&fn) {
    const int total = end - begin;
    if (total <= 0) {
      return;
    }

    const int participants = std::clamp(std::min(requested_workers, total), 1, capacity());
    if (participants == 1 || in_batch()) {
      for (int i = begin; i < end; ++i) {
        fn(i);
      }
      return;
    }

    // Concurrent callers take turns; a batch owns the pool until it drains.
    std::lock_guard<std::mutex> turn(turn_mutex_);
    Batch batch;
    batch.end = end;
    batch.grain = std::max(1, total / (participants * 8));
    batch.cursor.store(begin, std::memory_order_relaxed);
    batch.checked_in.store(participants, std::memory_order_relaxed);
    batch.helpers = participants - 1;
    batch.body = [&fn](int i) { fn(i); };

    {
      std::lock_guard<std::mutex> lock(mutex_);
      current_ = &batch;
      ++epoch_;
    }
    wake_.notify_all();

    in_batch() = true;
    work_on(batch);
    in_batch() = false;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      done_.wait(lock, [&batch]() {
        return batch.checked_in.load(std::memory_order_acquire) == 0;
      });
      current_ = nullptr;
    }

    if (batch.error) {
      std::rethrow_exception(batch.error);
    }
  }

private:
  struct Batch {
    int end = 0;
    int grain = 1;
    int helpers = 0;
    std::atomic<int> cursor{0};
    std::atomic<int> checked_in{0};
    std::function<void(int)> body;

    std::mutex error_mutex;
    std::exception_ptr error;
  };

  // Set on pool threads, and on a caller while it works on its own batch.
  static bool &in_batch() {
    static thread_local bool flag = false;
    return flag;
  }

  void serve(int slot) {
    in_batch() = true;
    std::uint64_t seen = 0;
    while (true) {
      Batch *batch = nullptr;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait(lock, [&]() { return shutdown_ || epoch_ != seen; });
        if (shutdown_) {
          return;
        }
        seen = epoch_;
        if (current_ == nullptr || slot >= current_->helpers) {
          continue;
        }
        batch = current_;
      }
      work_on(*batch);
    }
  }

  // Claims chunks until the batch is exhausted or failed, then checks out.
  void work_on(Batch &batch) {
    while (true) {
      const int first = batch.cursor.fetch_add(batch.grain, std::memory_order_relaxed);
      if (first >= batch.end) {
        break;
      }
      const int last = std::min(batch.end, first + batch.grain);
      try {
        for (int i = first; i < last; ++i) {
          batch.body(i);
        }
      } catch (...) {
        {
          std::lock_guard<std::mutex> lock(batch.error_mutex);
          if (!batch.error) {
            batch.error = std::current_exception();
          }
        }
        batch.cursor.store(batch.end, std::memory_order_relaxed);
        break;
      }
    }

    if (batch.checked_in.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard<std::mutex> lock(mutex_);
      done_.notify_one();
    }
  }

  std::vector<std::thread> threads_;

  std::mutex turn_mutex_;
  std::mutex mutex_;
  std::condition_variable wake_;
  std::condition_variable done_;

  bool shutdown_ = false;
  std::uint64_t epoch_ = 0;
  Batch *current_ = nullptr;
};

/// \brief Process-wide pool used by `parallel_for_index`.
inline ParallelWorkerPool &parallel_worker_pool() {
  static ParallelWorkerPool pool(hardware_thread_count());
  return pool;
}

/**
 * \brief Integer index loop, spread over the pool unless the backend is `cpu`.
 * \param min_parallel_range Shorter ranges run on the caller thread.
 * \throws The first exception thrown by `fn`.
 */
template <typename Fn>
void parallel_for_index(int begin, int end, Fn &&fn, int min_parallel_range = 32) {
  if (end <= begin) {
    return;
  }

  const bool sequential = compute_backend_from_env() == ComputeBackend::Cpu ||
                          end - begin < min_parallel_range;
  const int workers = sequential ? 1 : compute_thread_count();
  if (workers <= 1) {
    for (int i = begin; i < end; ++i) {
      fn(i);
    }
    return;
  }

  parallel_worker_pool().run(begin, end, workers, std::forward<Fn>(fn));
}

} // namespace clifford::core
