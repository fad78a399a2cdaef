#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace dsb {
namespace utils {

// Fixed-size pool for independent per-chunk work (store and fetch fan-out).
// Results and exceptions are delivered through std::future.
class WorkerPool {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws std::invalid_argument for a zero thread count
  explicit WorkerPool(std::size_t threads);
  // Waits for all submitted work to finish
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;


  // ---- TASK SUBMISSION ----
  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> submit(Fn fn) {
    using Result = std::invoke_result_t<Fn>;
    // packaged_task is move-only; share it so the posted handler stays copyable
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
  }

  // Fire-and-forget; fn reports its own outcome and must not throw
  template <typename Fn>
  void post(Fn fn) {
    boost::asio::post(pool_, std::move(fn));
  }


  // ---- GETTERS ----
  std::size_t size() const { return threads_; }

private:
  // ---- PARAMETERS ----
  std::size_t threads_;
  boost::asio::thread_pool pool_;

  static std::size_t checked_thread_count(std::size_t threads);
};

} // namespace utils
} // namespace dsb
