#include "utils/worker_pool.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

WorkerPool::WorkerPool(std::size_t threads)
  : threads_(checked_thread_count(threads))
  , pool_(threads_) {
  BOOST_LOG_TRIVIAL(debug) << "Worker pool: Started " << threads_ << " worker threads";
}

WorkerPool::~WorkerPool() {
  pool_.join();
  BOOST_LOG_TRIVIAL(trace) << "Worker pool: Joined " << threads_ << " worker threads";
}

std::size_t WorkerPool::checked_thread_count(std::size_t threads) {
  if (threads == 0) {
    BOOST_LOG_TRIVIAL(error) << "Worker pool: Thread count must be positive";
    throw std::invalid_argument("Worker pool: Thread count must be positive");
  }
  return threads;
}

} // namespace utils
} // namespace dsb
