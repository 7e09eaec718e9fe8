#include <atomic>

#include "blk/pool.hpp"

namespace blk {

struct Pool::Batch {
  const std::function<int(size_t)>* fn{nullptr};
  std::atomic<bool>       any_error{false};
  std::mutex              m;
  std::condition_variable cv;
  size_t                  pending{0};
  int                     first_rc{0};
  size_t                  first_idx{0};
};

Pool::Pool(unsigned threads)
  : nthreads_(threads ? threads : 1), jobs_(size_t(nthreads_) * 2) {
  if (nthreads_ == 1) return;   // run() goes inline
  workers_.reserve(nthreads_);
  for (unsigned w = 0; w < nthreads_; w++) workers_.emplace_back([this]{ work(); });
}

Pool::~Pool(){
  jobs_.close();
  for (auto& t : workers_) t.join();
}

void Pool::work(){
  Job j;
  while (jobs_.pop(j)) {
    Batch& b = *j.b;
    if (!b.any_error.load(std::memory_order_relaxed)) {   // otherwise drain
      int rc = (*b.fn)(j.i);
      if (rc != 0) {
        std::lock_guard<std::mutex> lk(b.m);
        if (b.first_rc == 0) { b.first_rc = rc; b.first_idx = j.i; }
        b.any_error.store(true);
      }
    }
    // b may be gone once pending hits zero and the lock is released
    std::lock_guard<std::mutex> lk(b.m);
    if (--b.pending == 0) b.cv.notify_all();
  }
}

int Pool::run(size_t n, const std::function<int(size_t)>& fn, size_t& failed_idx){
  if (n == 0) return 0;

  if (workers_.empty() || n == 1) {
    for (size_t i = 0; i < n; i++) {
      int rc = fn(i);
      if (rc != 0) { failed_idx = i; return rc; }
    }
    return 0;
  }

  Batch b;
  b.fn = &fn;

  // dispatcher
  for (size_t i = 0; i < n && !b.any_error.load(); i++) {
    { std::lock_guard<std::mutex> lk(b.m); ++b.pending; }
    jobs_.push(Job{&b, i});
  }

  std::unique_lock<std::mutex> lk(b.m);
  b.cv.wait(lk, [&]{ return b.pending == 0; });
  if (b.first_rc != 0) failed_idx = b.first_idx;
  return b.first_rc;
}

int parallel_for(size_t n, unsigned threads,
                 const std::function<int(size_t)>& fn,
                 size_t& failed_idx){
  if (n == 0) return 0;
  size_t nw = threads ? threads : 1;
  if (nw > n) nw = n;
  Pool pool(static_cast<unsigned>(nw));
  return pool.run(n, fn, failed_idx);
}

} // namespace blk
