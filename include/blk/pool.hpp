#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blk {

// small bounded MPMC queue
template <class T>
struct Queue {
  std::mutex m;
  std::condition_variable cv_pop, cv_push;
  std::deque<T> q;
  size_t cap;
  bool closed=false;

  explicit Queue(size_t capacity) : cap(capacity ? capacity : 1) {}

  void push(T&& v){
    {
      std::unique_lock<std::mutex> lk(m);
      cv_push.wait(lk,[&]{ return closed || q.size() < cap; });
      if (closed) return;
      q.emplace_back(std::move(v));
    }
    cv_pop.notify_one();
  }
  bool pop(T& out){
    std::unique_lock<std::mutex> lk(m);
    cv_pop.wait(lk,[&]{return closed || !q.empty();});
    if (q.empty()) return false;
    out = std::move(q.front());
    q.pop_front();
    lk.unlock();
    cv_push.notify_one();
    return true;
  }
  void close(){ { std::lock_guard<std::mutex> lk(m); closed=true; } cv_pop.notify_all(); cv_push.notify_all(); }
};

// Long-lived workers fed through a Queue. One run() at a time per pool;
// the owner (a pack or an open container) reuses it for every batch.
class Pool {
public:
  explicit Pool(unsigned threads);
  ~Pool();
  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  unsigned size() const { return nthreads_; }

  // Runs fn(i) for every i in [0, n). After the first non-zero result
  // nothing new is dispatched, work already queued is skipped, and that
  // result is returned with its index.
  int run(size_t n, const std::function<int(size_t)>& fn, size_t& failed_idx);

private:
  struct Batch;
  struct Job {
    Batch* b{nullptr};
    size_t i{0};
  };

  void work();

  unsigned                 nthreads_;
  Queue<Job>               jobs_;
  std::vector<std::thread> workers_;
};

// One-shot convenience over a temporary Pool
int parallel_for(size_t n, unsigned threads,
                 const std::function<int(size_t)>& fn,
                 size_t& failed_idx);

} // namespace blk
