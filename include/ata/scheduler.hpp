#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// Output of one chunk task. `data` holds the stored bytes when sealing and the
// plaintext when opening.
struct ChunkResult {
  uint64_t sequence = 0; // Submission index within the scheduler
  bool ok = false;
  Error error;
  std::vector<uint8_t> data;
  Tag tag{};
  uint64_t plainLength = 0;
  uint64_t compressedLength = 0;
};

using ChunkTask = std::function<ChunkResult()>;

// Runs chunk tasks on a bounded worker pool and hands the results back in
// submission order, whatever order the workers finish in.
//
// At most capacity() tasks are unconsumed at any time: submit() blocks until
// next() frees a slot. A thread that both submits and consumes must drain a
// result first when full() is true.
class Scheduler {
public:
  // workers <= 1 runs every task inline on the submitting thread
  Scheduler(unsigned workers, size_t queueDepth);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  // Queue a task and return its sequence index. A task queued after cancel()
  // is never run and reports ErrorKind::Cancelled.
  uint64_t submit(ChunkTask task);

  // Wait for the oldest unconsumed task and return its result. Returns an
  // InvalidArgument failure when nothing is pending.
  ChunkResult next();

  // Drop queued tasks (they report ErrorKind::Cancelled), let running ones finish
  void cancel();

  bool full() const;
  size_t pending() const;
  bool cancelled() const;

  size_t capacity() const { return capacity_; }
  unsigned workerCount() const { return static_cast<unsigned>(workers_.size()); }

private:
  struct Slot {
    bool ready = false;
    ChunkResult result;
  };

  void workerLoop();
  static ChunkResult runTask(const ChunkTask &task, uint64_t sequence);
  static ChunkResult cancelledResult(uint64_t sequence);

  size_t capacity_;
  std::vector<std::thread> workers_;

  mutable std::mutex mutex_;
  std::condition_variable taskAvailable_;
  std::condition_variable resultReady_;
  std::condition_variable slotFree_;

  std::deque<Slot> window_; // Unconsumed tasks, front is sequence base_
  std::deque<std::pair<uint64_t, ChunkTask>> queue_;
  uint64_t base_ = 0;
  uint64_t nextSequence_ = 0;
  bool cancelled_ = false;
  bool stopping_ = false;
};

} // namespace ata
