#include <algorithm>
#include <exception>

#include <fmt/format.h>

#include <ata/scheduler.hpp>

namespace ata {

Scheduler::Scheduler(unsigned workers, size_t queueDepth)
    : capacity_(std::max<size_t>(workers, 1) + queueDepth) {
  if (workers > 1) {
    workers_.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) {
      workers_.emplace_back([this] { workerLoop(); });
    }
  }
}

Scheduler::~Scheduler() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cancel();
  taskAvailable_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

uint64_t Scheduler::submit(ChunkTask task) {
  std::unique_lock<std::mutex> lock(mutex_);
  slotFree_.wait(lock, [this] { return window_.size() < capacity_ || cancelled_; });

  uint64_t sequence = nextSequence_++;
  window_.emplace_back();

  if (cancelled_) {
    window_.back().ready = true;
    window_.back().result = cancelledResult(sequence);
    resultReady_.notify_all();
    return sequence;
  }

  if (workers_.empty()) {
    // Sequential mode: run now, on this thread
    lock.unlock();
    ChunkResult result = runTask(task, sequence);
    lock.lock();

    Slot &slot = window_[sequence - base_];
    slot.result = std::move(result);
    slot.ready = true;
    return sequence;
  }

  queue_.emplace_back(sequence, std::move(task));
  taskAvailable_.notify_one();
  return sequence;
}

ChunkResult Scheduler::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (window_.empty()) {
    ChunkResult result;
    result.error = {ErrorKind::InvalidArgument, "No pending chunk task"};
    return result;
  }

  resultReady_.wait(lock, [this] { return window_.front().ready; });

  ChunkResult result = std::move(window_.front().result);
  window_.pop_front();
  ++base_;
  slotFree_.notify_one();
  return result;
}

void Scheduler::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;

  for (auto &[sequence, task] : queue_) {
    Slot &slot = window_[sequence - base_];
    slot.result = cancelledResult(sequence);
    slot.ready = true;
  }
  queue_.clear();

  resultReady_.notify_all();
  slotFree_.notify_all();
}

bool Scheduler::full() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return window_.size() >= capacity_;
}

size_t Scheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return window_.size();
}

bool Scheduler::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void Scheduler::workerLoop() {
  for (;;) {
    uint64_t sequence;
    ChunkTask task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      taskAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      sequence = queue_.front().first;
      task = std::move(queue_.front().second);
      queue_.pop_front();
    }

    ChunkResult result = runTask(task, sequence);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot &slot = window_[sequence - base_];
      slot.result = std::move(result);
      slot.ready = true;
    }
    resultReady_.notify_all();
  }
}

ChunkResult Scheduler::runTask(const ChunkTask &task, uint64_t sequence) {
  ChunkResult result;
  try {
    result = task();
  } catch (const std::exception &e) {
    // Keep the failure with its slot, the other tasks carry on
    result = ChunkResult();
    result.ok = false;
    result.error = {ErrorKind::Internal, fmt::format("Chunk task threw: {}", e.what())};
  }
  result.sequence = sequence;
  return result;
}

ChunkResult Scheduler::cancelledResult(uint64_t sequence) {
  ChunkResult result;
  result.sequence = sequence;
  result.error = {ErrorKind::Cancelled, "Chunk task dropped after cancellation"};
  return result;
}

} // namespace ata
