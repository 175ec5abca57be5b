#include "ProgressObject.hpp"

namespace downloads {

double ProgressSnapshot::fraction() const {
  if (total == 0) return 0.0;
  return static_cast<double>(current) / static_cast<double>(total);
}

ProgressObject::ProgressObject(uint64_t total) : current_(0), total_(total) {}

void ProgressObject::add(uint64_t delta) {
  current_.fetch_add(delta, std::memory_order_relaxed);
}

void ProgressObject::set(uint64_t current) {
  current_.store(current, std::memory_order_relaxed);
}

void ProgressObject::setTotal(uint64_t total) {
  total_.store(total, std::memory_order_relaxed);
}

uint64_t ProgressObject::current() const {
  return current_.load(std::memory_order_relaxed);
}

uint64_t ProgressObject::total() const {
  return total_.load(std::memory_order_relaxed);
}

ProgressSnapshot ProgressObject::snapshot() const {
  ProgressSnapshot snap;
  snap.current = current();
  snap.total = total();
  return snap;
}

void ProgressSlot::bind(ProgressHandle progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_ = std::move(progress);
}

void ProgressSlot::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_.reset();
}

bool ProgressSlot::bound() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_ != nullptr;
}

std::optional<ProgressSnapshot> ProgressSlot::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!progress_) return std::nullopt;
  return progress_->snapshot();
}

}  // namespace downloads
