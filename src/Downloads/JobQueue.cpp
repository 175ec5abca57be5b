#include "JobQueue.hpp"

#include <algorithm>

namespace downloads {

const char* jobStatusName(JobStatus status) {
  switch (status) {
    case JobStatus::Uninitialised:
      return "Uninitialised";
    case JobStatus::Queued:
      return "Queued";
    case JobStatus::Downloading:
      return "Downloading";
    case JobStatus::Error:
      return "Error";
    case JobStatus::Completed:
      return "Completed";
  }
  return "Unknown";
}

void JobQueue::append(JobHandlePtr job) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.push_back(std::move(job));
}

void JobQueue::popFront() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!jobs_.empty()) jobs_.pop_front();
}

bool JobQueue::remove(const std::string& id) {
  return edit([&id](std::deque<JobHandlePtr>& jobs) {
    auto it = std::find_if(
        jobs.begin(), jobs.end(),
        [&id](const JobHandlePtr& job) { return job->id == id; });
    if (it == jobs.end()) return false;
    jobs.erase(it);
    return true;
  });
}

JobHandlePtr JobQueue::front() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (jobs_.empty()) return nullptr;
  return jobs_.front();
}

bool JobQueue::isEmpty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.empty();
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

bool JobQueue::contains(const std::string& id) const {
  return read([&id](const std::deque<JobHandlePtr>& jobs) {
    return std::any_of(
        jobs.begin(), jobs.end(),
        [&id](const JobHandlePtr& job) { return job->id == id; });
  });
}

std::vector<std::string> JobQueue::ids() const {
  return read([](const std::deque<JobHandlePtr>& jobs) {
    std::vector<std::string> out;
    out.reserve(jobs.size());
    for (const auto& job : jobs) out.push_back(job->id);
    return out;
  });
}

std::vector<JobSnapshot> JobQueue::snapshot() const {
  return read([](const std::deque<JobHandlePtr>& jobs) {
    std::vector<JobSnapshot> out;
    out.reserve(jobs.size());
    for (const auto& job : jobs) {
      out.push_back(JobSnapshot{job->id, job->status.load()});
    }
    return out;
  });
}

}  // namespace downloads
