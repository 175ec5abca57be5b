#include <catch2/catch.hpp>

#include "JobQueue.hpp"

using downloads::JobHandle;
using downloads::JobQueue;
using downloads::JobStatus;

namespace {

downloads::JobHandlePtr job(const std::string& id) {
  return std::make_shared<JobHandle>(id, JobStatus::Queued);
}

}  // namespace

TEST_CASE("job queue keeps insertion order") {
  JobQueue queue;
  REQUIRE(queue.isEmpty());
  REQUIRE(queue.front() == nullptr);

  queue.append(job("a"));
  queue.append(job("b"));
  queue.append(job("c"));

  REQUIRE(queue.size() == 3);
  REQUIRE(queue.front()->id == "a");
  REQUIRE(queue.ids() == std::vector<std::string>{"a", "b", "c"});

  queue.popFront();
  REQUIRE(queue.front()->id == "b");
}

TEST_CASE("job queue removes by id from any position") {
  JobQueue queue;
  queue.append(job("a"));
  queue.append(job("b"));
  queue.append(job("c"));

  REQUIRE(queue.remove("b"));
  REQUIRE(queue.ids() == std::vector<std::string>{"a", "c"});
  REQUIRE_FALSE(queue.remove("b"));
  REQUIRE_FALSE(queue.contains("b"));
  REQUIRE(queue.contains("c"));
}

TEST_CASE("popping an empty job queue does nothing") {
  JobQueue queue;
  queue.popFront();
  REQUIRE(queue.isEmpty());
}

TEST_CASE("job queue snapshot reflects handle status") {
  JobQueue queue;
  auto a = job("a");
  queue.append(a);
  a->status = JobStatus::Downloading;

  auto snap = queue.snapshot();
  REQUIRE(snap.size() == 1);
  REQUIRE(snap[0].id == "a");
  REQUIRE(snap[0].status == JobStatus::Downloading);
  REQUIRE(std::string(downloads::jobStatusName(snap[0].status)) ==
          "Downloading");
}

TEST_CASE("job queue read and edit run under the lock") {
  JobQueue queue;
  queue.append(job("a"));
  queue.append(job("b"));

  queue.edit([](std::deque<downloads::JobHandlePtr>& jobs) {
    std::swap(jobs.front(), jobs.back());
  });
  size_t n = queue.read(
      [](const std::deque<downloads::JobHandlePtr>& jobs) { return jobs.size(); });

  REQUIRE(n == 2);
  REQUIRE(queue.front()->id == "b");
}
