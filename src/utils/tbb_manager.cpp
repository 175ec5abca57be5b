#include "tbb_manager.hpp"

#include <atomic>
#include <sstream>

namespace utils {

namespace {
std::atomic<uint64_t> global_task_id{0};
}  // namespace

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

std::shared_ptr<tbb::task_arena> TBBManager::Init(const std::string& tbb_name) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto& state = task_arenas_[tbb_name];
  if (!state.initialized) {
    int concurrency = 0;
    auto& defines = GetTBBParallelCountDefines();
    auto it = defines.find(tbb_name);
    if (it != defines.end()) {
      concurrency = it->second;
    }
    if (concurrency <= 0) {
      concurrency = tbb::info::default_concurrency();
    }
    state.arena = std::make_shared<tbb::task_arena>(concurrency);
    state.concurrency = concurrency;
    state.initialized = true;
    LOG(INFO) << "[TBBManager] Arena '" << tbb_name
              << "' initialized with concurrency: " << concurrency;
  }
  return state.arena;
}

int TBBManager::Concurrency(const std::string& tbb_name) {
  Init(tbb_name);
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  return task_arenas_[tbb_name].concurrency;
}

void TBBManager::Release() {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  for (auto& kv : task_arenas_) {
    if (kv.second.arena) {
      kv.second.arena->terminate();
      kv.second.arena.reset();
      kv.second.initialized = false;
      LOG(DEBUG) << "[TBBManager] Arena '" << kv.first << "' released.";
    }
  }
  task_arenas_.clear();
}

TBBManager::~TBBManager() { Release(); }

std::map<std::string, int> TBBManager::ParseParallelCountDefines(
    const std::string& cfg) {
  std::map<std::string, int> defines;
  // 格式如 "allocate:4,verify:2"，非法条目忽略
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos || pos == 0) continue;
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception&) {
      LOG(WARN) << "[TBBManager] Ignoring malformed arena setting: " << item;
    }
  }
  return defines;
}

std::map<std::string, int>& TBBManager::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines =
      ParseParallelCountDefines(FLAGS_custom_tbb_parallel_control);
  return defines;
}

uint64_t TBBManager::GenerateUniqueTaskId() const {
  return global_task_id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace utils
