#include "core/ThreadPool.hpp"

namespace gov::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = static_cast<int>(std::thread::hardware_concurrency());
    if (iSize <= 0) iSize = 1;
  }
  _vWorkers.reserve(static_cast<size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait(ulock, [this]() { return _bStopping || !_qTasks.empty(); });
      // Drain remaining tasks before exiting so no future is left unfulfilled
      if (_qTasks.empty()) {
        return;
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thread : _vWorkers) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace gov::core
