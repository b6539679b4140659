#include <jsgraph/worker_group.h>

#include <utility>

namespace jsgraph {

WorkerGroup::~WorkerGroup() { JoinAll(); }

void WorkerGroup::Spawn(std::function<void()> work) {
  threads_.reserve(threads_.size() + 1);
  threads_.emplace_back(std::move(work));
}

void WorkerGroup::JoinAll() {
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

} // namespace jsgraph
