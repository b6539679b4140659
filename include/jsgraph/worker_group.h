#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace jsgraph {

// Owns a set of worker threads. Threads still running when the group is
// destroyed are joined, so an exception thrown while workers are being
// started cannot leave a joinable std::thread behind.
class WorkerGroup {
public:
  WorkerGroup() = default;
  ~WorkerGroup();
  WorkerGroup(const WorkerGroup &) = delete;
  WorkerGroup &operator=(const WorkerGroup &) = delete;

  void Spawn(std::function<void()> work);
  void JoinAll();

  std::size_t size() const { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

} // namespace jsgraph
