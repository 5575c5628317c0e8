#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace streamlift::util {

/*
  Launch N tasks, join all, inspect results.

  Wait() blocks until every launched task has settled, success or failure,
  and only then rethrows the first failure in launch order. No task of a
  later group can start before Wait() returns.
*/
class TaskGroup {
 public:
  TaskGroup() = default;
  ~TaskGroup() {
    for (auto& future : futures_) {
      if (future.valid()) future.wait();
    }
  }

  TaskGroup(const TaskGroup&)            = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  void Launch(std::function<void()> task) {
    futures_.push_back(std::async(std::launch::async, std::move(task)));
  }

  void Wait() {
    std::exception_ptr first_error;
    for (auto& future : futures_) {
      try {
        future.get();
      } catch (...) {
        if (!first_error) first_error = std::current_exception();
      }
    }
    futures_.clear();
    if (first_error) std::rethrow_exception(first_error);
  }

  size_t Size() const {
    return futures_.size();
  }

 private:
  std::vector<std::future<void>> futures_;
};

} // namespace streamlift::util
