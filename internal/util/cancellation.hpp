#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace streamlift::util {

/*
  Shared cancellation flag threaded from the process down to segment tasks.

  Copies observe the same flag. A default-constructed token is never cancelled
  unless Cancel() is called on it or on one of its copies.
*/
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() {
    flag_->store(true);
  }

  bool IsCancelled() const {
    return flag_->load();
  }

  void ThrowIfCancelled(const std::string& where) const {
    if (IsCancelled()) {
      throw Cancelled("cancelled: " + where);
    }
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace streamlift::util
