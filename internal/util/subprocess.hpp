#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/util/cancellation.hpp"

namespace streamlift::util {

struct ProcessResult {
  int         exit_code = -1;
  std::string stdout_data;
  // Last few KB of stderr, kept for error messages.
  std::string stderr_tail;
};

using LineCallback = std::function<void(const std::string& line)>;

/*
  Runs argv[0] with PATH lookup, no shell.

  stdout is captured whole. stderr is split on '\n' and '\r' (ffmpeg redraws
  its progress line with carriage returns) and each line is handed to
  on_stderr_line. A tripped token kills the child and throws Cancelled.
  Throws TransientIoError if the process cannot be started.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, const LineCallback& on_stderr_line = {},
                         const CancellationToken& cancel = {});

} // namespace streamlift::util
