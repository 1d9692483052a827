// Stagehand - Robot startup supervisor
// Copyright (c) 2026 Stagehand contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef STAGEHAND_LOG_H_
#define STAGEHAND_LOG_H_

#include <kj/exception.h>
#include <kj/io.h>
#include <kj/string.h>
#include <time.h>
#include <unistd.h>

namespace stagehand {

typedef unsigned int uint;

kj::StringPtr levelTag(kj::LogSeverity severity);
// "INFO", "WARN", "ERROR" or "DEBUG". FATAL is shown as ERROR.

kj::ArrayPtr<const char> sourceTag(kj::StringPtr file);
// Module name for a source file path, e.g. "src/stagehand/supervisor.c++" -> "supervisor".

kj::String formatLogLine(kj::LogSeverity severity, kj::StringPtr file, kj::StringPtr text,
                         const struct timespec& when);
// Renders one log record, newline included:
//
//     2026-03-01 14:02:11.042 [INFO] [supervisor] message
//
// The timestamp is local time.

void writeFully(int fd, kj::ArrayPtr<const char> data);
// write() loop that gives up silently on error. Used for log output, which must never throw.

void rotateLogFiles(kj::StringPtr path, size_t threshold, uint generations);
// If `path` exists and is at least `threshold` bytes, shifts `path.1` .. `path.<generations-1>`
// up by one (dropping the oldest) and renames `path` to `path.1`.

constexpr size_t DEFAULT_LOG_ROTATE_THRESHOLD = 10u << 20;
constexpr uint DEFAULT_LOG_GENERATIONS = 5;

kj::AutoCloseFd openLogFile(kj::StringPtr path);
// Rotates with the default limits, then opens `path` for appending.

class ConsoleLog: public kj::ExceptionCallback {
  // Log sink for KJ_LOG. While an instance is alive on the stack, every log record in this
  // thread is rendered with formatLogLine() and written to `out` and, if given, the log file.
  // DBG records are dropped unless `verbose`.

public:
  ConsoleLog(bool verbose, kj::Maybe<kj::AutoCloseFd> logFile, int out = STDOUT_FILENO);
  KJ_DISALLOW_COPY(ConsoleLog);

  void logMessage(kj::LogSeverity severity, const char* file, int line, int contextDepth,
                  kj::String&& text) override;

private:
  bool verbose;
  kj::Maybe<kj::AutoCloseFd> logFile;
  int out;
};

}  // namespace stagehand

#endif  // STAGEHAND_LOG_H_
