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

#include "log.h"
#include "util.h"
#include <kj/debug.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

namespace stagehand {

kj::StringPtr levelTag(kj::LogSeverity severity) {
  switch (severity) {
    case kj::LogSeverity::INFO: return "INFO";
    case kj::LogSeverity::WARNING: return "WARN";
    case kj::LogSeverity::ERROR: return "ERROR";
    case kj::LogSeverity::FATAL: return "ERROR";
    case kj::LogSeverity::DBG: return "DEBUG";
  }
  return "INFO";
}

kj::ArrayPtr<const char> sourceTag(kj::StringPtr file) {
  KJ_IF_MAYBE(slash, file.findLast('/')) {
    file = file.slice(*slash + 1);
  }
  KJ_IF_MAYBE(dot, file.findFirst('.')) {
    return file.slice(0, *dot);
  }
  return file;
}

kj::String formatLogLine(kj::LogSeverity severity, kj::StringPtr file, kj::StringPtr text,
                         const struct timespec& when) {
  char date[32];
  struct tm local;
  time_t seconds = when.tv_sec;
  if (localtime_r(&seconds, &local) == nullptr ||
      strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local) == 0) {
    strcpy(date, "????-??-?? ??:??:??");
  }

  char millis[8];
  snprintf(millis, sizeof(millis), ".%03d", (int)(when.tv_nsec / 1000000));

  // KJ sometimes ends a description with a newline; we add our own.
  kj::ArrayPtr<const char> body = text;
  while (body.size() > 0 && body.back() == '\n') body = body.slice(0, body.size() - 1);

  return kj::str(kj::StringPtr(date), kj::StringPtr(millis),
                 " [", levelTag(severity), "] [", sourceTag(file), "] ", body, '\n');
}

void writeFully(int fd, kj::ArrayPtr<const char> data) {
  while (data.size() > 0) {
    ssize_t n = write(fd, data.begin(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    data = data.slice(n, data.size());
  }
}

void rotateLogFiles(kj::StringPtr path, size_t threshold, uint generations) {
  struct stat stats;
  if (stat(path.cStr(), &stats) < 0) {
    int error = errno;
    if (error == ENOENT) return;
    KJ_FAIL_SYSCALL("stat(log)", error, path);
  }
  if (static_cast<size_t>(stats.st_size) < threshold || generations == 0) return;

  auto renameIfExists = [](kj::StringPtr from, kj::StringPtr to) {
    if (rename(from.cStr(), to.cStr()) < 0) {
      int error = errno;
      if (error != ENOENT) {
        KJ_FAIL_SYSCALL("rename(log)", error, from, to);
      }
    }
  };

  for (uint i = generations - 1; i >= 1; i--) {
    renameIfExists(kj::str(path, '.', i), kj::str(path, '.', i + 1));
  }
  renameIfExists(path, kj::str(path, ".1"));
}

kj::AutoCloseFd openLogFile(kj::StringPtr path) {
  rotateLogFiles(path, DEFAULT_LOG_ROTATE_THRESHOLD, DEFAULT_LOG_GENERATIONS);
  return raiiOpen(path, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
}

// =======================================================================================

ConsoleLog::ConsoleLog(bool verbose, kj::Maybe<kj::AutoCloseFd> logFile, int out)
    : verbose(verbose), logFile(kj::mv(logFile)), out(out) {}

void ConsoleLog::logMessage(kj::LogSeverity severity, const char* file, int line,
                            int contextDepth, kj::String&& text) {
  if (severity == kj::LogSeverity::DBG && !verbose) return;

  struct timespec now;
  if (clock_gettime(CLOCK_REALTIME, &now) < 0) {
    now.tv_sec = 0;
    now.tv_nsec = 0;
  }

  auto rendered = formatLogLine(severity, file, text, now);
  writeFully(out, rendered);
  KJ_IF_MAYBE(fd, logFile) {
    writeFully(*fd, rendered);
  }
}

}  // namespace stagehand
