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
#include <kj/test.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

namespace stagehand {
namespace {

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

KJ_TEST("log tags") {
  KJ_EXPECT(levelTag(kj::LogSeverity::INFO) == "INFO");
  KJ_EXPECT(levelTag(kj::LogSeverity::WARNING) == "WARN");
  KJ_EXPECT(levelTag(kj::LogSeverity::ERROR) == "ERROR");
  KJ_EXPECT(levelTag(kj::LogSeverity::FATAL) == "ERROR");
  KJ_EXPECT(levelTag(kj::LogSeverity::DBG) == "DEBUG");

  KJ_EXPECT(sourceTag("src/stagehand/supervisor.c++") == "supervisor");
  KJ_EXPECT(sourceTag("health-probe.c++") == "health-probe");
  KJ_EXPECT(sourceTag("Makefile") == "Makefile");
}

KJ_TEST("formatLogLine") {
  setenv("TZ", "UTC", 1);
  tzset();

  struct timespec when;
  when.tv_sec = 86400 + 3600 + 61;
  when.tv_nsec = 42999999;

  KJ_EXPECT(formatLogLine(kj::LogSeverity::WARNING, "src/stagehand/supervisor.c++",
                          "probe failed; count = 30", when) ==
            "1970-01-02 01:01:01.042 [WARN] [supervisor] probe failed; count = 30\n");
  KJ_EXPECT(formatLogLine(kj::LogSeverity::INFO, "process.c++", "started\n", when) ==
            "1970-01-02 01:01:01.042 [INFO] [process] started\n");
}

KJ_TEST("ConsoleLog") {
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  KJ_DEFER(kj::_::Debug::setLogLevel(kj::LogSeverity::WARNING));

  char dirTemplate[] = "/tmp/stagehand-log-test.XXXXXX";
  KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
  auto logPath = kj::str(kj::StringPtr(dirTemplate), "/stagehand.log");
  KJ_DEFER({
    unlink(logPath.cStr());
    rmdir(dirTemplate);
  });

  auto pipe = Pipe::make();
  {
    ConsoleLog log(false, openLogFile(logPath), pipe.writeEnd);
    int pid = 1234;
    KJ_LOG(INFO, "child started", pid);
    KJ_LOG(DBG, "hidden detail");
  }
  {
    ConsoleLog log(true, nullptr, pipe.writeEnd);
    KJ_LOG(DBG, "shown detail");
  }
  pipe.writeEnd = nullptr;

  auto console = readAll(pipe.readEnd);
  KJ_EXPECT(contains(console, "[INFO] [log-test] child started; pid = 1234"), console);
  KJ_EXPECT(!contains(console, "hidden detail"), console);
  KJ_EXPECT(contains(console, "[DEBUG] [log-test] shown detail"), console);

  auto file = readAll(logPath);
  KJ_EXPECT(contains(file, "[INFO] [log-test] child started"), file);
  KJ_EXPECT(!contains(file, "shown detail"), file);
}

KJ_TEST("rotateLogFiles") {
  char dirTemplate[] = "/tmp/stagehand-rotate-test.XXXXXX";
  KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
  auto dir = kj::heapString(dirTemplate);
  auto path = kj::str(dir, "/run.log");

  auto writeFile = [](kj::StringPtr name, kj::StringPtr content) {
    auto fd = raiiOpen(name, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
    writeFully(fd, content);
  };
  auto exists = [](kj::StringPtr name) {
    return access(name.cStr(), F_OK) == 0;
  };

  // Missing file: nothing happens.
  rotateLogFiles(path, 10, 3);
  KJ_EXPECT(!exists(path));

  // Under the threshold: left alone.
  writeFile(path, "short");
  rotateLogFiles(path, 10, 3);
  KJ_EXPECT(readAll(path) == "short");
  KJ_EXPECT(!exists(kj::str(path, ".1")));

  // Over the threshold, three times, with a limit of three generations.
  writeFile(path, "first log!");
  rotateLogFiles(path, 10, 3);
  KJ_EXPECT(!exists(path));
  KJ_EXPECT(readAll(kj::str(path, ".1")) == "first log!");

  writeFile(path, "second log");
  rotateLogFiles(path, 10, 3);
  writeFile(path, "third log!");
  rotateLogFiles(path, 10, 3);
  writeFile(path, "fourth log");
  rotateLogFiles(path, 10, 3);

  KJ_EXPECT(readAll(kj::str(path, ".1")) == "fourth log");
  KJ_EXPECT(readAll(kj::str(path, ".2")) == "third log!");
  KJ_EXPECT(readAll(kj::str(path, ".3")) == "second log");
  KJ_EXPECT(!exists(kj::str(path, ".4")));

  for (auto suffix: {".1", ".2", ".3"}) {
    unlink(kj::str(path, suffix).cStr());
  }
  rmdir(dir.cStr());
}

}  // namespace
}  // namespace stagehand
