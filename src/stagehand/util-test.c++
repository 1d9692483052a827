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

#include "util.h"
#include <kj/test.h>
#include <signal.h>
#include <sys/wait.h>

namespace stagehand {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
      if (haystack.slice(i).startsWith(needle)) {
        return true;
      }
    }
  }
  return false;
}

KJ_TEST("Subprocess") {
  {
    Subprocess child({"true"});
    child.waitForSuccess();
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT(child.waitForExit() != 0);
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT_THROW_MESSAGE("child process failed", child.waitForSuccess());
  }

  {
    Subprocess child({"cat"});
    // Will be killed by destructor.
  }

  {
    Subprocess child({"cat"});
    child.signal(SIGKILL);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status));
    KJ_EXPECT(WTERMSIG(status) == SIGKILL);
  }

  {
    Subprocess child({"cat"});
    child.signal(SIGKILL);
    KJ_EXPECT_THROW_MESSAGE("child process killed by signal", (void)child.waitForExit());
  }

  {
    Subprocess child({"sh", "-c", "exit 123"});
    KJ_EXPECT(child.waitForExit() == 123);
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"echo", "foo"});
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n");
    child.waitForSuccess();
  }

  {
    Subprocess::Options options({"/bin/true"});
    options.searchPath = false;
    Subprocess child(kj::mv(options));
    child.waitForSuccess();
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"sh", "-c", "echo $UTIL_TEST_ENV"});
    auto env = kj::heapArray<const kj::StringPtr>({"PATH=/bin:/usr/bin", "UTIL_TEST_ENV=foo"});
    options.environment = env.asPtr();
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n");
    child.waitForSuccess();
  }
}

KJ_TEST("Subprocess reports exec failure to the parent") {
  KJ_EXPECT_THROW_MESSAGE("failed to start child process",
      Subprocess({"no-such-file-eb8c433f35f3063e"}));

  {
    Subprocess::Options options({"true"});
    options.searchPath = false;
    KJ_EXPECT_THROW_MESSAGE("execv(", Subprocess(kj::mv(options)));
  }
}

KJ_TEST("Subprocess bounded wait") {
  {
    Subprocess child({"sleep", "10"});
    KJ_EXPECT(child.waitForExitOrSignal(50 * kj::MILLISECONDS) == nullptr);
    KJ_EXPECT(child.isRunning());

    child.signal(SIGINT);
    KJ_IF_MAYBE(status, child.waitForExitOrSignal(5 * kj::SECONDS)) {
      KJ_EXPECT(WIFSIGNALED(*status));
      KJ_EXPECT(WTERMSIG(*status) == SIGINT);
    } else {
      KJ_FAIL_EXPECT("sleep did not exit on SIGINT");
    }
    KJ_EXPECT(!child.isRunning());
  }

  {
    // A child that ignores the graceful signal has to be killed.
    Pipe pipe = Pipe::make();
    Subprocess::Options options(
        {"sh", "-c", "trap '' INT; echo ready; while :; do sleep 0.1; done"});
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;

    // Don't signal until the trap is installed.
    char buffer[6];
    kj::FdInputStream(pipe.readEnd.get()).read(buffer, sizeof(buffer));
    KJ_EXPECT(kj::heapString(buffer, sizeof(buffer)) == "ready\n");

    child.signal(SIGINT);
    KJ_EXPECT(child.waitForExitOrSignal(100 * kj::MILLISECONDS) == nullptr);
    child.signal(SIGKILL);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL);
  }
}

KJ_TEST("Subprocess tryReap") {
  Subprocess child({"sh", "-c", "exit 7"});

  kj::Maybe<int> result;
  auto deadline = monotonicNow() + 5 * kj::SECONDS;
  while (result == nullptr && monotonicNow() < deadline) {
    result = child.tryReap();
    usleep(1000);
  }

  KJ_IF_MAYBE(status, result) {
    KJ_EXPECT(WIFEXITED(*status));
    KJ_EXPECT(WEXITSTATUS(*status) == 7);
  } else {
    KJ_FAIL_EXPECT("child never exited");
  }
  KJ_EXPECT(!child.isRunning());
  KJ_EXPECT_THROW_MESSAGE("already waited", (void)child.tryReap());
}

KJ_TEST("describeWaitStatus") {
  {
    Subprocess child({"sh", "-c", "exit 3"});
    KJ_EXPECT(describeWaitStatus(child.waitForExitOrSignal()) == "exit code 3");
  }

  {
    Subprocess child({"cat"});
    child.signal(SIGKILL);
    auto text = describeWaitStatus(child.waitForExitOrSignal());
    KJ_EXPECT(hasSubstring(text, "killed by signal 9"), text);
  }
}

KJ_TEST("string helpers") {
  KJ_EXPECT(trim("  foo bar \n") == "foo bar");
  KJ_EXPECT(trim(" \t ") == "");

  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("123", 10)) == 123);
  KJ_EXPECT(parseUInt("12x", 10) == nullptr);
  KJ_EXPECT(parseUInt("", 10) == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("4294967295", 10)) == 4294967295u);
  KJ_EXPECT(parseUInt("4294967296", 10) == nullptr);
  KJ_EXPECT(parseUInt("99999999999999999999999", 10) == nullptr);

  auto words = splitSpace("  roslaunch   robot_state\trobot_state.launch ");
  KJ_ASSERT(words.size() == 3);
  KJ_EXPECT(kj::str(words[0]) == "roslaunch");
  KJ_EXPECT(kj::str(words[2]) == "robot_state.launch");

  auto lines = splitLines("# comment\nFOO=1\n\n  BAR = 2 # trailing\n");
  KJ_ASSERT(lines.size() == 2);
  KJ_EXPECT(lines[0] == "FOO=1");
  KJ_EXPECT(lines[1] == "BAR = 2");

  KJ_EXPECT(replaceAll("/{robot}/robot/{robot}", "{robot}", "i2") == "/i2/robot/i2");
  KJ_EXPECT(replaceAll("no match", "{robot}", "i2") == "no match");
}

}  // namespace
}  // namespace stagehand
