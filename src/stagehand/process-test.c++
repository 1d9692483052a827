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

#include "process.h"
#include <kj/test.h>
#include <stdlib.h>

namespace stagehand {
namespace {

kj::Array<kj::String> strArray(std::initializer_list<kj::StringPtr> items) {
  auto builder = kj::heapArrayBuilder<kj::String>(items.size());
  for (auto item: items) builder.add(kj::str(item));
  return builder.finish();
}

KJ_TEST("overlayEnvironment") {
  auto base = strArray({"PATH=/usr/bin:/bin", "HOME=/home/nav01", "PYTHONUNBUFFERED=0"});
  auto overlay = strArray({"PYTHONUNBUFFERED=1", "ROSCONSOLE_STDOUT_LINE_BUFFERED=1",
                           "PATHX=1"});

  auto result = overlayEnvironment(base, overlay);
  KJ_ASSERT(result.size() == 5);
  KJ_EXPECT(result[0] == "PATH=/usr/bin:/bin");
  KJ_EXPECT(result[1] == "HOME=/home/nav01");
  KJ_EXPECT(result[2] == "PYTHONUNBUFFERED=1");
  KJ_EXPECT(result[3] == "ROSCONSOLE_STDOUT_LINE_BUFFERED=1");
  KJ_EXPECT(result[4] == "PATHX=1");
}

KJ_TEST("Command::clone") {
  Command command { kj::str("subsystem"), strArray({"roslaunch", "robot_state"}),
                    strArray({"PYTHONUNBUFFERED=1"}) };
  auto copy = command.clone();
  KJ_EXPECT(copy.title == "subsystem");
  KJ_ASSERT(copy.argv.size() == 2);
  KJ_EXPECT(copy.argv[1] == "robot_state");
  KJ_EXPECT(copy.argv[1].begin() != command.argv[1].begin());
  KJ_ASSERT(copy.environment.size() == 1);
}

KJ_TEST("SubprocessLauncher applies the environment overlay") {
  setenv("STAGEHAND_PROCESS_TEST", "inherited", 1);
  KJ_DEFER(unsetenv("STAGEHAND_PROCESS_TEST"));

  SubprocessLauncher launcher;

  {
    Command command { kj::str("check"),
        strArray({"sh", "-c", "test \"$STAGEHAND_PROCESS_TEST\" = inherited"}), nullptr };
    auto child = launcher.launch(command);
    KJ_EXPECT(child->waitForExit() == 0);
  }

  {
    Command command { kj::str("check"),
        strArray({"sh", "-c", "test \"$STAGEHAND_PROCESS_TEST\" = replaced"}),
        strArray({"STAGEHAND_PROCESS_TEST=replaced"}) };
    auto child = launcher.launch(command);
    KJ_EXPECT(child->waitForExit() == 0);
  }

  {
    Command command { kj::str("missing"), strArray({"no-such-program-0c9e2f1b"}), nullptr };
    KJ_EXPECT_THROW_MESSAGE("failed to start child process", launcher.launch(command));
  }
}

}  // namespace
}  // namespace stagehand
