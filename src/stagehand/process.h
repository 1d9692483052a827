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

#ifndef STAGEHAND_PROCESS_H_
#define STAGEHAND_PROCESS_H_

#include "util.h"
#include <kj/string.h>
#include <kj/memory.h>

namespace stagehand {

struct Command {
  // Describes an external program to launch. Built once from the configuration and never
  // modified afterwards.

  kj::String title;
  // Human-readable name used in log lines, e.g. "robot_state.launch".

  kj::Array<kj::String> argv;
  // argv[0] is the executable, looked up in PATH if it contains no '/'.

  kj::Array<kj::String> environment;
  // 'NAME=VALUE' entries layered over the supervisor's own environment.

  Command clone() const;
};

kj::Array<kj::String> overlayEnvironment(
    kj::ArrayPtr<const kj::String> base, kj::ArrayPtr<const kj::String> overlay);
// Returns `base` with every entry of `overlay` applied. An overlay entry replaces the base entry
// with the same name; entries with new names are appended in order.

kj::Array<kj::String> currentEnvironment();
// Copy of this process's environ.

class ChildLauncher {
  // Starts child processes. The supervisor only ever launches through this interface so tests
  // can control which launches fail.

public:
  virtual kj::Own<Subprocess> launch(const Command& command) = 0;
  // Starts `command` with the supervisor's stdio and returns immediately. Throws if the program
  // could not be started.
};

class SubprocessLauncher: public ChildLauncher {
  // The real launcher: fork() + exec() via Subprocess. Children inherit stdout and stderr
  // directly so that their output is never held up in a pipe we would have to drain.

public:
  kj::Own<Subprocess> launch(const Command& command) override;
};

}  // namespace stagehand

#endif  // STAGEHAND_PROCESS_H_
