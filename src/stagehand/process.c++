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
#include <kj/debug.h>

extern char** environ;

namespace stagehand {

static kj::ArrayPtr<const char> envName(kj::StringPtr entry) {
  KJ_IF_MAYBE(pos, entry.findFirst('=')) {
    return entry.slice(0, *pos);
  } else {
    return entry;
  }
}

Command Command::clone() const {
  return Command {
    kj::heapString(title),
    KJ_MAP(arg, argv) { return kj::heapString(arg); },
    KJ_MAP(entry, environment) { return kj::heapString(entry); }
  };
}

kj::Array<kj::String> overlayEnvironment(
    kj::ArrayPtr<const kj::String> base, kj::ArrayPtr<const kj::String> overlay) {
  kj::Vector<kj::String> result(base.size() + overlay.size());
  for (auto& entry: base) {
    result.add(kj::heapString(entry));
  }

  for (auto& entry: overlay) {
    auto name = envName(entry);
    bool replaced = false;
    for (auto& existing: result) {
      if (envName(existing) == name) {
        existing = kj::heapString(entry);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      result.add(kj::heapString(entry));
    }
  }

  return result.releaseAsArray();
}

kj::Array<kj::String> currentEnvironment() {
  kj::Vector<kj::String> result;
  for (char** entry = environ; *entry != nullptr; ++entry) {
    result.add(kj::heapString(*entry));
  }
  return result.releaseAsArray();
}

kj::Own<Subprocess> SubprocessLauncher::launch(const Command& command) {
  KJ_REQUIRE(command.argv.size() > 0, "empty command", command.title);

  auto environment = overlayEnvironment(currentEnvironment(), command.environment);
  auto envPtrs = KJ_MAP(entry, environment) -> const kj::StringPtr { return entry; };
  auto argvPtrs = KJ_MAP(arg, command.argv) -> const kj::StringPtr { return arg; };

  Subprocess::Options options(argvPtrs.asPtr());
  options.environment = envPtrs.asPtr();

  auto child = kj::heap<Subprocess>(kj::mv(options));
  pid_t pid = child->getPid();
  KJ_LOG(INFO, "started", command.title, pid);
  return kj::mv(child);
}

}  // namespace stagehand
