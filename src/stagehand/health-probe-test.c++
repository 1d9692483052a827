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

#include "health-probe.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <sys/resource.h>

namespace stagehand {
namespace {

kj::Array<kj::String> strArray(std::initializer_list<kj::StringPtr> items) {
  auto builder = kj::heapArrayBuilder<kj::String>(items.size());
  for (auto item: items) builder.add(kj::str(item));
  return builder.finish();
}

Command shellProbe(kj::StringPtr script) {
  // The channel name is appended after the script, so it shows up as $0.
  return Command { kj::str("test probe"), strArray({"sh", "-c", script}), nullptr };
}

kj::StringPtr expectValue(ProbeResult& result) {
  KJ_IF_MAYBE(value, result.tryGet<kj::String>()) {
    return *value;
  } else {
    KJ_FAIL_ASSERT("expected a value", result.get<ProbeFailure>().detail);
  }
}

ProbeFailure::Kind expectFailure(ProbeResult& result) {
  KJ_IF_MAYBE(failure, result.tryGet<ProbeFailure>()) {
    return failure->kind;
  } else {
    KJ_FAIL_ASSERT("expected a failure", result.get<kj::String>());
  }
}

KJ_TEST("findField") {
  kj::StringPtr sample =
      "header: \n"
      "  seq: 12\n"
      "  state: 9\n"
      "state: 5\n"
      "---\n";

  KJ_EXPECT(KJ_ASSERT_NONNULL(findField(sample, "state")) == "5");
  KJ_EXPECT(findField(sample, "seq") == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findField(sample, "header")) == "");
  KJ_EXPECT(findField("stateful: 1\n", "state") == nullptr);
  KJ_EXPECT(findField("", "state") == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findField("state:3\r\n", "state")) == "3");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findField("state: 5:x\n", "state")) == "5");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findField("state: 5 : 7\nstate: 6\n", "state")) == "5");
}

KJ_TEST("CommandHealthProbe reads the field") {
  CommandHealthProbe probe(shellProbe("echo \"channel: $0\"; echo 'state: 5'; echo ---"),
                           kj::str("state"));

  auto result = probe.probe("/zj_humanoid/robot/robot_state", 5 * kj::SECONDS);
  KJ_EXPECT(expectValue(result) == "5");

  CommandHealthProbe channelProbe(shellProbe("echo \"channel: $0\""), kj::str("channel"));
  auto channelResult = channelProbe.probe("/i2/robot/robot_state", 5 * kj::SECONDS);
  KJ_EXPECT(expectValue(channelResult) == "/i2/robot/robot_state");
}

KJ_TEST("CommandHealthProbe reports a missing field") {
  CommandHealthProbe probe(shellProbe("echo 'mode: 2'"), kj::str("state"));
  auto result = probe.probe("/robot/state", 5 * kj::SECONDS);
  KJ_EXPECT(expectFailure(result) == ProbeFailure::Kind::FIELD_MISSING);
}

KJ_TEST("CommandHealthProbe reports a failed query") {
  CommandHealthProbe probe(shellProbe("echo 'state: 5'; echo 'no master' >&2; exit 1"),
                           kj::str("state"));
  auto result = probe.probe("/robot/state", 5 * kj::SECONDS);
  KJ_EXPECT(expectFailure(result) == ProbeFailure::Kind::ERROR);
  KJ_EXPECT(result.get<ProbeFailure>().detail.endsWith("no master"),
            result.get<ProbeFailure>().detail);

  CommandHealthProbe missing(
      Command { kj::str("missing"), strArray({"no-such-file-5d1c0e37aa41"}), nullptr },
      kj::str("state"));
  auto missingResult = missing.probe("/robot/state", 5 * kj::SECONDS);
  KJ_EXPECT(expectFailure(missingResult) == ProbeFailure::Kind::ERROR);
}

KJ_TEST("CommandHealthProbe reports an error when it cannot create pipes") {
  CommandHealthProbe probe(shellProbe("echo 'state: 5'"), kj::str("state"));

  // With no file descriptors to spare, setting up the child's output pipes fails.
  struct rlimit saved;
  KJ_SYSCALL(getrlimit(RLIMIT_NOFILE, &saved));
  struct rlimit lowered = saved;
  lowered.rlim_cur = 3;
  KJ_SYSCALL(setrlimit(RLIMIT_NOFILE, &lowered));
  KJ_DEFER(KJ_SYSCALL(setrlimit(RLIMIT_NOFILE, &saved)));

  auto result = probe.probe("/robot/state", 5 * kj::SECONDS);
  KJ_EXPECT(expectFailure(result) == ProbeFailure::Kind::ERROR);
  KJ_EXPECT(result.get<ProbeFailure>().detail.startsWith("could not query /robot/state"),
            result.get<ProbeFailure>().detail);
}

KJ_TEST("CommandHealthProbe times out") {
  CommandHealthProbe probe(shellProbe("sleep 10; echo 'state: 5'"), kj::str("state"));

  auto start = monotonicNow();
  auto result = probe.probe("/robot/state", 200 * kj::MILLISECONDS);
  auto elapsed = monotonicNow() - start;

  KJ_EXPECT(expectFailure(result) == ProbeFailure::Kind::TIMEOUT);
  KJ_EXPECT(elapsed < 5 * kj::SECONDS);
}

}  // namespace
}  // namespace stagehand
