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

#include "recovery.h"
#include <kj/test.h>

namespace stagehand {
namespace {

kj::TimePoint at(int64_t seconds) {
  return kj::origin<kj::TimePoint>() + seconds * kj::SECONDS;
}

KJ_TEST("LivenessTracker grace period before the first reading") {
  LivenessTracker tracker;
  KJ_EXPECT(!tracker.isStale(at(1000), 15 * kj::SECONDS));
  KJ_EXPECT(tracker.sinceLastSuccess(at(1000)) == nullptr);
}

KJ_TEST("LivenessTracker staleness is strictly greater than the threshold") {
  LivenessTracker tracker;
  tracker.recordReset(at(100));

  KJ_EXPECT(!tracker.isStale(at(100), 15 * kj::SECONDS));
  KJ_EXPECT(!tracker.isStale(at(115), 15 * kj::SECONDS));
  KJ_EXPECT(tracker.isStale(at(116), 15 * kj::SECONDS));

  tracker.recordSuccess(at(110));
  KJ_EXPECT(!tracker.isStale(at(125), 15 * kj::SECONDS));
  KJ_EXPECT(tracker.isStale(at(126), 15 * kj::SECONDS));
  KJ_EXPECT(KJ_ASSERT_NONNULL(tracker.sinceLastSuccess(at(120))) == 10 * kj::SECONDS);
}

KJ_TEST("LivenessTracker ignores out-of-order successes") {
  LivenessTracker tracker;
  tracker.recordSuccess(at(50));
  tracker.recordSuccess(at(40));
  KJ_EXPECT(KJ_ASSERT_NONNULL(tracker.sinceLastSuccess(at(60))) == 10 * kj::SECONDS);

  // A reset is a deliberate restart of the clock and always applies.
  tracker.recordReset(at(45));
  KJ_EXPECT(KJ_ASSERT_NONNULL(tracker.sinceLastSuccess(at(60))) == 15 * kj::SECONDS);
}

KJ_TEST("RestartPolicy") {
  RestartPolicy policy(3);
  KJ_EXPECT(policy.getMaxAttempts() == 3);

  for (uint i = 0; i < 3; i++) {
    KJ_EXPECT(policy.mayRestart());
    policy.recordAttempt();
    KJ_EXPECT(policy.getAttempts() == i + 1);
  }

  KJ_EXPECT(!policy.mayRestart());
  KJ_EXPECT_THROW_MESSAGE("restart budget exhausted", policy.recordAttempt());
  KJ_EXPECT(policy.getAttempts() == 3);
  KJ_EXPECT(!policy.mayRestart());
}

KJ_TEST("RestartPolicy with no budget") {
  RestartPolicy policy(0);
  KJ_EXPECT(!policy.mayRestart());
}

}  // namespace
}  // namespace stagehand
