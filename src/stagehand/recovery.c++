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
#include <kj/debug.h>

namespace stagehand {

void LivenessTracker::recordSuccess(kj::TimePoint now) {
  KJ_IF_MAYBE(last, lastSuccess) {
    // Never move backwards, so elapsed time can only grow between updates.
    if (now < *last) return;
  }
  lastSuccess = now;
}

void LivenessTracker::recordReset(kj::TimePoint now) {
  lastSuccess = now;
}

bool LivenessTracker::isStale(kj::TimePoint now, kj::Duration threshold) const {
  KJ_IF_MAYBE(last, lastSuccess) {
    return now - *last > threshold;
  } else {
    return false;
  }
}

kj::Maybe<kj::Duration> LivenessTracker::sinceLastSuccess(kj::TimePoint now) const {
  KJ_IF_MAYBE(last, lastSuccess) {
    return now - *last;
  } else {
    return nullptr;
  }
}

void RestartPolicy::recordAttempt() {
  KJ_REQUIRE(mayRestart(), "restart budget exhausted", attempts, maxAttempts);
  ++attempts;
}

}  // namespace stagehand
