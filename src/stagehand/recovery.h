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

#ifndef STAGEHAND_RECOVERY_H_
#define STAGEHAND_RECOVERY_H_

#include <kj/common.h>
#include <kj/time.h>

namespace stagehand {

typedef unsigned int uint;

class LivenessTracker {
  // Remembers when the subsystem last answered a health probe.

public:
  void recordSuccess(kj::TimePoint now);
  // A probe just returned a value.

  void recordReset(kj::TimePoint now);
  // Start (or restart) the clock without a reading, e.g. at the start of polling or right after
  // the subsystem was relaunched. Counts the same as a success for staleness purposes.

  bool isStale(kj::TimePoint now, kj::Duration threshold) const;
  // False until the tracker has been started. Afterwards, true once strictly more than
  // `threshold` has passed since the last success or reset.

  kj::Maybe<kj::Duration> sinceLastSuccess(kj::TimePoint now) const;

private:
  kj::Maybe<kj::TimePoint> lastSuccess;
};

class RestartPolicy {
  // Counts subsystem restarts against a fixed budget. Once the budget is used up it stays used
  // up for the rest of the run.

public:
  explicit RestartPolicy(uint maxAttempts): maxAttempts(maxAttempts) {}

  bool mayRestart() const { return attempts < maxAttempts; }

  void recordAttempt();
  // Throws if mayRestart() is false.

  uint getAttempts() const { return attempts; }
  uint getMaxAttempts() const { return maxAttempts; }

private:
  uint attempts = 0;
  uint maxAttempts;
};

}  // namespace stagehand

#endif  // STAGEHAND_RECOVERY_H_
