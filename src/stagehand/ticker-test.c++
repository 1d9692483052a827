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

#include "ticker.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <unistd.h>

namespace stagehand {
namespace {

KJ_TEST("SignalTicker sleeps until interrupted") {
  SignalTicker ticker;
  KJ_EXPECT(!ticker.isInterrupted());

  auto start = ticker.now();
  KJ_EXPECT(ticker.sleep(20 * kj::MILLISECONDS));
  KJ_EXPECT(ticker.now() - start >= 20 * kj::MILLISECONDS);

  // The signal is blocked, so it waits on the signalfd instead of killing us.
  KJ_SYSCALL(kill(getpid(), SIGHUP));

  start = ticker.now();
  KJ_EXPECT(!ticker.sleep(10 * kj::SECONDS));
  KJ_EXPECT(ticker.now() - start < 5 * kj::SECONDS);

  // Stays interrupted.
  KJ_EXPECT(ticker.isInterrupted());
  KJ_EXPECT(!ticker.sleep(0 * kj::SECONDS));
}

KJ_TEST("SignalTicker notices a pending interrupt without sleeping") {
  SignalTicker ticker;
  KJ_SYSCALL(kill(getpid(), SIGTERM));
  KJ_EXPECT(ticker.isInterrupted());
}

}  // namespace
}  // namespace stagehand
