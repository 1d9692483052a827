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

#ifndef STAGEHAND_TICKER_H_
#define STAGEHAND_TICKER_H_

#include <kj/io.h>
#include <kj/time.h>
#include <signal.h>

namespace stagehand {

class Ticker {
  // The supervisor's view of time. All of its waiting goes through here, which is also where an
  // operator interrupt is noticed.

public:
  virtual kj::TimePoint now() = 0;
  // Monotonic time.

  virtual bool sleep(kj::Duration duration) = 0;
  // Waits for `duration`. Returns false without waiting out the full duration if an interrupt
  // arrives (or has already arrived); true otherwise.

  virtual bool isInterrupted() = 0;
  // Checks, without blocking, whether an interrupt has arrived.
};

class SignalTicker: public Ticker {
  // Ticker backed by CLOCK_MONOTONIC. SIGINT, SIGTERM and SIGHUP are blocked for the lifetime of
  // this object and delivered through a signalfd instead; any of them counts as an interrupt.
  // Once interrupted, stays interrupted.
  //
  // Child processes get a clean signal mask (see Subprocess), so they still see these signals
  // normally, e.g. when Ctrl+C is delivered to the whole foreground process group.

public:
  SignalTicker();
  ~SignalTicker() noexcept(false);
  KJ_DISALLOW_COPY(SignalTicker);

  kj::TimePoint now() override;
  bool sleep(kj::Duration duration) override;
  bool isInterrupted() override;

private:
  sigset_t previousMask;
  kj::AutoCloseFd sigfd;
  bool interrupted = false;

  void waitForSignal(int timeoutMs);
};

}  // namespace stagehand

#endif  // STAGEHAND_TICKER_H_
