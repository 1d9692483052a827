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
#include "util.h"
#include <kj/debug.h>
#include <errno.h>
#include <string.h>
#include <poll.h>
#include <sys/signalfd.h>

namespace stagehand {

SignalTicker::SignalTicker() {
  sigset_t sigmask;
  KJ_SYSCALL(sigemptyset(&sigmask));
  KJ_SYSCALL(sigaddset(&sigmask, SIGTERM));
  KJ_SYSCALL(sigaddset(&sigmask, SIGINT));
  KJ_SYSCALL(sigaddset(&sigmask, SIGHUP));
  KJ_SYSCALL(sigprocmask(SIG_BLOCK, &sigmask, &previousMask));

  int fd;
  KJ_SYSCALL(fd = signalfd(-1, &sigmask, SFD_CLOEXEC | SFD_NONBLOCK));
  sigfd = kj::AutoCloseFd(fd);
}

SignalTicker::~SignalTicker() noexcept(false) {
  // Signals that arrived but were never read stay pending and are delivered with their default
  // disposition once unblocked. We have already acted on them (or never started), so drop them.
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    waitForSignal(0);
  })) {
    KJ_LOG(ERROR, "failed to drain signals", *exception);
  }
  sigfd = nullptr;
  KJ_SYSCALL(sigprocmask(SIG_SETMASK, &previousMask, nullptr)) { break; }
}

kj::TimePoint SignalTicker::now() {
  return monotonicNow();
}

bool SignalTicker::sleep(kj::Duration duration) {
  auto deadline = monotonicNow() + duration;
  for (;;) {
    if (interrupted) return false;

    auto now = monotonicNow();
    if (now >= deadline) return true;

    kj::Duration remaining = deadline - now;
    waitForSignal((remaining + kj::MILLISECONDS - 1 * kj::NANOSECONDS) / kj::MILLISECONDS);
  }
}

bool SignalTicker::isInterrupted() {
  if (!interrupted) waitForSignal(0);
  return interrupted;
}

void SignalTicker::waitForSignal(int timeoutMs) {
  struct pollfd pfd;
  pfd.fd = sigfd;
  pfd.events = POLLIN;
  pfd.revents = 0;

  int n;
  KJ_SYSCALL(n = poll(&pfd, 1, timeoutMs));
  if (n == 0) return;

  for (;;) {
    struct signalfd_siginfo siginfo;
    ssize_t size;
    KJ_NONBLOCKING_SYSCALL(size = read(sigfd, &siginfo, sizeof(siginfo)));
    if (size < 0) break;  // EAGAIN: nothing more queued
    KJ_ASSERT(size == sizeof(siginfo));

    if (!interrupted) {
      KJ_LOG(WARNING, "received signal; shutting down",
             siginfo.ssi_signo, strsignal(siginfo.ssi_signo));
    }
    interrupted = true;
  }
}

}  // namespace stagehand
