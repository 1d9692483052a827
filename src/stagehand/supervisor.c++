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

#include "supervisor.h"
#include <kj/debug.h>
#include <signal.h>

namespace stagehand {

kj::StringPtr KJ_STRINGIFY(State state) {
  switch (state) {
    case State::INIT: return "INIT";
    case State::LAUNCH_SUBSYSTEM: return "LAUNCH_SUBSYSTEM";
    case State::AWAIT_READY: return "AWAIT_READY";
    case State::LAUNCH_MAIN: return "LAUNCH_MAIN";
    case State::RUNNING: return "RUNNING";
    case State::RESTARTING: return "RESTARTING";
    case State::ABORTED: return "ABORTED";
    case State::TERMINATED: return "TERMINATED";
  }
  KJ_UNREACHABLE;
}

static bool isTerminal(State state) {
  return state == State::ABORTED || state == State::TERMINATED;
}

static kj::String seconds(kj::Duration duration) {
  int64_t ms = duration / kj::MILLISECONDS;
  return kj::str(ms / 1000, '.', (ms % 1000) / 100, 's');
}

static void logBanner() {
  KJ_LOG(INFO, "==================================================");
}

static constexpr uint FAILURE_WARNING_COUNT = 30;
// Consecutive failed reads after which we warn that the subsystem may be unhealthy.

Supervisor::Supervisor(const Config& config, ChildLauncher& launcher, HealthProbe& probe,
                       Ticker& ticker)
    : config(config), launcher(launcher), probe(probe), ticker(ticker),
      subsystemCommand(stagehand::subsystemCommand(config)),
      mainCommand(stagehand::mainCommand(config)),
      channel(healthChannel(config)),
      restartPolicy(config.maxRestarts),
      lastReading(kj::str("(none)")) {}

Supervisor::~Supervisor() noexcept(false) {
  // run() normally shuts down on its own. This covers a Supervisor that is destroyed while an
  // exception propagates out of run().
  shutdown();
}

int Supervisor::run() {
  KJ_REQUIRE(state == State::INIT, "Supervisor::run() can only be called once", state);

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    while (!isTerminal(state)) {
      if (ticker.isInterrupted()) {
        transition(interrupted());
        break;
      }

      switch (state) {
        case State::INIT: transition(State::LAUNCH_SUBSYSTEM); break;
        case State::LAUNCH_SUBSYSTEM: transition(launchSubsystem()); break;
        case State::AWAIT_READY: transition(awaitReady()); break;
        case State::RESTARTING: transition(restartSubsystem()); break;
        case State::LAUNCH_MAIN: transition(launchMain()); break;
        case State::RUNNING: transition(monitor()); break;
        case State::ABORTED:
        case State::TERMINATED:
          break;
      }
    }
  })) {
    transition(abort(kj::str("unexpected error: ", exception->getDescription())));
  }

  shutdown();

  if (state == State::ABORTED) {
    KJ_LOG(ERROR, "startup supervisor aborted", outcome);
    return 1;
  } else {
    KJ_LOG(INFO, "startup supervisor finished", outcome);
    return 0;
  }
}

void Supervisor::transition(State next) {
  if (next != state) {
    KJ_LOG(INFO, "state change", state, next);
    state = next;
  }
}

// =======================================================================================
// Startup

State Supervisor::launchSubsystem() {
  KJ_IF_MAYBE(child, tryLaunch(subsystemCommand)) {
    subsystem = kj::mv(*child);
  } else {
    return abort(kj::str("failed to launch subsystem"));
  }

  if (!settle()) return interrupted();
  return State::AWAIT_READY;
}

bool Supervisor::settle() {
  KJ_LOG(INFO, "waiting for subsystem to initialize", seconds(config.settleDelay));
  if (!ticker.sleep(config.settleDelay)) return false;

  windowStart = ticker.now();
  liveness.recordReset(windowStart);
  consecutiveFailures = 0;
  return true;
}

State Supervisor::awaitReady() {
  KJ_LOG(INFO, "waiting for target state", channel, config.stateField, config.targetState,
         seconds(config.readyTimeout));

  for (;;) {
    auto now = ticker.now();
    auto elapsed = now - windowStart;

    if (elapsed >= config.readyTimeout) {
      return abort(kj::str("readiness timeout: ", channel, " did not report ", config.stateField,
                           " = ", config.targetState, " within ", seconds(config.readyTimeout),
                           " (last reading: ", lastReading, ")"));
    }

    if (liveness.isStale(now, config.staleThreshold)) {
      auto since = KJ_ASSERT_NONNULL(liveness.sinceLastSuccess(now));
      KJ_LOG(WARNING, "no successful status read within the stale threshold",
             seconds(since), seconds(config.staleThreshold));
      return State::RESTARTING;
    }

    auto result = probe.probe(channel, config.probeTimeout);
    kj::String reading;
    KJ_SWITCH_ONEOF(result) {
      KJ_CASE_ONEOF(value, kj::String) {
        liveness.recordSuccess(ticker.now());
        consecutiveFailures = 0;
        if (value == config.targetState) {
          KJ_LOG(INFO, "subsystem reached target state", value, seconds(elapsed));
          return State::LAUNCH_MAIN;
        }
        lastReading = kj::str(config.stateField, " = ", value);
        reading = kj::str(lastReading);
      }
      KJ_CASE_ONEOF(failure, ProbeFailure) {
        ++consecutiveFailures;
        lastReading = kj::str(failure.kind, ": ", failure.detail);
        reading = kj::str("read failed (", failure.kind, ")");
        if (consecutiveFailures == FAILURE_WARNING_COUNT) {
          KJ_LOG(WARNING, "status reads keep failing; the subsystem may be unhealthy",
                 consecutiveFailures, failure.detail);
        }
      }
    }

    auto sinceSuccess = KJ_ASSERT_NONNULL(liveness.sinceLastSuccess(ticker.now()));
    auto progress = kj::str(reading, ", ", seconds(elapsed), " of ",
                            seconds(config.readyTimeout), ", last good read ",
                            seconds(sinceSuccess), " ago");
    KJ_LOG(INFO, "not ready yet", progress);

    if (!ticker.sleep(config.pollInterval)) return interrupted();
  }
}

State Supervisor::restartSubsystem() {
  if (!restartPolicy.mayRestart()) {
    return abort(kj::str("subsystem unresponsive after ", restartPolicy.getMaxAttempts(),
                         " restart attempts; restart budget exhausted"));
  }

  restartPolicy.recordAttempt();
  consecutiveFailures = 0;
  uint attempt = restartPolicy.getAttempts();
  uint maxAttempts = restartPolicy.getMaxAttempts();
  KJ_LOG(WARNING, "restarting subsystem", attempt, maxAttempts);

  stopChild(subsystem, subsystemCommand.title);

  if (!ticker.sleep(config.restartPause)) return interrupted();

  KJ_IF_MAYBE(child, tryLaunch(subsystemCommand)) {
    subsystem = kj::mv(*child);
  } else {
    // The liveness clock is left alone, so the next check sees staleness again and either
    // retries or gives up.
    KJ_LOG(ERROR, "subsystem relaunch failed", attempt, maxAttempts);
    return State::AWAIT_READY;
  }

  if (!settle()) return interrupted();
  return State::AWAIT_READY;
}

State Supervisor::launchMain() {
  KJ_IF_MAYBE(child, tryLaunch(mainCommand)) {
    mainProcess = kj::mv(*child);
  } else {
    return abort(kj::str("failed to launch main process"));
  }

  logBanner();
  KJ_LOG(INFO, "All launches started successfully");
  logBanner();
  return State::RUNNING;
}

kj::Maybe<kj::Own<Subprocess>> Supervisor::tryLaunch(const Command& command) {
  auto commandLine = kj::strArray(command.argv, " ");
  logBanner();
  KJ_LOG(INFO, "Starting", command.title, commandLine);

  kj::Maybe<kj::Own<Subprocess>> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = launcher.launch(command);
  })) {
    KJ_LOG(ERROR, "launch failed", command.title, exception->getDescription());
    return nullptr;
  }
  return kj::mv(result);
}

// =======================================================================================
// Supervision

State Supervisor::monitor() {
  KJ_LOG(INFO, "monitoring processes; interrupt to shut down");

  for (;;) {
    KJ_IF_MAYBE(status, mainProcess->tryReap()) {
      outcome = kj::str(mainCommand.title, " exited (", describeWaitStatus(*status), ")");
      KJ_LOG(WARNING, "main process exited", describeWaitStatus(*status));
      return State::TERMINATED;
    }
    if (subsystem.get() != nullptr) {
      KJ_IF_MAYBE(status, subsystem->tryReap()) {
        outcome = kj::str(subsystemCommand.title, " exited (", describeWaitStatus(*status), ")");
        KJ_LOG(WARNING, "subsystem exited", describeWaitStatus(*status));
        return State::TERMINATED;
      }
    }

    if (!ticker.sleep(config.monitorInterval)) return interrupted();
  }
}

State Supervisor::abort(kj::String reason) {
  outcome = kj::mv(reason);
  return State::ABORTED;
}

State Supervisor::interrupted() {
  KJ_LOG(INFO, "interrupted; shutting down", state);
  outcome = kj::str("interrupted during ", state);
  return State::TERMINATED;
}

// =======================================================================================
// Shutdown

void Supervisor::shutdown() {
  if (shutDown) return;
  shutDown = true;

  // Reverse launch order.
  stopChild(mainProcess, mainCommand.title);
  stopChild(subsystem, subsystemCommand.title);
}

void Supervisor::stopChild(kj::Own<Subprocess>& child, kj::StringPtr role) {
  if (child.get() == nullptr) return;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    if (!child->isRunning()) return;

    auto pid = child->getPid();
    KJ_LOG(INFO, "stopping", role, pid);
    child->signal(SIGINT);

    KJ_IF_MAYBE(status, child->waitForExitOrSignal(config.stopTimeout)) {
      KJ_LOG(INFO, "stopped", role, describeWaitStatus(*status));
    } else {
      KJ_LOG(WARNING, "did not exit in time; killing", role, pid, seconds(config.stopTimeout));
      child->signal(SIGKILL);
      KJ_LOG(INFO, "killed", role, describeWaitStatus(child->waitForExitOrSignal()));
    }
  })) {
    KJ_LOG(ERROR, "failed to stop child process", role, *exception);
  }

  // If anything above failed, Subprocess's destructor still kills and reaps the child.
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    child = nullptr;
  })) {
    KJ_LOG(ERROR, "failed to reap child process", role, *exception);
  }
}

}  // namespace stagehand
