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

#ifndef STAGEHAND_SUPERVISOR_H_
#define STAGEHAND_SUPERVISOR_H_

#include "config.h"
#include "health-probe.h"
#include "process.h"
#include "recovery.h"
#include "ticker.h"

namespace stagehand {

enum class State {
  INIT,
  LAUNCH_SUBSYSTEM,
  AWAIT_READY,
  LAUNCH_MAIN,
  RUNNING,
  RESTARTING,
  ABORTED,
  TERMINATED
};

kj::StringPtr KJ_STRINGIFY(State state);

class Supervisor {
  // Runs the two-stage startup sequence:
  //
  // 1. Launch the subsystem (the process that publishes robot state) and give it a moment to
  //    come up.
  // 2. Poll the health channel until it reports the target state. If no read succeeds for longer
  //    than the stale threshold, stop and relaunch the subsystem, up to the restart budget. Each
  //    restart opens a fresh readiness window.
  // 3. Launch the main process and watch both children until one of them exits.
  //
  // Any interrupt (see Ticker) ends the run early. However the run ends, both children are
  // stopped exactly once: SIGINT, a bounded wait, then SIGKILL. The main process is stopped
  // before the subsystem.
  //
  // The Supervisor owns both child processes. Config, launcher, probe and ticker must outlive it.

public:
  Supervisor(const Config& config, ChildLauncher& launcher, HealthProbe& probe, Ticker& ticker);
  ~Supervisor() noexcept(false);
  KJ_DISALLOW_COPY(Supervisor);

  int run();
  // Runs until a terminal state is reached and all children are stopped. Returns the process
  // exit status: 0 for TERMINATED, 1 for ABORTED. Can only be called once.

  State getState() const { return state; }
  uint getRestartAttempts() const { return restartPolicy.getAttempts(); }

  kj::StringPtr getOutcome() const { return outcome; }
  // Why the run ended, e.g. "readiness timeout: ..." or "interrupted". Empty until then.

private:
  const Config& config;
  ChildLauncher& launcher;
  HealthProbe& probe;
  Ticker& ticker;

  Command subsystemCommand;
  Command mainCommand;
  kj::String channel;

  State state = State::INIT;
  LivenessTracker liveness;
  RestartPolicy restartPolicy;

  kj::Own<Subprocess> subsystem;
  kj::Own<Subprocess> mainProcess;

  kj::TimePoint windowStart = kj::origin<kj::TimePoint>();
  uint consecutiveFailures = 0;
  kj::String lastReading;

  kj::String outcome;
  bool shutDown = false;

  void transition(State next);

  State launchSubsystem();
  State awaitReady();
  State restartSubsystem();
  State launchMain();
  State monitor();

  State abort(kj::String reason);
  State interrupted();

  kj::Maybe<kj::Own<Subprocess>> tryLaunch(const Command& command);
  // Logs and returns null if the command could not be started.

  bool settle();
  // Waits out the settle delay after a subsystem launch, then opens a fresh readiness window.
  // Returns false if interrupted.

  void shutdown();
  void stopChild(kj::Own<Subprocess>& child, kj::StringPtr role);
};

}  // namespace stagehand

#endif  // STAGEHAND_SUPERVISOR_H_
