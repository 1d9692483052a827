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
#include "log.h"
#include <kj/test.h>
#include <kj/function.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace stagehand {
namespace {

class LogCapture: public kj::ExceptionCallback {
  // Collects WARNING and ERROR records from the code under test so they can be checked and do
  // not count as test failures. Records from this file, such as failed expectations, are passed
  // through to the test runner.

public:
  void logMessage(kj::LogSeverity severity, const char* file, int line, int contextDepth,
                  kj::String&& text) override {
    if (kj::StringPtr(file).endsWith("-test.c++")) {
      kj::ExceptionCallback::logMessage(severity, file, line, contextDepth, kj::mv(text));
    } else {
      records.add(kj::str(levelTag(severity), ' ', text));
    }
  }

  uint count(kj::StringPtr needle) {
    uint result = 0;
    for (auto& record: records) {
      if (strstr(record.cStr(), needle.cStr()) != nullptr) ++result;
    }
    return result;
  }

  kj::Vector<kj::String> records;
};

class FakeTicker: public Ticker {
  // Virtual time. Sleeping advances the clock instantly (plus a tiny real pause so that real
  // child processes make progress). An interrupt can be scheduled at a virtual time.

public:
  kj::TimePoint now() override { return current; }

  bool sleep(kj::Duration duration) override {
    if (interrupted) return false;
    usleep(200);
    KJ_IF_MAYBE(at, interruptAt) {
      if (current + duration >= *at) {
        current = *at;
        interrupted = true;
        return false;
      }
    }
    current += duration;
    return true;
  }

  bool isInterrupted() override { return interrupted; }

  kj::Duration elapsed() { return current - start(); }

  static kj::TimePoint start() { return kj::origin<kj::TimePoint>() + 1000 * kj::SECONDS; }
  kj::TimePoint current = start();
  kj::Maybe<kj::TimePoint> interruptAt;
  bool interrupted = false;
};

class FakeLauncher: public ChildLauncher {
  // Launches real processes, but can be told to fail chosen launches. Children started with
  // `sh <script> <name> <dir>` are waited on until the script reports that its signal trap is
  // installed.

public:
  uint subsystemLaunches = 0;
  uint mainLaunches = 0;
  uint failSubsystemAfter = kj::maxValue;
  bool failMain = false;

  kj::Own<Subprocess> launch(const Command& command) override {
    if (command.title == "subsystem") {
      ++subsystemLaunches;
      KJ_REQUIRE(subsystemLaunches <= failSubsystemAfter,
                 "failed to start child process", command.title);
    } else {
      ++mainLaunches;
      KJ_REQUIRE(!failMain, "failed to start child process", command.title);
    }

    kj::Maybe<kj::String> readyFile;
    if (command.argv.size() == 4 && command.argv[0] == "sh") {
      auto path = kj::str(command.argv[3], '/', command.argv[2], ".ready");
      unlink(path.cStr());
      readyFile = kj::mv(path);
    }

    auto child = real.launch(command);

    KJ_IF_MAYBE(path, readyFile) {
      auto deadline = monotonicNow() + 5 * kj::SECONDS;
      while (access(path->cStr(), F_OK) != 0) {
        KJ_ASSERT(monotonicNow() < deadline, "child script never became ready", *path);
        usleep(1000);
      }
    }
    return kj::mv(child);
  }

private:
  SubprocessLauncher real;
};

class FakeProbe: public HealthProbe {
public:
  struct Call {
    kj::Duration at;
    uint subsystemLaunches;
  };

  FakeProbe(FakeTicker& ticker, FakeLauncher& launcher,
            kj::Function<ProbeResult(uint subsystemLaunches)> script)
      : ticker(ticker), launcher(launcher), script(kj::mv(script)) {}

  ProbeResult probe(kj::StringPtr channel, kj::Duration timeout) override {
    KJ_EXPECT(channel == "/zj_humanoid/robot/robot_state", channel);
    calls.add(Call { ticker.elapsed(), launcher.subsystemLaunches });
    return script(launcher.subsystemLaunches);
  }

  kj::Vector<Call> calls;

private:
  FakeTicker& ticker;
  FakeLauncher& launcher;
  kj::Function<ProbeResult(uint)> script;
};

ProbeResult timedOut() {
  return probeFailure(ProbeFailure::Kind::TIMEOUT, kj::str("no answer within 5000ms"));
}

ProbeResult reading(kj::StringPtr value) {
  return probeValue(kj::str(value));
}

class TempDir {
public:
  TempDir() {
    char dirTemplate[] = "/tmp/stagehand-supervisor-test.XXXXXX";
    KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
    path = kj::heapString(dirTemplate);

    // Exits cleanly on SIGINT, logging its name to `stopped`.
    writeScript("graceful.sh",
        "trap 'echo $1 >> \"$2/stopped\"; exit 0' INT\n"
        "touch \"$2/$1.ready\"\n"
        "while :; do sleep 0.1; done\n");

    // Logs SIGINT but keeps running.
    writeScript("stubborn.sh",
        "trap 'echo $1 >> \"$2/stopped\"' INT\n"
        "touch \"$2/$1.ready\"\n"
        "while :; do sleep 0.1; done\n");

    // Exits with status 3 as soon as it has started.
    writeScript("exits.sh",
        "touch \"$2/$1.ready\"\n"
        "exit 3\n");
  }

  ~TempDir() noexcept(false) {
    Subprocess({"rm", "-rf", path}).waitForSuccess();
  }

  kj::String command(kj::StringPtr script, kj::StringPtr name) {
    return kj::str("sh ", path, '/', script, ' ', name, ' ', path);
  }

  kj::String stopped() {
    auto file = kj::str(path, "/stopped");
    if (access(file.cStr(), F_OK) != 0) return kj::str();
    return readAll(file);
  }

  kj::String path;

private:
  void writeScript(kj::StringPtr name, kj::StringPtr content) {
    auto fd = raiiOpen(kj::str(path, '/', name), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
    KJ_SYSCALL(write(fd, content.begin(), content.size()));
  }
};

Config testConfig(kj::StringPtr subsystem, kj::StringPtr main) {
  Config config;
  config.robotName = kj::str("zj_humanoid");
  config.subsystemCommand = kj::str(subsystem);
  config.mainCommand = kj::str(main);
  config.stopTimeout = 2 * kj::SECONDS;
  return config;
}

// =======================================================================================

KJ_TEST("Supervisor launches main once the target state is read") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "true");
  FakeTicker ticker;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("5"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);

  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_ASSERT(probe.calls.size() == 1);
  KJ_EXPECT(probe.calls[0].at == 5 * kj::SECONDS);
  KJ_EXPECT(launcher.subsystemLaunches == 1);
  KJ_EXPECT(launcher.mainLaunches == 1);
  KJ_EXPECT(supervisor.getRestartAttempts() == 0);
  KJ_EXPECT(supervisor.getOutcome() == "main exited (exit code 0)", supervisor.getOutcome());

  KJ_EXPECT_THROW_MESSAGE("can only be called once", supervisor.run());
}

KJ_TEST("Supervisor waits through non-target readings") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 20 * kj::SECONDS;
  FakeLauncher launcher;
  uint reads = 0;
  FakeProbe probe(ticker, launcher, [&reads](uint) {
    return ++reads < 3 ? reading("2") : reading("5");
  });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_EXPECT(supervisor.getOutcome() == "interrupted during RUNNING", supervisor.getOutcome());
  KJ_EXPECT(launcher.subsystemLaunches == 1);
  KJ_EXPECT(launcher.mainLaunches == 1);
  KJ_EXPECT(supervisor.getRestartAttempts() == 0);

  // Main starts right after the first target reading; there are no further reads.
  KJ_ASSERT(probe.calls.size() == 3);
  KJ_EXPECT(probe.calls[0].at == 5 * kj::SECONDS);
  KJ_EXPECT(probe.calls[1].at == 6 * kj::SECONDS);
  KJ_EXPECT(probe.calls[2].at == 7 * kj::SECONDS);
}

KJ_TEST("Supervisor terminates when the subsystem exits while running") {
  LogCapture logs;
  TempDir dir;
  auto config = testConfig(dir.command("exits.sh", "subsystem"),
                           dir.command("graceful.sh", "main"));
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 100000 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("5"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_EXPECT(supervisor.getOutcome() == "subsystem exited (exit code 3)",
            supervisor.getOutcome());
  KJ_EXPECT(launcher.mainLaunches == 1);
  KJ_EXPECT(supervisor.getRestartAttempts() == 0);
  KJ_EXPECT(logs.count("WARN subsystem exited") == 1);

  // Only main was still running to be stopped.
  KJ_EXPECT(dir.stopped() == "main\n", dir.stopped());
}

KJ_TEST("Supervisor restarts a stale subsystem exactly once") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 60 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint launches) {
    return launches < 2 ? timedOut() : reading("5");
  });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_EXPECT(supervisor.getRestartAttempts() == 1);
  KJ_EXPECT(launcher.subsystemLaunches == 2);
  KJ_EXPECT(launcher.mainLaunches == 1);
  KJ_EXPECT(logs.count("restarting subsystem") == 1);

  // Reads at 5s..20s all time out. At 21s nothing has succeeded for 16s, which is over the 15s
  // threshold, so the subsystem is restarted before the next read: stop, 2s pause, relaunch, 5s
  // settle.
  KJ_ASSERT(probe.calls.size() == 17);
  for (uint i = 0; i < 16; i++) {
    KJ_EXPECT(probe.calls[i].at == (5 + i) * kj::SECONDS);
    KJ_EXPECT(probe.calls[i].subsystemLaunches == 1);
  }
  KJ_EXPECT(probe.calls[16].at == 28 * kj::SECONDS);
  KJ_EXPECT(probe.calls[16].subsystemLaunches == 2);
}

KJ_TEST("Supervisor aborts when every relaunch fails") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  FakeTicker ticker;
  FakeLauncher launcher;
  launcher.failSubsystemAfter = 1;
  FakeProbe probe(ticker, launcher, [](uint) { return timedOut(); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 1);
  KJ_EXPECT(supervisor.getState() == State::ABORTED);
  KJ_EXPECT(supervisor.getRestartAttempts() == 3);
  KJ_EXPECT(launcher.subsystemLaunches == 4);
  KJ_EXPECT(launcher.mainLaunches == 0);
  KJ_EXPECT(logs.count("subsystem relaunch failed") == 3);
  KJ_EXPECT(logs.count("ERROR startup supervisor aborted") == 1);

  // No reads happen after the first restart; each failed relaunch leaves the subsystem stale.
  KJ_EXPECT(probe.calls.size() == 16);
  KJ_EXPECT(strstr(supervisor.getOutcome().cStr(), "restart budget exhausted") != nullptr,
            supervisor.getOutcome());
}

KJ_TEST("Supervisor aborts when the target state never arrives") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  FakeTicker ticker;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("2"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 1);
  KJ_EXPECT(supervisor.getState() == State::ABORTED);
  KJ_EXPECT(supervisor.getRestartAttempts() == 0);
  KJ_EXPECT(launcher.mainLaunches == 0);
  KJ_EXPECT(probe.calls.size() == 600);
  KJ_EXPECT(strstr(supervisor.getOutcome().cStr(), "readiness timeout") != nullptr,
            supervisor.getOutcome());
  KJ_EXPECT(strstr(supervisor.getOutcome().cStr(), "state = 2") != nullptr,
            supervisor.getOutcome());
  KJ_EXPECT(logs.count("readiness timeout") == 1);
}

KJ_TEST("Supervisor interrupt while running stops main, then the subsystem") {
  LogCapture logs;
  TempDir dir;
  auto config = testConfig(dir.command("graceful.sh", "subsystem"),
                           dir.command("graceful.sh", "main"));
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 10 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("5"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_EXPECT(supervisor.getOutcome() == "interrupted during RUNNING", supervisor.getOutcome());
  KJ_EXPECT(dir.stopped() == "main\nsubsystem\n", dir.stopped());
  KJ_EXPECT(logs.count("did not exit in time") == 0);
}

KJ_TEST("Supervisor interrupt while waiting for readiness") {
  LogCapture logs;
  TempDir dir;
  auto config = testConfig(dir.command("graceful.sh", "subsystem"), "sleep 30");
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 8 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("2"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(supervisor.getState() == State::TERMINATED);
  KJ_EXPECT(supervisor.getOutcome() == "interrupted during AWAIT_READY",
            supervisor.getOutcome());
  KJ_EXPECT(launcher.mainLaunches == 0);
  KJ_EXPECT(probe.calls.size() == 3);
  KJ_EXPECT(dir.stopped() == "subsystem\n", dir.stopped());
}

KJ_TEST("Supervisor kills a child that ignores SIGINT") {
  LogCapture logs;
  TempDir dir;
  auto config = testConfig(dir.command("stubborn.sh", "subsystem"), "sleep 30");
  config.stopTimeout = 300 * kj::MILLISECONDS;
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 7 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("2"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  auto start = monotonicNow();
  KJ_EXPECT(supervisor.run() == 0);
  auto elapsed = monotonicNow() - start;

  // The graceful signal always comes first.
  KJ_EXPECT(dir.stopped() == "subsystem\n", dir.stopped());
  KJ_EXPECT(logs.count("did not exit in time") == 1);
  KJ_EXPECT(elapsed >= 300 * kj::MILLISECONDS);
}

KJ_TEST("Supervisor aborts if the subsystem cannot be started") {
  LogCapture logs;
  auto config = testConfig("no-such-program-4b0e9c1d", "sleep 30");
  FakeTicker ticker;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("5"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 1);
  KJ_EXPECT(supervisor.getState() == State::ABORTED);
  KJ_EXPECT(supervisor.getOutcome() == "failed to launch subsystem", supervisor.getOutcome());
  KJ_EXPECT(probe.calls.size() == 0);
  KJ_EXPECT(launcher.mainLaunches == 0);
  KJ_EXPECT(logs.count("launch failed") == 1);
}

KJ_TEST("Supervisor aborts if main cannot be started and still stops the subsystem") {
  LogCapture logs;
  TempDir dir;
  auto config = testConfig(dir.command("graceful.sh", "subsystem"), "sleep 30");
  FakeTicker ticker;
  FakeLauncher launcher;
  launcher.failMain = true;
  FakeProbe probe(ticker, launcher, [](uint) { return reading("5"); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 1);
  KJ_EXPECT(supervisor.getState() == State::ABORTED);
  KJ_EXPECT(supervisor.getOutcome() == "failed to launch main process",
            supervisor.getOutcome());
  KJ_EXPECT(dir.stopped() == "subsystem\n", dir.stopped());
}

KJ_TEST("Supervisor restart opens a fresh readiness window") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  config.readyTimeout = 20 * kj::SECONDS;
  FakeTicker ticker;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return timedOut(); });

  // Each window goes stale after 16s, before its 20s deadline. Without the reset, the second
  // window would hit the deadline instead.
  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 1);
  KJ_EXPECT(supervisor.getRestartAttempts() == 3);
  KJ_EXPECT(launcher.subsystemLaunches == 4);
  KJ_EXPECT(logs.count("readiness timeout") == 0);
  KJ_EXPECT(strstr(supervisor.getOutcome().cStr(), "restart budget exhausted") != nullptr,
            supervisor.getOutcome());
}

KJ_TEST("Supervisor warns once about a long run of failed reads") {
  LogCapture logs;
  auto config = testConfig("sleep 30", "sleep 30");
  config.staleThreshold = 100 * kj::SECONDS;
  FakeTicker ticker;
  ticker.interruptAt = FakeTicker::start() + 45 * kj::SECONDS;
  FakeLauncher launcher;
  FakeProbe probe(ticker, launcher, [](uint) { return timedOut(); });

  Supervisor supervisor(config, launcher, probe, ticker);
  KJ_EXPECT(supervisor.run() == 0);
  KJ_EXPECT(probe.calls.size() == 40);
  KJ_EXPECT(logs.count("status reads keep failing") == 1);
  KJ_EXPECT(supervisor.getRestartAttempts() == 0);
}

}  // namespace
}  // namespace stagehand
