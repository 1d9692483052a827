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

#include "config.h"
#include <kj/test.h>
#include <stdlib.h>
#include <unistd.h>

namespace stagehand {
namespace {

KJ_TEST("parseDuration") {
  KJ_EXPECT(parseDuration("15") == 15 * kj::SECONDS);
  KJ_EXPECT(parseDuration("600s") == 600 * kj::SECONDS);
  KJ_EXPECT(parseDuration("250ms") == 250 * kj::MILLISECONDS);
  KJ_EXPECT(parseDuration("0") == 0 * kj::SECONDS);

  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration(""));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration("s"));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration("-5"));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration("5m"));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration("1.5s"));

  KJ_EXPECT(parseDuration("604800") == MAX_DURATION);
  KJ_EXPECT_THROW_MESSAGE("duration too long", parseDuration("604801"));
  KJ_EXPECT_THROW_MESSAGE("duration too long", parseDuration("4000000000"));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", parseDuration("4294967296ms"));
}

KJ_TEST("Config defaults") {
  Config config;
  KJ_EXPECT(healthChannel(config) == "/zj_humanoid/robot/robot_state");
  KJ_EXPECT(config.targetState == "5");
  KJ_EXPECT(config.readyTimeout == 600 * kj::SECONDS);
  KJ_EXPECT(config.staleThreshold == 15 * kj::SECONDS);
  KJ_EXPECT(config.maxRestarts == 3);

  auto subsystem = subsystemCommand(config);
  KJ_ASSERT(subsystem.argv.size() == 4);
  KJ_EXPECT(subsystem.argv[0] == "roslaunch");
  KJ_EXPECT(subsystem.argv[1] == "robot_state");
  KJ_EXPECT(subsystem.argv[2] == "robot_state.launch");
  KJ_EXPECT(subsystem.argv[3] == "--screen");

  auto mainLaunch = mainCommand(config);
  KJ_ASSERT(mainLaunch.argv.size() == 3);
  KJ_EXPECT(mainLaunch.argv[2] == "/home/nav01/zj_humanoid/startup/robot_startUp.launch");

  KJ_ASSERT(mainLaunch.environment.size() == 2);
  KJ_EXPECT(mainLaunch.environment[0] == "PYTHONUNBUFFERED=1");
  KJ_EXPECT(mainLaunch.environment[1] == "ROSCONSOLE_STDOUT_LINE_BUFFERED=1");

  auto probe = probeCommand(config);
  KJ_ASSERT(probe.argv.size() == 4);
  KJ_EXPECT(probe.argv[3] == "1");
}

KJ_TEST("applyConfigText") {
  Config config;
  applyConfigText(config,
      "# robot i2 on the bench\n"
      "\n"
      "ROBOT_NAME = i2\n"
      "WORKSPACE_ROOT=/opt/ws\n"
      "MAIN_COMMAND=roslaunch   --screen  {workspace}/launch/{robot}.launch\n"
      "TARGET_STATE=7  # fully up\n"
      "ENV=ROS_MASTER_URI=http://localhost:11311\n"
      "ENV=PYTHONUNBUFFERED=0\n"
      "READY_TIMEOUT=90s\n"
      "STALE_THRESHOLD=500ms\n"
      "MAX_RESTARTS=0\n"
      "LOG_FILE=/var/log/stagehand.log\n"
      "SOMETHING_ELSE=whatever\n");

  KJ_EXPECT(config.robotName == "i2");
  KJ_EXPECT(healthChannel(config) == "/i2/robot/robot_state");
  KJ_EXPECT(config.targetState == "7");
  KJ_EXPECT(config.readyTimeout == 90 * kj::SECONDS);
  KJ_EXPECT(config.staleThreshold == 500 * kj::MILLISECONDS);
  KJ_EXPECT(config.maxRestarts == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.logFile) == "/var/log/stagehand.log");

  auto mainLaunch = mainCommand(config);
  KJ_ASSERT(mainLaunch.argv.size() == 3);
  KJ_EXPECT(mainLaunch.argv[1] == "--screen");
  KJ_EXPECT(mainLaunch.argv[2] == "/opt/ws/launch/i2.launch");

  // Extra entries come after the built-in flags, so they win when layered in order.
  KJ_ASSERT(mainLaunch.environment.size() == 4);
  KJ_EXPECT(mainLaunch.environment[2] == "ROS_MASTER_URI=http://localhost:11311");
  auto layered = overlayEnvironment(nullptr, mainLaunch.environment);
  KJ_ASSERT(layered.size() == 3);
  KJ_EXPECT(layered[0] == "PYTHONUNBUFFERED=0");
}

KJ_TEST("applyConfigText rejects bad values") {
  Config config;
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", applyConfigText(config, "ROBOT_NAME\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid duration", applyConfigText(config, "POLL_INTERVAL=fast\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
                          applyConfigText(config, "MAX_RESTARTS=three\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
                          applyConfigText(config, "MAX_RESTARTS=4294967296\n"));
  KJ_EXPECT_THROW_MESSAGE("duration too long",
                          applyConfigText(config, "PROBE_TIMEOUT=4000000000\n"));
  KJ_EXPECT(config.maxRestarts == 3);
  KJ_EXPECT(config.probeTimeout == Config().probeTimeout);
  KJ_EXPECT_THROW_MESSAGE("invalid config value", applyConfigText(config, "ENV=NOVALUE\n"));
  KJ_EXPECT_THROW_MESSAGE("must name a command", applyConfigText(config, "MAIN_COMMAND=\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value TARGET_STATE",
                          applyConfigText(config, "TARGET_STATE=\n"));
}

KJ_TEST("readConfig layers the environment under the file") {
  char path[] = "/tmp/stagehand-config-test.XXXXXX";
  int fd;
  KJ_SYSCALL(fd = mkstemp(path));
  kj::AutoCloseFd ownFd(fd);
  KJ_DEFER(unlink(path));

  kj::StringPtr content = "WORKSPACE_ROOT=/srv/robot\n";
  KJ_SYSCALL(write(fd, content.begin(), content.size()));

  const char* saved = getenv("ROBOT_NAME");
  kj::Maybe<kj::String> savedCopy;
  if (saved != nullptr) savedCopy = kj::str(saved);
  KJ_DEFER({
    KJ_IF_MAYBE(s, savedCopy) {
      setenv("ROBOT_NAME", s->cStr(), 1);
    } else {
      unsetenv("ROBOT_NAME");
    }
  });

  setenv("ROBOT_NAME", "from_env", 1);
  {
    auto config = readConfig(kj::StringPtr(path));
    KJ_EXPECT(config.robotName == "from_env");
    KJ_EXPECT(config.workspaceRoot == "/srv/robot");
  }

  {
    kj::StringPtr more = "ROBOT_NAME=from_file\n";
    KJ_SYSCALL(write(fd, more.begin(), more.size()));
    auto config = readConfig(kj::StringPtr(path));
    KJ_EXPECT(config.robotName == "from_file");
  }

  unsetenv("ROBOT_NAME");
  {
    auto config = readConfig(nullptr);
    KJ_EXPECT(config.robotName == "zj_humanoid");
  }

  KJ_EXPECT_THROW(FAILED, readConfig(kj::StringPtr("/nonexistent/stagehand.conf")));
}

}  // namespace
}  // namespace stagehand
