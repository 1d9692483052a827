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

#ifndef STAGEHAND_CONFIG_H_
#define STAGEHAND_CONFIG_H_

#include "process.h"
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace stagehand {

struct Config {
  // Everything the supervisor needs to know, assembled once at startup. Command strings and the
  // channel template may contain `{robot}` and `{workspace}`, which are expanded when the
  // commands are built.

  kj::String robotName = kj::str("zj_humanoid");
  kj::String workspaceRoot = kj::str("/home/nav01/zj_humanoid");

  kj::String subsystemCommand = kj::str("roslaunch robot_state robot_state.launch --screen");
  kj::String mainCommand = kj::str("roslaunch --screen {workspace}/startup/robot_startUp.launch");
  kj::String probeCommand = kj::str("rostopic echo -n 1");
  // Whitespace-separated argv. The probe gets the channel name appended as its last argument.

  kj::String channelTemplate = kj::str("/{robot}/robot/robot_state");
  kj::String stateField = kj::str("state");
  kj::String targetState = kj::str("5");

  kj::Vector<kj::String> environment;
  // Extra NAME=VALUE entries for both children, applied after the built-in unbuffering flags.

  kj::Duration settleDelay = 5 * kj::SECONDS;
  kj::Duration pollInterval = 1 * kj::SECONDS;
  kj::Duration readyTimeout = 600 * kj::SECONDS;
  kj::Duration staleThreshold = 15 * kj::SECONDS;
  kj::Duration probeTimeout = 5 * kj::SECONDS;
  kj::Duration stopTimeout = 5 * kj::SECONDS;
  kj::Duration restartPause = 2 * kj::SECONDS;
  kj::Duration monitorInterval = 1 * kj::SECONDS;
  uint maxRestarts = 3;

  kj::Maybe<kj::String> logFile = nullptr;
};

constexpr kj::Duration MAX_DURATION = 7 * 24 * 3600 * kj::SECONDS;

kj::Duration parseDuration(kj::StringPtr value);
// "15" and "15s" are seconds, "250ms" milliseconds. Throws on anything else, and on durations
// longer than MAX_DURATION.

void applyConfigText(Config& config, kj::StringPtr text);
// Applies KEY=VALUE lines on top of `config`. Blank lines and `#` comments are skipped and
// unrecognized keys are logged and ignored. Throws if a line or value is malformed.

Config readConfig(kj::Maybe<kj::StringPtr> path);
// Built-in defaults, then the ROBOT_NAME environment variable, then the file at `path` if given.

kj::String expandTemplate(const Config& config, kj::StringPtr text);
// Substitutes `{robot}` and `{workspace}`.

kj::String healthChannel(const Config& config);

kj::Array<kj::String> childEnvironment(const Config& config);
// Unbuffered-output flags plus the configured extra entries.

Command subsystemCommand(const Config& config);
Command mainCommand(const Config& config);
Command probeCommand(const Config& config);

}  // namespace stagehand

#endif  // STAGEHAND_CONFIG_H_
