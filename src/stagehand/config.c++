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
#include <kj/debug.h>
#include <stdlib.h>

namespace stagehand {

static bool isDigits(kj::ArrayPtr<const char> text) {
  if (text.size() == 0) return false;
  for (char c: text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

kj::Duration parseDuration(kj::StringPtr value) {
  kj::Duration unit = kj::SECONDS;
  kj::ArrayPtr<const char> digits = value;
  if (value.endsWith("ms")) {
    unit = kj::MILLISECONDS;
    digits = value.slice(0, value.size() - 2);
  } else if (value.endsWith("s")) {
    digits = value.slice(0, value.size() - 1);
  }

  KJ_REQUIRE(isDigits(digits), "invalid duration", value);
  KJ_IF_MAYBE(n, parseUInt(kj::heapString(digits), 10)) {
    kj::Duration result = *n * unit;
    KJ_REQUIRE(result <= MAX_DURATION, "duration too long", value);
    return result;
  } else {
    KJ_FAIL_REQUIRE("invalid duration", value);
  }
}

static uint parseCount(kj::StringPtr key, kj::StringPtr value) {
  if (isDigits(value)) {
    KJ_IF_MAYBE(n, parseUInt(value, 10)) {
      return *n;
    }
  }
  KJ_FAIL_REQUIRE("invalid config value", key, value);
}

static kj::String requireCommand(kj::StringPtr key, kj::String value) {
  KJ_REQUIRE(splitSpace(value).size() > 0, "config value must name a command", key);
  return kj::mv(value);
}

void applyConfigText(Config& config, kj::StringPtr text) {
  auto lines = splitLines(text);
  for (auto& line: lines) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "ROBOT_NAME") {
      KJ_REQUIRE(value.size() > 0, "invalid config value ROBOT_NAME", value);
      config.robotName = kj::mv(value);
    } else if (key == "WORKSPACE_ROOT") {
      config.workspaceRoot = kj::mv(value);
    } else if (key == "SUBSYSTEM_COMMAND") {
      config.subsystemCommand = requireCommand(key, kj::mv(value));
    } else if (key == "MAIN_COMMAND") {
      config.mainCommand = requireCommand(key, kj::mv(value));
    } else if (key == "PROBE_COMMAND") {
      config.probeCommand = requireCommand(key, kj::mv(value));
    } else if (key == "CHANNEL_TEMPLATE") {
      KJ_REQUIRE(value.size() > 0, "invalid config value CHANNEL_TEMPLATE", value);
      config.channelTemplate = kj::mv(value);
    } else if (key == "STATE_FIELD") {
      KJ_REQUIRE(value.size() > 0 && value.findFirst(':') == nullptr,
                 "invalid config value STATE_FIELD", value);
      config.stateField = kj::mv(value);
    } else if (key == "TARGET_STATE") {
      KJ_REQUIRE(value.size() > 0, "invalid config value TARGET_STATE", value);
      config.targetState = kj::mv(value);
    } else if (key == "ENV") {
      KJ_IF_MAYBE(pos, value.findFirst('=')) {
        KJ_REQUIRE(*pos > 0, "invalid config value ENV", value);
      } else {
        KJ_FAIL_REQUIRE("invalid config value ENV; expected NAME=VALUE", value);
      }
      config.environment.add(kj::mv(value));
    } else if (key == "SETTLE_DELAY") {
      config.settleDelay = parseDuration(value);
    } else if (key == "POLL_INTERVAL") {
      config.pollInterval = parseDuration(value);
    } else if (key == "READY_TIMEOUT") {
      config.readyTimeout = parseDuration(value);
    } else if (key == "STALE_THRESHOLD") {
      config.staleThreshold = parseDuration(value);
    } else if (key == "PROBE_TIMEOUT") {
      config.probeTimeout = parseDuration(value);
    } else if (key == "STOP_TIMEOUT") {
      config.stopTimeout = parseDuration(value);
    } else if (key == "RESTART_PAUSE") {
      config.restartPause = parseDuration(value);
    } else if (key == "MONITOR_INTERVAL") {
      config.monitorInterval = parseDuration(value);
    } else if (key == "MAX_RESTARTS") {
      config.maxRestarts = parseCount(key, value);
    } else if (key == "LOG_FILE") {
      if (value.size() == 0) {
        config.logFile = nullptr;
      } else {
        config.logFile = kj::mv(value);
      }
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }
}

Config readConfig(kj::Maybe<kj::StringPtr> path) {
  Config config;

  const char* robotName = getenv("ROBOT_NAME");
  if (robotName != nullptr && *robotName != '\0') {
    config.robotName = kj::str(robotName);
  }

  KJ_IF_MAYBE(p, path) {
    applyConfigText(config, readAll(*p));
  }

  return config;
}

// =======================================================================================

kj::String expandTemplate(const Config& config, kj::StringPtr text) {
  auto withRobot = replaceAll(text, "{robot}", config.robotName);
  return replaceAll(withRobot, "{workspace}", config.workspaceRoot);
}

kj::String healthChannel(const Config& config) {
  return expandTemplate(config, config.channelTemplate);
}

kj::Array<kj::String> childEnvironment(const Config& config) {
  kj::Vector<kj::String> result(config.environment.size() + 2);
  result.add(kj::str("PYTHONUNBUFFERED=1"));
  result.add(kj::str("ROSCONSOLE_STDOUT_LINE_BUFFERED=1"));
  for (auto& entry: config.environment) {
    result.add(kj::str(entry));
  }
  return result.releaseAsArray();
}

static Command makeCommand(const Config& config, kj::StringPtr title, kj::StringPtr line) {
  auto expanded = expandTemplate(config, line);
  auto words = splitSpace(expanded);
  KJ_REQUIRE(words.size() > 0, "empty command", title);
  return Command {
    kj::str(title),
    KJ_MAP(word, words) { return kj::str(word); },
    childEnvironment(config)
  };
}

Command subsystemCommand(const Config& config) {
  return makeCommand(config, "subsystem", config.subsystemCommand);
}

Command mainCommand(const Config& config) {
  return makeCommand(config, "main", config.mainCommand);
}

Command probeCommand(const Config& config) {
  return makeCommand(config, "probe", config.probeCommand);
}

}  // namespace stagehand
