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

#include <kj/main.h>
#include <kj/debug.h>
#include <signal.h>
#include <unistd.h>
#include "version.h"
#include "config.h"
#include "health-probe.h"
#include "log.h"
#include "supervisor.h"

namespace stagehand {

class StagehandMain {
  // Main class for the robot startup supervisor. Starts the robot state subsystem, waits until
  // it reports the target state, then starts the main robot stack and watches both until one
  // exits or we are interrupted.

public:
  StagehandMain(kj::ProcessContext& context): context(context) {
    // Make sure we didn't inherit a weird signal mask from the parent process. Children inherit
    // whatever we have here until Subprocess resets it.
    sigset_t sigset;
    KJ_SYSCALL(sigemptyset(&sigset));
    KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigset, nullptr));
  }

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Stagehand version " STAGEHAND_VERSION,
            "Launches the robot state subsystem, waits until its health channel reports the "
            "target state, then launches the main robot stack and supervises both. A subsystem "
            "that stops answering is restarted a limited number of times before giving up.\n\n"
            "Exits with status 0 after a normal run or an interrupt (SIGINT, SIGTERM, SIGHUP), "
            "and 1 if startup had to be aborted.")
        .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile), "<path>",
            "Read settings from <path>, one KEY=VALUE per line.")
        .addOptionWithArg({"robot-name"}, KJ_BIND_METHOD(*this, setRobotName), "<name>",
            "Use <name> as the robot identifier in the health channel and commands. Overrides "
            "$ROBOT_NAME and the config file.")
        .addOptionWithArg({"target-state"}, KJ_BIND_METHOD(*this, setTargetState), "<value>",
            "Consider the subsystem ready once the state field reads <value>.")
        .addOptionWithArg({"log-file"}, KJ_BIND_METHOD(*this, setLogFile), "<path>",
            "Also append log lines to <path>, rotating it at startup once it reaches 10MiB.")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
            "Log DEBUG lines too, such as raw health channel output.")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

  kj::MainBuilder::Validity setConfigFile(kj::StringPtr arg) {
    if (access(arg.cStr(), R_OK) != 0) {
      return "not found";
    }
    configFile = arg;
    return true;
  }

  kj::MainBuilder::Validity setRobotName(kj::StringPtr arg) {
    if (arg.size() == 0) return "must not be empty";
    robotName = arg;
    return true;
  }

  kj::MainBuilder::Validity setTargetState(kj::StringPtr arg) {
    if (arg.size() == 0) return "must not be empty";
    targetState = arg;
    return true;
  }

  kj::MainBuilder::Validity setLogFile(kj::StringPtr arg) {
    if (arg.size() == 0) return "must not be empty";
    logFile = arg;
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    verbose = true;
    return true;
  }

  kj::MainBuilder::Validity run() {
    Config config;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      config = readConfig(configFile);
    })) {
      context.exitError(kj::str("invalid configuration: ", exception->getDescription()));
    }

    // Command-line flags take precedence over the environment and config file.
    KJ_IF_MAYBE(name, robotName) {
      config.robotName = kj::str(*name);
    }
    KJ_IF_MAYBE(state, targetState) {
      config.targetState = kj::str(*state);
    }
    KJ_IF_MAYBE(path, logFile) {
      config.logFile = kj::str(*path);
    }

    kj::Maybe<kj::AutoCloseFd> logFd;
    KJ_IF_MAYBE(path, config.logFile) {
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        logFd = openLogFile(*path);
      })) {
        context.exitError(kj::str("can't open log file: ", exception->getDescription()));
      }
    }

    int status;
    kj::String outcome;
    {
      ConsoleLog log(verbose, kj::mv(logFd));
      kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);

      KJ_LOG(INFO, "Stagehand " STAGEHAND_VERSION " starting", config.robotName,
             config.workspaceRoot);

      SignalTicker ticker;
      SubprocessLauncher launcher;
      CommandHealthProbe probe(probeCommand(config), kj::str(config.stateField));
      Supervisor supervisor(config, launcher, probe, ticker);

      status = supervisor.run();
      outcome = kj::str(supervisor.getOutcome());
    }

    if (status == 0) {
      context.exit();
    } else {
      context.exitError(kj::str("startup aborted: ", outcome));
    }
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::StringPtr> configFile;
  kj::Maybe<kj::StringPtr> robotName;
  kj::Maybe<kj::StringPtr> targetState;
  kj::Maybe<kj::StringPtr> logFile;
  bool verbose = false;
};

}  // namespace stagehand

KJ_MAIN(stagehand::StagehandMain)
