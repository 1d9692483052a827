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

#include "health-probe.h"
#include <kj/debug.h>
#include <errno.h>
#include <limits.h>
#include <string.h>
#include <poll.h>
#include <sys/wait.h>

namespace stagehand {

kj::StringPtr KJ_STRINGIFY(ProbeFailure::Kind kind) {
  switch (kind) {
    case ProbeFailure::Kind::TIMEOUT: return "timeout";
    case ProbeFailure::Kind::ERROR: return "error";
    case ProbeFailure::Kind::FIELD_MISSING: return "field missing";
  }
  KJ_UNREACHABLE;
}

ProbeResult probeValue(kj::String value) {
  ProbeResult result;
  result.init<kj::String>(kj::mv(value));
  return result;
}

ProbeResult probeFailure(ProbeFailure::Kind kind, kj::String detail) {
  ProbeResult result;
  result.init<ProbeFailure>(ProbeFailure { kind, kj::mv(detail) });
  return result;
}

kj::Maybe<kj::String> findField(kj::StringPtr text, kj::StringPtr key) {
  for (auto line: split(text, '\n')) {
    if (line.size() > key.size() && line[key.size()] == ':' &&
        memcmp(line.begin(), key.begin(), key.size()) == 0) {
      // The value ends at the next colon, if any.
      auto rest = line.slice(key.size() + 1, line.size());
      size_t end = 0;
      while (end < rest.size() && rest[end] != ':') ++end;
      return trim(rest.slice(0, end));
    }
  }
  return nullptr;
}

// =======================================================================================

namespace {

struct OutputCollector {
  // Accumulates everything written to one end of a pipe until EOF.

  explicit OutputCollector(kj::AutoCloseFd fd): fd(kj::mv(fd)) {}

  kj::AutoCloseFd fd;
  kj::Vector<char> content;

  bool isOpen() { return fd.get() >= 0; }

  void drain() {
    char buffer[4096];
    ssize_t n;
    KJ_NONBLOCKING_SYSCALL(n = read(fd, buffer, sizeof(buffer)));
    if (n == 0) {
      fd = nullptr;
    } else if (n > 0) {
      content.addAll(buffer, buffer + n);
    }
  }

  kj::String text() {
    return kj::heapString(content.asPtr());
  }
};

}  // namespace

CommandHealthProbe::CommandHealthProbe(Command command, kj::String field)
    : command(kj::mv(command)), field(kj::mv(field)) {
  KJ_REQUIRE(this->command.argv.size() > 0, "probe command is empty");
}

ProbeResult CommandHealthProbe::probe(kj::StringPtr channel, kj::Duration timeout) {
  // Nothing that goes wrong while querying is fatal to the caller; it's just a failed read.
  kj::Maybe<ProbeResult> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = query(channel, timeout);
  })) {
    return probeFailure(ProbeFailure::Kind::ERROR,
        kj::str("could not query ", channel, ": ", exception->getDescription()));
  }
  return kj::mv(KJ_ASSERT_NONNULL(result));
}

ProbeResult CommandHealthProbe::query(kj::StringPtr channel, kj::Duration timeout) {
  auto deadline = monotonicNow() + timeout;

  kj::Vector<kj::StringPtr> argv;
  for (auto& arg: command.argv) argv.add(arg);
  argv.add(channel);

  auto environment = overlayEnvironment(currentEnvironment(), command.environment);
  auto envPtrs = KJ_MAP(entry, environment) -> const kj::StringPtr { return entry; };

  auto outPipe = Pipe::make();
  auto errPipe = Pipe::make();
  Subprocess::Options options(argv.asPtr());
  options.stdout = outPipe.writeEnd;
  options.stderr = errPipe.writeEnd;
  options.environment = envPtrs.asPtr();

  auto child = kj::heap<Subprocess>(kj::mv(options));
  outPipe.writeEnd = nullptr;
  errPipe.writeEnd = nullptr;

  OutputCollector out(kj::mv(outPipe.readEnd));
  OutputCollector err(kj::mv(errPipe.readEnd));

  // Read until the child closes both streams. If the deadline passes first, the child is killed
  // by Subprocess's destructor.
  while (out.isOpen() || err.isOpen()) {
    auto now = monotonicNow();
    if (now >= deadline) {
      return probeFailure(ProbeFailure::Kind::TIMEOUT,
          kj::str("no answer from ", channel, " within ", timeout / kj::MILLISECONDS, "ms"));
    }

    struct pollfd fds[2];
    fds[0].fd = out.fd.get();
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = err.fd.get();  // poll() ignores negative FDs
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    // Round up so we never spin with a zero timeout just short of the deadline.
    kj::Duration remaining = deadline - now;
    int64_t remainingMs = (remaining + kj::MILLISECONDS - 1 * kj::NANOSECONDS) / kj::MILLISECONDS;
    int pollTimeout = kj::min(remainingMs, int64_t(INT_MAX));
    int n;
    KJ_SYSCALL(n = poll(fds, 2, pollTimeout));
    if (n == 0) continue;

    if (fds[0].revents != 0) out.drain();
    if (fds[1].revents != 0) err.drain();
  }

  int status;
  KJ_IF_MAYBE(s, child->waitForExitOrSignal(deadline - monotonicNow())) {
    status = *s;
  } else {
    return probeFailure(ProbeFailure::Kind::TIMEOUT,
        kj::str(command.title, " closed its output but did not exit in time"));
  }

  auto output = out.text();
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return probeFailure(ProbeFailure::Kind::ERROR,
        kj::str("failed to read ", channel, " (", describeWaitStatus(status), "): ",
                trim(err.text())));
  }

  KJ_LOG(DBG, "retrieved", channel, trim(output.slice(0, kj::min(output.size(), size_t(50)))));

  KJ_IF_MAYBE(value, findField(output, field)) {
    KJ_LOG(DBG, "parsed value", field, *value);
    return probeValue(kj::mv(*value));
  } else {
    return probeFailure(ProbeFailure::Kind::FIELD_MISSING,
        kj::str("no '", field, ":' line in output of ", channel));
  }
}

}  // namespace stagehand
