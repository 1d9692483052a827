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

#ifndef STAGEHAND_HEALTH_PROBE_H_
#define STAGEHAND_HEALTH_PROBE_H_

#include "process.h"
#include <kj/one-of.h>
#include <kj/time.h>

namespace stagehand {

struct ProbeFailure {
  enum class Kind {
    TIMEOUT,
    // The query did not finish within the per-probe bound.

    ERROR,
    // The query could not be run or reported failure (non-zero exit, killed, ...).

    FIELD_MISSING
    // The query succeeded but its output had no line for the requested field.
  };

  Kind kind;
  kj::String detail;
};

kj::StringPtr KJ_STRINGIFY(ProbeFailure::Kind kind);

typedef kj::OneOf<kj::String, ProbeFailure> ProbeResult;
// Either the field's value or the reason it could not be read.

ProbeResult probeValue(kj::String value);
ProbeResult probeFailure(ProbeFailure::Kind kind, kj::String detail);

class HealthProbe {
  // Reads one field from the status channel of the subsystem. Each call is a single bounded
  // query; retrying is up to the caller.

public:
  virtual ProbeResult probe(kj::StringPtr channel, kj::Duration timeout) = 0;
};

kj::Maybe<kj::String> findField(kj::StringPtr text, kj::StringPtr key);
// Scans `text` line by line for a line starting exactly with "<key>:" and returns what follows,
// up to the next colon or the end of the line, trimmed. Indented lines do not match, so nested
// fields with the same name are ignored.

class CommandHealthProbe: public HealthProbe {
  // Runs an external query command once per probe (e.g. `rostopic echo -n 1 <channel>`) with
  // the channel name appended as the last argument, captures its output, and extracts `field`.

public:
  CommandHealthProbe(Command command, kj::String field);

  ProbeResult probe(kj::StringPtr channel, kj::Duration timeout) override;
  // Never throws: a query that cannot be run at all is reported as ERROR.

private:
  Command command;
  kj::String field;

  ProbeResult query(kj::StringPtr channel, kj::Duration timeout);
};

}  // namespace stagehand

#endif  // STAGEHAND_HEALTH_PROBE_H_
