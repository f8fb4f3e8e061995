// Copyright 2026 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "util/log.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace sha256zk {

namespace {
LogLevel current_level = INFO;

double elapsed_seconds() {
  static const auto start = std::chrono::steady_clock::now();
  std::chrono::duration<double> d = std::chrono::steady_clock::now() - start;
  return d.count();
}

const char* level_name(LogLevel l) {
  switch (l) {
    case INFO:
      return "I";
    case WARNING:
      return "W";
    case ERROR:
      return "E";
  }
  return "?";
}
}  // namespace

void set_log_level(LogLevel l) { current_level = l; }

LogLevel log_level() { return current_level; }

void log(LogLevel l, const char* format, ...) {
  if (l < current_level) return;
  fprintf(stderr, "%s %9.3fs ", level_name(l), elapsed_seconds());
  va_list ap;
  va_start(ap, format);
  vfprintf(stderr, format, ap);
  va_end(ap);
}

}  // namespace sha256zk
