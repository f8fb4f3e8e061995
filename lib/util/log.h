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

#ifndef SHA256ZK_LIB_UTIL_LOG_H_
#define SHA256ZK_LIB_UTIL_LOG_H_

namespace sha256zk {

enum LogLevel { INFO = 0, WARNING = 1, ERROR = 2 };

// Messages below the current level are dropped.  The default is INFO.
void set_log_level(LogLevel l);
LogLevel log_level();

// printf-style logging to stderr, prefixed with the elapsed wall time.
void log(LogLevel l, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_UTIL_LOG_H_
