// Copyright 2025 Siddhant Biradar
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

#pragma once

#include <mutex>
#include <string>

namespace arialens {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

const char *log_level_name(LogLevel level);

// Process-wide diagnostics sink. Writes go to stderr only so stdout stays
// free for results and the request/response stream.
class Logger {
public:

    static Logger &instance();

    void set_level(LogLevel level);
    bool enabled(LogLevel level) const;

    void write(LogLevel level, const std::string &message);

private:

    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Warn;
};

void log_warn(const std::string &message);
void log_info(const std::string &message);
void log_debug(const std::string &message);

} // namespace arialens
