// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef BLOBXFER_BASE_LOGLEVEL_H_
#define BLOBXFER_BASE_LOGLEVEL_H_

#include <string>

namespace BX {

namespace Logging {

// Values match glog severities
struct LogLevel {
  enum Value { Info = 0, Warn = 1, Error = 2, Fatal = 3 };
};

// Return one of INFO, WARN, ERROR, FATAL
std::string GetLogLevelName(LogLevel::Value logLevel);

// Parse a level name, case insensitive, "warning" is accepted for Warn
//
// @param  : name, level to set
// @return : false if name is not a level name, level is untouched then
bool ParseLogLevel(const std::string &name, LogLevel::Value *level);

// Return Info if name is not a level name
LogLevel::Value GetLogLevelByName(const std::string &name);

// Prefix of every message, e.g. "[WARN] "
std::string GetLogLevelPrefix(LogLevel::Value logLevel);

}  // namespace Logging
}  // namespace BX

#endif  // BLOBXFER_BASE_LOGLEVEL_H_
