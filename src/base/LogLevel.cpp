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

#include "base/LogLevel.h"

#include <string>
#include <utility>

#include "base/StringUtils.h"

namespace BX {

namespace Logging {

using std::make_pair;
using std::pair;
using std::string;

namespace {

const pair<LogLevel::Value, const char *> levelNames[] = {
    make_pair(LogLevel::Info, "INFO"),
    make_pair(LogLevel::Warn, "WARN"),
    make_pair(LogLevel::Error, "ERROR"),
    make_pair(LogLevel::Fatal, "FATAL"),
};

const size_t levelCount = sizeof(levelNames) / sizeof(levelNames[0]);

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  for (size_t i = 0; i < levelCount; ++i) {
    if (levelNames[i].first == logLevel) {
      return levelNames[i].second;
    }
  }
  return string();
}

// --------------------------------------------------------------------------
bool ParseLogLevel(const string &name, LogLevel::Value *level) {
  string upper = BX::StringUtils::ToUpper(BX::StringUtils::Trim(name, ' '));
  if (upper == "WARNING") {
    upper = "WARN";
  }
  for (size_t i = 0; i < levelCount; ++i) {
    if (upper == levelNames[i].second) {
      if (level != NULL) {
        *level = levelNames[i].first;
      }
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  LogLevel::Value level = LogLevel::Info;
  return ParseLogLevel(name, &level) ? level : LogLevel::Info;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace BX
