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

#ifndef BLOBXFER_BASE_LOGGING_H_
#define BLOBXFER_BASE_LOGGING_H_

#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"

#include "base/LogLevel.h"

namespace BX {

namespace Logging {

struct LogConfigure {
  // Log to stderr if empty
  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  // Enable the Debug* macros
  bool m_debug;
  uint32_t m_maxLogSizeInMB;

  LogConfigure();
  explicit LogConfigure(const std::string &logDirectory);
};

//
// Process wide log settings on top of glog. Every transfer manager of the
// process shares them.
//
class Log : private boost::noncopyable {
 public:
  static Log &Instance();

 public:
  // One-time initialization of glog, later calls only update the log level
  // and the debug flag.
  //
  // @param  : log configure
  // @return : void
  //
  // Throw BXException if the log directory is not usable.
  void Initialize(const LogConfigure &configure = LogConfigure());

  bool IsInitialized() const { return m_initialized; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }

 private:
  Log();
  static void CreateInstance();
  void DoInitialize(const LogConfigure &configure);

 private:
  bool m_initialized;
  LogLevel::Value m_logLevel;
  std::string m_logDirectory;
  bool m_isDebug;
};

}  // namespace Logging
}  // namespace BX

#endif  // BLOBXFER_BASE_LOGGING_H_
