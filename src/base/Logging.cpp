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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace BX {

namespace Logging {

using BX::Exception::BXException;
using std::pair;
using std::string;

namespace {

boost::once_flag instanceOnce = BOOST_ONCE_INIT;
boost::once_flag initOnce = BOOST_ONCE_INIT;
boost::scoped_ptr<Log> instance;

}  // namespace

// --------------------------------------------------------------------------
LogConfigure::LogConfigure()
    : m_logDirectory(),
      m_logLevel(GetLogLevelByName(
          BX::Configure::Default::GetDefaultLogLevelName())),
      m_debug(false),
      m_maxLogSizeInMB(BX::Configure::Default::GetMaxLogSizeInMB()) {}

// --------------------------------------------------------------------------
LogConfigure::LogConfigure(const string &logDirectory)
    : m_logDirectory(logDirectory),
      m_logLevel(GetLogLevelByName(
          BX::Configure::Default::GetDefaultLogLevelName())),
      m_debug(false),
      m_maxLogSizeInMB(BX::Configure::Default::GetMaxLogSizeInMB()) {}

// --------------------------------------------------------------------------
Log &Log::Instance() {
  boost::call_once(instanceOnce, &Log::CreateInstance);
  return *instance;
}

// --------------------------------------------------------------------------
void Log::CreateInstance() { instance.reset(new Log); }

// --------------------------------------------------------------------------
Log::Log()
    : m_initialized(false),
      m_logLevel(LogLevel::Info),
      m_logDirectory(),
      m_isDebug(false) {}

// --------------------------------------------------------------------------
void Log::Initialize(const LogConfigure &configure) {
  SetDebug(configure.m_debug);
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this,
                                         configure));
  SetLogLevel(configure.m_logLevel);
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const LogConfigure &configure) {
  const string &logdir = configure.m_logDirectory;
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    if (!BX::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw BXException("Unable to create log directory " + logdir + " : " +
                        strerror(errno));
    }
    pair<bool, string> permission = BX::Utils::HavePermission(logdir);
    if (!permission.first) {
      throw BXException("Unable to write log files at " + logdir + " : " +
                        permission.second);
    }
    // glog reads the destination flags only in InitGoogleLogging
    FLAGS_log_dir = logdir;
    FLAGS_max_log_size = configure.m_maxLogSizeInMB;
    FLAGS_stop_logging_if_full_disk = true;
    m_logDirectory = BX::Utils::AppendPathDelim(logdir);
  }

  google::InitGoogleLogging(BX::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
  m_initialized = true;
}

}  // namespace Logging
}  // namespace BX
