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

#ifndef BLOBXFER_BASE_LOGMACROS_H_
#define BLOBXFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_BLOBXFER_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)
#define DebugFatal(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)

#else  // !DISABLE_BLOBXFER_LOGGING

#define BX_LOG_PREFIX(level) \
  BX::Logging::GetLogLevelPrefix(BX::Logging::LogLevel::level)

// Google INFO stream needs to be flushed. So in order to get latest log,
// we always flush INFO stream for all non-fatal level stream.
#define BX_LOG(severity, level, msg)                  \
  {                                                   \
    LOG(severity) << BX_LOG_PREFIX(level) << msg;     \
    google::FlushLogFiles(google::INFO);              \
  }

#define BX_LOG_IF(severity, level, condition, msg)               \
  {                                                              \
    LOG_IF(severity, (condition)) << BX_LOG_PREFIX(level) << msg; \
    google::FlushLogFiles(google::INFO);                         \
  }

#define BX_DEBUG_LOG(severity, level, msg)          \
  {                                                 \
    if (BX::Logging::Log::Instance().IsDebug()) {   \
      BX_LOG(severity, level, msg)                  \
    }                                               \
  }

#define BX_DEBUG_LOG_IF(severity, level, condition, msg) \
  {                                                      \
    if (BX::Logging::Log::Instance().IsDebug()) {        \
      BX_LOG_IF(severity, level, condition, msg)         \
    }                                                    \
  }

#define Info(msg) BX_LOG(INFO, Info, msg)
#define Warning(msg) BX_LOG(WARNING, Warn, msg)
#define Error(msg) BX_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << BX_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) BX_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) BX_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) BX_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << BX_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg) BX_DEBUG_LOG(INFO, Info, msg)
#define DebugWarning(msg) BX_DEBUG_LOG(WARNING, Warn, msg)
#define DebugError(msg) BX_DEBUG_LOG(ERROR, Error, msg)
#define DebugFatal(msg)                                     \
  {                                                         \
    if (BX::Logging::Log::Instance().IsDebug()) {           \
      LOG(FATAL) << BX_LOG_PREFIX(Fatal) << msg;            \
    }                                                       \
  }

#define DebugInfoIf(condition, msg) BX_DEBUG_LOG_IF(INFO, Info, condition, msg)
#define DebugWarningIf(condition, msg) \
  BX_DEBUG_LOG_IF(WARNING, Warn, condition, msg)
#define DebugErrorIf(condition, msg) \
  BX_DEBUG_LOG_IF(ERROR, Error, condition, msg)

#endif  // DISABLE_BLOBXFER_LOGGING

#endif  // BLOBXFER_BASE_LOGMACROS_H_
