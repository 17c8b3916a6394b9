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

#ifndef BLOBXFER_CONFIGURE_DEFAULT_H_
#define BLOBXFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace BX {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogLevelName();
uint32_t GetMaxLogSizeInMB();
std::string GetDefaultStoreDirectory();

mode_t GetDefineFileMode();
mode_t GetDefineDirMode();

size_t GetDefaultParallelTransfers();   // worker slots for chunk execution

uint64_t GetDefaultDownloadChunkSize();
uint64_t GetDefaultDownloadSplitThreshold();  // split if size exceeds this
uint64_t GetDefaultUploadBlockSize();
uint64_t GetUploadMaxBlockSize();
uint32_t GetUploadMaxBlockCount();

uint16_t GetDefaultChunkRetries();
uint16_t GetMaxChunkRetries();  // 2^max * scale factor fits in 32 bits
uint16_t GetDefaultRetryScaleFactor();  // in milliseconds

}  // namespace Default
}  // namespace Configure
}  // namespace BX

#endif  // BLOBXFER_CONFIGURE_DEFAULT_H_
