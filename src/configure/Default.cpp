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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"

namespace BX {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "blobxfer";
static const char* const BLOBXFER_DEFAULT_LOGLEVEL_NAME = "WARN";
static const char* const BLOBXFER_DEFAULT_STORE_DIR = "/tmp/blobxfer_store/";
static uint16_t const BLOBXFER_DEFAULT_CHUNK_RETRIES = 3;
static uint16_t const BLOBXFER_DEFAULT_RETRY_SCALE_FACTOR = 25;

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogLevelName() { return BLOBXFER_DEFAULT_LOGLEVEL_NAME; }
uint32_t GetMaxLogSizeInMB() { return 100; }
string GetDefaultStoreDirectory() { return BLOBXFER_DEFAULT_STORE_DIR; }

mode_t GetDefineFileMode() { return (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH); }
mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

size_t GetDefaultParallelTransfers() { return 5; }

uint64_t GetDefaultDownloadChunkSize() { return BX::Size::MB4; }

uint64_t GetDefaultDownloadSplitThreshold() { return BX::Size::MB4; }

uint64_t GetDefaultUploadBlockSize() { return BX::Size::MB4; }

// block blob limits of the storage service
uint64_t GetUploadMaxBlockSize() { return BX::Size::MB100; }
uint32_t GetUploadMaxBlockCount() { return 50000; }

uint16_t GetDefaultChunkRetries() { return BLOBXFER_DEFAULT_CHUNK_RETRIES; }
uint16_t GetMaxChunkRetries() { return 15; }

uint16_t GetDefaultRetryScaleFactor() {
  return BLOBXFER_DEFAULT_RETRY_SCALE_FACTOR;
}

}  // namespace Default
}  // namespace Configure
}  // namespace BX
