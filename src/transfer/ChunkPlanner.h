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

#ifndef BLOBXFER_TRANSFER_CHUNKPLANNER_H_
#define BLOBXFER_TRANSFER_CHUNKPLANNER_H_

#include <stdint.h>

#include <vector>

#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

typedef BX::Client::Outcome<std::vector<TransferRecord>,
                            BX::Client::TransferClientError>
    ChunkPlanOutcome;

//
// ChunkPlanner
//
// Decomposes a transfer into chunk records.
//
// Download of known size larger than the split threshold is split into
// contiguous ranges of chunk size, the last one may be shorter; otherwise
// it is a single chunk. Download of unknown size starts with a probe chunk
// of chunk size, the rest is planned by PlanRemainingRanges once the probe
// reported the object size.
//
// Upload is split into blocks of block size followed by a commit chunk.
//
// A zero-length download is a single complete chunk, a zero-length upload
// is only the commit chunk.
//
class ChunkPlanner {
 public:
  ChunkPlanner(uint64_t downloadChunkSize, uint64_t downloadSplitThreshold,
               uint64_t uploadBlockSize, uint32_t uploadMaxBlockCount);

 public:
  ChunkPlanOutcome Plan(const TransferRecord &transfer) const;

  // Plan range chunks of [start, end) of a download
  std::vector<TransferRecord> PlanRemainingRanges(
      const TransferRecord &transfer, uint64_t start, uint64_t end) const;

  uint64_t GetDownloadChunkSize() const { return m_downloadChunkSize; }
  uint64_t GetDownloadSplitThreshold() const {
    return m_downloadSplitThreshold;
  }
  uint64_t GetUploadBlockSize() const { return m_uploadBlockSize; }

 private:
  ChunkPlanOutcome PlanDownload(const TransferRecord &transfer) const;
  ChunkPlanOutcome PlanUpload(const TransferRecord &transfer) const;

 private:
  uint64_t m_downloadChunkSize;
  uint64_t m_downloadSplitThreshold;
  uint64_t m_uploadBlockSize;
  uint32_t m_uploadMaxBlockCount;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_CHUNKPLANNER_H_
