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

#include "transfer/ChunkPlanner.h"

#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/Size.h"
#include "client/Utils.h"

namespace BX {

namespace Transfer {

using BX::Client::MakeInvalidTransferError;
using boost::to_string;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
ChunkPlanner::ChunkPlanner(uint64_t downloadChunkSize,
                           uint64_t downloadSplitThreshold,
                           uint64_t uploadBlockSize,
                           uint32_t uploadMaxBlockCount)
    : m_downloadChunkSize(downloadChunkSize),
      m_downloadSplitThreshold(downloadSplitThreshold),
      m_uploadBlockSize(uploadBlockSize),
      m_uploadMaxBlockCount(uploadMaxBlockCount) {}

// --------------------------------------------------------------------------
ChunkPlanOutcome ChunkPlanner::Plan(const TransferRecord &transfer) const {
  if (transfer.IsChunk()) {
    return ChunkPlanOutcome(MakeInvalidTransferError(
        "Unable to plan chunks of a chunk " + transfer.ToString()));
  }
  return transfer.IsDownload() ? PlanDownload(transfer)
                               : PlanUpload(transfer);
}

// --------------------------------------------------------------------------
vector<TransferRecord> ChunkPlanner::PlanRemainingRanges(
    const TransferRecord &transfer, uint64_t start, uint64_t end) const {
  vector<TransferRecord> chunks;
  uint64_t offset = start;
  while (offset < end) {
    uint64_t chunkEnd = offset + std::min(m_downloadChunkSize, end - offset);
    chunks.push_back(MakeChunkRecord(transfer, offset, chunkEnd));
    offset = chunkEnd;
  }
  return chunks;
}

// --------------------------------------------------------------------------
ChunkPlanOutcome ChunkPlanner::PlanDownload(
    const TransferRecord &transfer) const {
  uint64_t start = transfer.GetStartOffset();
  vector<TransferRecord> chunks;

  if (!transfer.IsSizeKnown()) {
    // probe chunk, its response tells the object size
    chunks.push_back(
        MakeChunkRecord(transfer, start, start + m_downloadChunkSize));
    return ChunkPlanOutcome(chunks);
  }

  uint64_t end = transfer.GetEndOffset();
  if (end < start) {
    return ChunkPlanOutcome(MakeInvalidTransferError(
        "Invalid range " + to_string(start) + "-" + to_string(end) + " of " +
        transfer.ToString()));
  }

  if (end == start) {
    TransferRecord chunk = MakeChunkRecord(transfer, start, end);
    chunk.SetState(TransferState::Complete);
    chunks.push_back(chunk);
  } else if (end - start > m_downloadSplitThreshold) {
    chunks = PlanRemainingRanges(transfer, start, end);
  } else {
    chunks.push_back(MakeChunkRecord(transfer, start, end));
  }
  DebugInfo("Planned " + to_string(chunks.size()) + " chunks for " +
            transfer.ToString());
  return ChunkPlanOutcome(chunks);
}

// --------------------------------------------------------------------------
ChunkPlanOutcome ChunkPlanner::PlanUpload(
    const TransferRecord &transfer) const {
  if (!transfer.IsSizeKnown()) {
    return ChunkPlanOutcome(MakeInvalidTransferError(
        "Unknown size of upload source " + transfer.ToString()));
  }
  uint64_t start = transfer.GetStartOffset();
  uint64_t end = transfer.GetEndOffset();
  uint64_t size = end > start ? end - start : 0;
  uint64_t blockCount = (size + m_uploadBlockSize - 1) / m_uploadBlockSize;
  if (blockCount > m_uploadMaxBlockCount) {
    return ChunkPlanOutcome(MakeInvalidTransferError(
        "Upload needs " + to_string(blockCount) + " blocks, exceeds limit " +
        to_string(m_uploadMaxBlockCount) + " " + transfer.ToString()));
  }

  vector<TransferRecord> chunks;
  uint32_t index = 0;
  for (uint64_t offset = start; offset < end; ++index) {
    uint64_t blockEnd = offset + std::min(m_uploadBlockSize, end - offset);
    chunks.push_back(MakeChunkRecord(transfer, offset, blockEnd,
                                     BX::Client::Utils::BuildBlockId(index)));
    offset = blockEnd;
  }
  // commit, carries no block id
  chunks.push_back(MakeChunkRecord(transfer, end, end));
  DebugInfo("Planned " + to_string(chunks.size()) + " chunks for " +
            transfer.ToString());
  return ChunkPlanOutcome(chunks);
}

}  // namespace Transfer
}  // namespace BX
