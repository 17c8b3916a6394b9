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

#ifndef BLOBXFER_TRANSFER_CHUNKEXECUTOR_H_
#define BLOBXFER_TRANSFER_CHUNKEXECUTOR_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"

#include "base/Size.h"
#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

// Byte level outcome of a chunk
struct ChunkResult {
  ChunkResult() : bytesWritten(0), objectSize(BX::Size::UnknownSize) {}
  ChunkResult(uint64_t bytes, uint64_t size)
      : bytesWritten(bytes), objectSize(size) {}

  uint64_t bytesWritten;
  // Size of the remote object if the response tells it
  uint64_t objectSize;
};

typedef BX::Client::Outcome<ChunkResult, BX::Client::TransferClientError>
    ChunkOutcome;

// A chunk together with what is needed to execute it
class ChunkTask {
 public:
  ChunkTask(const TransferRecord &chunk, uint64_t localBaseOffset,
            const std::vector<std::string> &blockIds =
                std::vector<std::string>())
      : m_chunk(chunk),
        m_localBaseOffset(localBaseOffset),
        m_blockIds(blockIds) {}

 public:
  const TransferRecord &GetChunk() const { return m_chunk; }
  // Offset of the transfer range that maps to offset 0 of the local file
  uint64_t GetLocalBaseOffset() const { return m_localBaseOffset; }
  uint64_t GetLocalOffset() const {
    return m_chunk.GetStartOffset() - m_localBaseOffset;
  }
  // Ordered block ids to commit, only used by a commit chunk
  const std::vector<std::string> &GetBlockIds() const { return m_blockIds; }

 private:
  TransferRecord m_chunk;
  uint64_t m_localBaseOffset;
  std::vector<std::string> m_blockIds;
};

//
// ChunkExecutor
//
// Performs the network operation of one chunk. Execute is called
// concurrently from worker threads and must be idempotent per chunk:
// running a chunk again overwrites only its own range or re-sends only its
// own block.
//
class ChunkExecutor : private boost::noncopyable {
 public:
  ChunkExecutor() {}
  virtual ~ChunkExecutor() {}

 public:
  virtual ChunkOutcome Execute(const ChunkTask &task) = 0;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_CHUNKEXECUTOR_H_
