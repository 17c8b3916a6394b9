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

#ifndef BLOBXFER_TRANSFER_TRANSFERHANDLE_H_
#define BLOBXFER_TRANSFER_TRANSFERHANDLE_H_

#include <stddef.h>  // for size_t

#include <map>
#include <set>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/TransferError.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

class TransferManager;

//
// TransferHandle
//
// Live entry of a transfer family while it is known by a manager. It is
// rebuilt from the store on startup and never persisted itself.
//
// A transfer and its chunks share the lock of the handle. Members and the
// public methods below are not synchronized, callers must hold the lock.
//
class TransferHandle : private boost::noncopyable {
 public:
  TransferHandle(const TransferRecord &transfer,
                 const std::vector<TransferRecord> &chunks);
  ~TransferHandle() {}

 public:
  const std::string &GetId() const { return m_transfer.GetId(); }
  const TransferRecord &GetTransfer() const { return m_transfer; }

  // Chunks ordered by start offset, commit last
  std::vector<TransferRecord> GetChunks() const;
  // Chunks with the given records replacing or extending the current ones
  std::vector<TransferRecord> GetChunksWith(
      const std::vector<TransferRecord> &changed) const;
  bool HasChunk(const std::string &chunkId) const;
  // Return default record if not found
  TransferRecord GetChunk(const std::string &chunkId) const;

  // Pending chunks which can be executed now. A commit chunk is ready only
  // after every block chunk is complete.
  std::vector<std::string> GetReadyChunkIds() const;

  // Block ids of the upload in commit order
  std::vector<std::string> GetBlockIds() const;

  size_t GetInFlightCount() const { return m_inFlightChunks.size(); }
  bool IsChunkInFlight(const std::string &chunkId) const {
    return m_inFlightChunks.find(chunkId) != m_inFlightChunks.end();
  }
  bool IsHalted() const { return m_halted; }
  bool IsRemoved() const { return m_removed; }

  // Error of a persistence failure or of the failed transfer, GOOD if none
  BX::Client::TransferClientError GetError() const;

  // Transfer is terminal, paused or halted and has no chunk in flight
  bool IsSettled() const;

 private:
  void SetTransfer(const TransferRecord &transfer) { m_transfer = transfer; }
  void PutChunk(const TransferRecord &chunk);

 private:
  TransferRecord m_transfer;
  std::map<std::string, TransferRecord> m_chunks;
  std::vector<std::string> m_chunkOrder;

  // chunks submitted to the executor and not finished
  std::set<std::string> m_inFlightChunks;
  bool m_halted;      // stopped by a persistence failure
  bool m_removed;
  BX::Client::TransferClientError m_haltError;

  mutable boost::mutex m_lock;
  // Signaled on every state change and chunk finish
  boost::condition_variable m_signal;

  friend class TransferManager;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERHANDLE_H_
