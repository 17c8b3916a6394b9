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

#ifndef BLOBXFER_TRANSFER_TRANSFERRECORD_H_
#define BLOBXFER_TRANSFER_TRANSFERRECORD_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Size.h"
#include "client/TransferError.h"

namespace BX {

namespace Transfer {

struct TransferState {
  enum Value { Pending, InProgress, Paused, Complete, Failed, Cancelled };
};

struct TransferType {
  enum Value { Upload, Download };
};

std::string GetTransferStateName(TransferState::Value state);
std::string GetTransferTypeName(TransferType::Value type);

// Parse names returned by GetTransferStateName/GetTransferTypeName
//
// @param  : name, output
// @return : false if name is not recognized
bool ParseTransferState(const std::string &name, TransferState::Value *state);
bool ParseTransferType(const std::string &name, TransferType::Value *type);

// Complete, Failed and Cancelled are terminal
bool IsTerminalState(TransferState::Value state);

//
// TransferRecord
//
// Durable unit describing one upload or download. A top-level record has
// no parent, its children are the chunks of the transfer. For downloads
// source is the blob url and destination the local path, for uploads it is
// reversed. Range is [startOffset, endOffset), a download whose size is not
// known yet carries endOffset of UnknownSize.
//
class TransferRecord {
 public:
  TransferRecord();
  TransferRecord(const std::string &id, TransferType::Value type,
                 const std::string &source, const std::string &destination,
                 uint64_t startOffset, uint64_t endOffset);

 public:
  const std::string &GetId() const { return m_id; }
  TransferType::Value GetType() const { return m_type; }
  bool IsDownload() const { return m_type == TransferType::Download; }
  bool IsUpload() const { return m_type == TransferType::Upload; }
  const std::string &GetSource() const { return m_source; }
  const std::string &GetDestination() const { return m_destination; }
  // Blob url, source for downloads and destination for uploads
  const std::string &GetRemoteUrl() const {
    return IsDownload() ? m_source : m_destination;
  }
  const std::string &GetLocalPath() const {
    return IsDownload() ? m_destination : m_source;
  }

  uint64_t GetStartOffset() const { return m_startOffset; }
  uint64_t GetEndOffset() const { return m_endOffset; }
  bool IsSizeKnown() const { return m_endOffset != BX::Size::UnknownSize; }
  // Return 0 if size is not known
  uint64_t GetTotalBytes() const {
    return IsSizeKnown() && m_endOffset > m_startOffset
               ? m_endOffset - m_startOffset
               : 0;
  }

  TransferState::Value GetState() const { return m_state; }
  bool IsTerminal() const { return IsTerminalState(m_state); }
  uint64_t GetBytesTransferred() const { return m_bytesTransferred; }

  const std::string &GetParentId() const { return m_parentId; }
  bool IsChunk() const { return !m_parentId.empty(); }
  // Id of the top-level record of the family this record belongs to
  const std::string &GetRootId() const {
    return m_parentId.empty() ? m_id : m_parentId;
  }

  const std::string &GetBlockId() const { return m_blockId; }
  bool IsBlock() const { return IsUpload() && IsChunk() && !m_blockId.empty(); }
  bool IsCommit() const { return IsUpload() && IsChunk() && m_blockId.empty(); }
  bool IsRangeChunk() const { return IsDownload() && IsChunk(); }

  const BX::Client::TransferClientError &GetError() const { return m_error; }
  bool HasError() const { return !BX::Client::IsGoodTransferError(m_error); }

  void SetEndOffset(uint64_t endOffset) { m_endOffset = endOffset; }
  void SetState(TransferState::Value state) { m_state = state; }
  void SetBytesTransferred(uint64_t bytes) { m_bytesTransferred = bytes; }
  void SetParentId(const std::string &parentId) { m_parentId = parentId; }
  void SetBlockId(const std::string &blockId) { m_blockId = blockId; }
  void SetError(const BX::Client::TransferClientError &error) {
    m_error = error;
  }
  void ClearError() { m_error = BX::Client::MakeGoodError(); }

  // Log representation
  std::string ToString() const;

 private:
  std::string m_id;
  TransferType::Value m_type;
  std::string m_source;
  std::string m_destination;
  uint64_t m_startOffset;
  uint64_t m_endOffset;
  TransferState::Value m_state;
  uint64_t m_bytesTransferred;
  std::string m_parentId;
  std::string m_blockId;
  BX::Client::TransferClientError m_error;
};

// Generate a random uuid string
std::string GenerateTransferId();

// Check if id is usable as a transfer id, that is 1 to 64 characters out of
// letters, digits, '-' and '_'. Ids name store files, no path may be formed.
bool IsValidTransferId(const std::string &id);

// Create a top-level download record with a fresh id
//
// @param  : blob url, local path, requested range [start, end)
// @return : pending record
TransferRecord MakeDownloadRecord(const std::string &sourceUrl,
                                  const std::string &destinationPath,
                                  uint64_t startOffset = 0,
                                  uint64_t endOffset = BX::Size::UnknownSize);

// Create a top-level upload record with a fresh id, range is decided when
// the record is added to a manager
TransferRecord MakeUploadRecord(const std::string &sourcePath,
                                const std::string &destinationUrl);

// Create a chunk of parent with a fresh id
TransferRecord MakeChunkRecord(const TransferRecord &parent,
                               uint64_t startOffset, uint64_t endOffset,
                               const std::string &blockId = std::string());

// Order of chunks of a transfer: by start offset, commit step last
bool ChunkOrderLess(const TransferRecord &lhs, const TransferRecord &rhs);

// Derive state and progress of a transfer from its chunks
//
// @param  : transfer, all chunks of the transfer
// @return : transfer whose bytesTransferred is the sum of bytes of complete
//           chunks. A terminal transfer keeps its state, otherwise it is
//           complete if every chunk is complete, failed (with the error of
//           the failed chunk) if any chunk failed, paused if it was paused,
//           in progress if any chunk is in progress, and pending if none.
//
// The result does not depend on the order of chunks.
TransferRecord ReconcileTransfer(const TransferRecord &transfer,
                                 const std::vector<TransferRecord> &chunks);

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERRECORD_H_
