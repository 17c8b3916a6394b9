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

#include "transfer/TransferRecord.h"

#include <ctype.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/uuid/uuid.hpp"
#include "boost/uuid/uuid_generators.hpp"
#include "boost/uuid/uuid_io.hpp"

#include "base/Size.h"
#include "base/StringUtils.h"

namespace BX {

namespace Transfer {

using BX::Client::MakeGoodError;
using BX::Client::GetMessageForTransferError;
using boost::to_string;
using std::string;
using std::vector;

static const char *const PENDING_NAME = "pending";
static const char *const INPROGRESS_NAME = "inProgress";
static const char *const PAUSED_NAME = "paused";
static const char *const COMPLETE_NAME = "complete";
static const char *const FAILED_NAME = "failed";
static const char *const CANCELLED_NAME = "cancelled";

static const char *const UPLOAD_NAME = "upload";
static const char *const DOWNLOAD_NAME = "download";

// --------------------------------------------------------------------------
string GetTransferStateName(TransferState::Value state) {
  switch (state) {
    case TransferState::Pending:
      return PENDING_NAME;
    case TransferState::InProgress:
      return INPROGRESS_NAME;
    case TransferState::Paused:
      return PAUSED_NAME;
    case TransferState::Complete:
      return COMPLETE_NAME;
    case TransferState::Failed:
      return FAILED_NAME;
    case TransferState::Cancelled:
      return CANCELLED_NAME;
    default:
      break;
  }
  return PENDING_NAME;
}

// --------------------------------------------------------------------------
string GetTransferTypeName(TransferType::Value type) {
  return type == TransferType::Upload ? UPLOAD_NAME : DOWNLOAD_NAME;
}

// --------------------------------------------------------------------------
bool ParseTransferState(const string &name, TransferState::Value *state) {
  TransferState::Value states[] = {
      TransferState::Pending,  TransferState::InProgress,
      TransferState::Paused,   TransferState::Complete,
      TransferState::Failed,   TransferState::Cancelled,
  };
  int n = sizeof(states) / sizeof(states[0]);
  for (int i = 0; i < n; ++i) {
    if (name == GetTransferStateName(states[i])) {
      *state = states[i];
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
bool ParseTransferType(const string &name, TransferType::Value *type) {
  if (name == UPLOAD_NAME) {
    *type = TransferType::Upload;
    return true;
  } else if (name == DOWNLOAD_NAME) {
    *type = TransferType::Download;
    return true;
  }
  return false;
}

// --------------------------------------------------------------------------
bool IsTerminalState(TransferState::Value state) {
  return state == TransferState::Complete || state == TransferState::Failed ||
         state == TransferState::Cancelled;
}

// --------------------------------------------------------------------------
TransferRecord::TransferRecord()
    : m_type(TransferType::Download),
      m_startOffset(0),
      m_endOffset(BX::Size::UnknownSize),
      m_state(TransferState::Pending),
      m_bytesTransferred(0),
      m_error(MakeGoodError()) {}

// --------------------------------------------------------------------------
TransferRecord::TransferRecord(const string &id, TransferType::Value type,
                               const string &source,
                               const string &destination,
                               uint64_t startOffset, uint64_t endOffset)
    : m_id(id),
      m_type(type),
      m_source(source),
      m_destination(destination),
      m_startOffset(startOffset),
      m_endOffset(endOffset),
      m_state(TransferState::Pending),
      m_bytesTransferred(0),
      m_error(MakeGoodError()) {}

// --------------------------------------------------------------------------
string TransferRecord::ToString() const {
  string str = "[id:" + m_id + ", " + GetTransferTypeName(m_type);
  if (IsChunk()) {
    str += " chunk of " + m_parentId;
  }
  str += ", " + BX::StringUtils::FormatPath(m_source, m_destination);
  str += ", range:" + to_string(m_startOffset) + "-";
  str += IsSizeKnown() ? to_string(m_endOffset) : string("?");
  if (!m_blockId.empty()) {
    str += ", block:" + m_blockId;
  }
  str += ", state:" + GetTransferStateName(m_state);
  str += ", bytes:" + to_string(m_bytesTransferred);
  if (HasError()) {
    str += ", error:" + GetMessageForTransferError(m_error);
  }
  str += "]";
  return str;
}

// --------------------------------------------------------------------------
string GenerateTransferId() {
  boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

// --------------------------------------------------------------------------
bool IsValidTransferId(const string &id) {
  static const size_t maxIdLength = 64;
  if (id.empty() || id.size() > maxIdLength) {
    return false;
  }
  BOOST_FOREACH (char c, id) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

// --------------------------------------------------------------------------
TransferRecord MakeDownloadRecord(const string &sourceUrl,
                                  const string &destinationPath,
                                  uint64_t startOffset, uint64_t endOffset) {
  return TransferRecord(GenerateTransferId(), TransferType::Download,
                        sourceUrl, destinationPath, startOffset, endOffset);
}

// --------------------------------------------------------------------------
TransferRecord MakeUploadRecord(const string &sourcePath,
                                const string &destinationUrl) {
  return TransferRecord(GenerateTransferId(), TransferType::Upload,
                        sourcePath, destinationUrl, 0,
                        BX::Size::UnknownSize);
}

// --------------------------------------------------------------------------
TransferRecord MakeChunkRecord(const TransferRecord &parent,
                               uint64_t startOffset, uint64_t endOffset,
                               const string &blockId) {
  TransferRecord chunk(GenerateTransferId(), parent.GetType(),
                       parent.GetSource(), parent.GetDestination(),
                       startOffset, endOffset);
  chunk.SetParentId(parent.GetId());
  chunk.SetBlockId(blockId);
  return chunk;
}

// --------------------------------------------------------------------------
bool ChunkOrderLess(const TransferRecord &lhs, const TransferRecord &rhs) {
  if (lhs.IsCommit() != rhs.IsCommit()) {
    return rhs.IsCommit();
  }
  if (lhs.GetStartOffset() != rhs.GetStartOffset()) {
    return lhs.GetStartOffset() < rhs.GetStartOffset();
  }
  return lhs.GetId() < rhs.GetId();
}

// --------------------------------------------------------------------------
TransferRecord ReconcileTransfer(const TransferRecord &transfer,
                                 const vector<TransferRecord> &chunks) {
  TransferRecord result(transfer);
  uint64_t bytes = 0;
  bool allComplete = true;
  bool anyInProgress = false;
  const TransferRecord *failed = NULL;
  BOOST_FOREACH (const TransferRecord &chunk, chunks) {
    if (chunk.GetState() == TransferState::Complete) {
      bytes += chunk.GetBytesTransferred();
      continue;
    }
    allComplete = false;
    if (chunk.GetState() == TransferState::Failed) {
      // smallest id wins so the result is order independent
      if (failed == NULL || chunk.GetId() < failed->GetId()) {
        failed = &chunk;
      }
    } else if (chunk.GetState() == TransferState::InProgress) {
      anyInProgress = true;
    }
  }
  result.SetBytesTransferred(bytes);

  if (transfer.IsTerminal() || chunks.empty()) {
    return result;
  }
  if (allComplete) {
    result.SetState(TransferState::Complete);
    result.ClearError();
  } else if (failed != NULL) {
    result.SetState(TransferState::Failed);
    result.SetError(failed->GetError());
  } else if (transfer.GetState() == TransferState::Paused) {
    result.SetState(TransferState::Paused);
  } else if (anyInProgress) {
    result.SetState(TransferState::InProgress);
  } else {
    result.SetState(TransferState::Pending);
  }
  return result;
}

}  // namespace Transfer
}  // namespace BX
