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

#include "transfer/TransferHandle.h"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "boost/foreach.hpp"

namespace BX {

namespace Transfer {

using BX::Client::MakeGoodError;
using BX::Client::TransferClientError;
using std::map;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(const TransferRecord &transfer,
                               const vector<TransferRecord> &chunks)
    : m_transfer(transfer),
      m_halted(false),
      m_removed(false),
      m_haltError(MakeGoodError()) {
  BOOST_FOREACH (const TransferRecord &chunk, chunks) { PutChunk(chunk); }
}

// --------------------------------------------------------------------------
vector<TransferRecord> TransferHandle::GetChunks() const {
  vector<TransferRecord> chunks;
  chunks.reserve(m_chunkOrder.size());
  BOOST_FOREACH (const string &id, m_chunkOrder) {
    map<string, TransferRecord>::const_iterator it = m_chunks.find(id);
    if (it != m_chunks.end()) {
      chunks.push_back(it->second);
    }
  }
  return chunks;
}

// --------------------------------------------------------------------------
vector<TransferRecord> TransferHandle::GetChunksWith(
    const vector<TransferRecord> &changed) const {
  map<string, TransferRecord> merged(m_chunks);
  BOOST_FOREACH (const TransferRecord &chunk, changed) {
    merged[chunk.GetId()] = chunk;
  }
  vector<TransferRecord> chunks;
  chunks.reserve(merged.size());
  for (map<string, TransferRecord>::const_iterator it = merged.begin();
       it != merged.end(); ++it) {
    chunks.push_back(it->second);
  }
  std::sort(chunks.begin(), chunks.end(), ChunkOrderLess);
  return chunks;
}

// --------------------------------------------------------------------------
bool TransferHandle::HasChunk(const string &chunkId) const {
  return m_chunks.find(chunkId) != m_chunks.end();
}

// --------------------------------------------------------------------------
TransferRecord TransferHandle::GetChunk(const string &chunkId) const {
  map<string, TransferRecord>::const_iterator it = m_chunks.find(chunkId);
  return it != m_chunks.end() ? it->second : TransferRecord();
}

// --------------------------------------------------------------------------
vector<string> TransferHandle::GetReadyChunkIds() const {
  vector<string> ready;
  bool allBlocksComplete = true;
  string commitId;
  BOOST_FOREACH (const string &id, m_chunkOrder) {
    const TransferRecord &chunk = m_chunks.find(id)->second;
    if (chunk.IsCommit()) {
      if (chunk.GetState() == TransferState::Pending) {
        commitId = id;
      }
      continue;
    }
    if (chunk.GetState() != TransferState::Complete) {
      allBlocksComplete = false;
    }
    if (chunk.GetState() == TransferState::Pending) {
      ready.push_back(id);
    }
  }
  if (!commitId.empty() && allBlocksComplete) {
    ready.push_back(commitId);
  }
  return ready;
}

// --------------------------------------------------------------------------
vector<string> TransferHandle::GetBlockIds() const {
  vector<string> blockIds;
  BOOST_FOREACH (const string &id, m_chunkOrder) {
    const TransferRecord &chunk = m_chunks.find(id)->second;
    if (chunk.IsBlock()) {
      blockIds.push_back(chunk.GetBlockId());
    }
  }
  return blockIds;
}

// --------------------------------------------------------------------------
TransferClientError TransferHandle::GetError() const {
  if (m_halted) {
    return m_haltError;
  }
  return m_transfer.GetError();
}

// --------------------------------------------------------------------------
bool TransferHandle::IsSettled() const {
  if (!m_inFlightChunks.empty()) {
    return false;
  }
  return m_removed || m_halted || m_transfer.IsTerminal() ||
         m_transfer.GetState() == TransferState::Paused;
}

// --------------------------------------------------------------------------
void TransferHandle::PutChunk(const TransferRecord &chunk) {
  map<string, TransferRecord>::iterator it = m_chunks.find(chunk.GetId());
  if (it != m_chunks.end()) {
    bool reorder = ChunkOrderLess(it->second, chunk) ||
                   ChunkOrderLess(chunk, it->second);
    it->second = chunk;
    if (!reorder) {
      return;
    }
    m_chunkOrder.erase(
        std::find(m_chunkOrder.begin(), m_chunkOrder.end(), chunk.GetId()));
  } else {
    m_chunks[chunk.GetId()] = chunk;
  }

  // keep order, insert at the first position greater than chunk
  vector<string>::iterator pos = m_chunkOrder.begin();
  while (pos != m_chunkOrder.end() &&
         !ChunkOrderLess(chunk, m_chunks.find(*pos)->second)) {
    ++pos;
  }
  m_chunkOrder.insert(pos, chunk.GetId());
}

}  // namespace Transfer
}  // namespace BX
