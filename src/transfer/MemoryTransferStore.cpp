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

#include "transfer/MemoryTransferStore.h"

#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"

#include "base/StringUtils.h"

namespace BX {

namespace Transfer {

using BX::Client::MakeGoodError;
using BX::Client::MakeNotFoundError;
using BX::Client::TransferClientError;
using BX::StringUtils::FormatTransferId;
using boost::lock_guard;
using boost::mutex;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
TransferClientError MemoryTransferStore::Save(const TransferRecord &record) {
  lock_guard<mutex> lock(m_lock);
  m_records[record.GetId()] = record;
  return MakeGoodError();
}

// --------------------------------------------------------------------------
TransferClientError MemoryTransferStore::SaveBatch(
    const vector<TransferRecord> &records) {
  lock_guard<mutex> lock(m_lock);
  BOOST_FOREACH (const TransferRecord &record, records) {
    m_records[record.GetId()] = record;
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
RecordOutcome MemoryTransferStore::Load(const string &id) {
  lock_guard<mutex> lock(m_lock);
  RecordMap::const_iterator it = m_records.find(id);
  if (it == m_records.end()) {
    return RecordOutcome(
        MakeNotFoundError("No record of " + FormatTransferId(id)));
  }
  return RecordOutcome(it->second);
}

// --------------------------------------------------------------------------
RecordListOutcome MemoryTransferStore::Query(
    const RecordPredicate &predicate) {
  vector<TransferRecord> result;
  lock_guard<mutex> lock(m_lock);
  BOOST_FOREACH (const RecordMap::value_type &p, m_records) {
    if (predicate(p.second)) {
      result.push_back(p.second);
    }
  }
  return RecordListOutcome(result);
}

// --------------------------------------------------------------------------
TransferClientError MemoryTransferStore::Delete(const string &id) {
  lock_guard<mutex> lock(m_lock);
  RecordMap::iterator it = m_records.find(id);
  if (it == m_records.end()) {
    return MakeNotFoundError("No record of " + FormatTransferId(id));
  }
  m_records.erase(it);
  for (RecordMap::iterator child = m_records.begin();
       child != m_records.end();) {
    if (child->second.GetParentId() == id) {
      m_records.erase(child++);
    } else {
      ++child;
    }
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
size_t MemoryTransferStore::GetRecordCount() {
  lock_guard<mutex> lock(m_lock);
  return m_records.size();
}

}  // namespace Transfer
}  // namespace BX
