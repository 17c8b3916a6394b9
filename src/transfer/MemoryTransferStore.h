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

#ifndef BLOBXFER_TRANSFER_MEMORYTRANSFERSTORE_H_
#define BLOBXFER_TRANSFER_MEMORYTRANSFERSTORE_H_

#include <map>
#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "transfer/TransferStore.h"

namespace BX {

namespace Transfer {

// Transfer store kept in process memory, records live as long as the
// store object.
class MemoryTransferStore : public TransferStore {
 public:
  MemoryTransferStore() {}
  ~MemoryTransferStore() {}

 public:
  BX::Client::TransferClientError Save(const TransferRecord &record);
  BX::Client::TransferClientError SaveBatch(
      const std::vector<TransferRecord> &records);
  RecordOutcome Load(const std::string &id);
  RecordListOutcome Query(const RecordPredicate &predicate);
  BX::Client::TransferClientError Delete(const std::string &id);

  size_t GetRecordCount();

 private:
  typedef std::map<std::string, TransferRecord> RecordMap;
  RecordMap m_records;
  boost::mutex m_lock;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_MEMORYTRANSFERSTORE_H_
