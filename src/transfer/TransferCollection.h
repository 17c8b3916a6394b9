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

#ifndef BLOBXFER_TRANSFER_TRANSFERCOLLECTION_H_
#define BLOBXFER_TRANSFER_TRANSFERCOLLECTION_H_

#include <stddef.h>

#include <string>
#include <vector>

#include "boost/optional.hpp"

#include "client/TransferError.h"
#include "transfer/TransferRecord.h"
#include "transfer/TransferStore.h"

namespace BX {

namespace Transfer {

class TransferManager;

// Conjunctive filter, an unset field matches every transfer.
// Container and blob name are matched against the path of the blob url.
struct TransferFilter {
  boost::optional<std::string> m_containerName;  // prefix of path
  boost::optional<std::string> m_blobName;       // suffix of path
  boost::optional<std::string> m_localPath;      // exact local path
  boost::optional<TransferState::Value> m_state;

  TransferFilter() {}

  bool Matches(const TransferRecord &transfer) const;
};

//
// TransferCollection
//
// Snapshot of the top-level transfers of a manager. Bulk operations apply
// the manager operation to every transfer of the snapshot, they are not
// atomic as a group.
//
class TransferCollection {
 public:
  TransferCollection(const std::vector<TransferRecord> &transfers,
                     TransferManager &manager);  // NOLINT

 public:
  const std::vector<TransferRecord> &All() const { return m_transfers; }
  size_t Size() const { return m_transfers.size(); }
  bool Empty() const { return m_transfers.empty(); }

  // Return NOT_FOUND if id is not in the snapshot
  RecordOutcome Get(const std::string &id) const;

  std::vector<TransferRecord> FilterWhere(const TransferFilter &filter) const;
  // Return NOT_FOUND if no transfer matches
  RecordOutcome FirstWith(const TransferFilter &filter) const;

  std::vector<TransferRecord> Filter(const RecordPredicate &predicate) const;
  // Return NOT_FOUND if no transfer matches
  RecordOutcome First(const RecordPredicate &predicate) const;

  // Apply the operation to every transfer
  //
  // @param  : void
  // @return : first error encountered, GOOD if none
  BX::Client::TransferClientError CancelAll();
  BX::Client::TransferClientError RemoveAll();
  BX::Client::TransferClientError PauseAll();
  BX::Client::TransferClientError ResumeAll();

 private:
  typedef BX::Client::TransferClientError (TransferManager::*Operation)(
      const std::string &);
  BX::Client::TransferClientError ApplyToAll(Operation operation,
                                             const char *name);

 private:
  std::vector<TransferRecord> m_transfers;
  TransferManager &m_manager;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERCOLLECTION_H_
