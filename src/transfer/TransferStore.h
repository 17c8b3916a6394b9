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

#ifndef BLOBXFER_TRANSFER_TRANSFERSTORE_H_
#define BLOBXFER_TRANSFER_TRANSFERSTORE_H_

#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"

#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

typedef boost::function<bool(const TransferRecord &)> RecordPredicate;
typedef BX::Client::Outcome<TransferRecord, BX::Client::TransferClientError>
    RecordOutcome;
typedef BX::Client::Outcome<std::vector<TransferRecord>,
                            BX::Client::TransferClientError>
    RecordListOutcome;

//
// TransferStore
//
// Durable storage of transfer records, safe for concurrent use. Every
// write is atomic, a crash between two writes leaves each committed write
// intact. Write operations return GOOD on success, PERSISTENCE on i/o
// failure and NOT_FOUND for a missing id.
//
class TransferStore : private boost::noncopyable {
 public:
  TransferStore() {}
  virtual ~TransferStore() {}

 public:
  // Insert or update a record
  virtual BX::Client::TransferClientError Save(
      const TransferRecord &record) = 0;

  // Insert or update records as a whole, either all or none of them are
  // visible after return
  virtual BX::Client::TransferClientError SaveBatch(
      const std::vector<TransferRecord> &records) = 0;

  virtual RecordOutcome Load(const std::string &id) = 0;

  // Return all records matching predicate
  virtual RecordListOutcome Query(const RecordPredicate &predicate) = 0;

  // Remove a record and its children
  virtual BX::Client::TransferClientError Delete(const std::string &id) = 0;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERSTORE_H_
