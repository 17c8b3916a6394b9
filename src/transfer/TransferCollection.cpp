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

#include "transfer/TransferCollection.h"

#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/bind.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Utils.h"
#include "transfer/TransferManager.h"

namespace BX {

namespace Transfer {

using BX::Client::GetMessageForTransferError;
using BX::Client::IsGoodTransferError;
using BX::Client::MakeGoodError;
using BX::Client::MakeNotFoundError;
using BX::Client::TransferClientError;
using BX::StringUtils::EndsWith;
using BX::StringUtils::FormatTransferId;
using BX::StringUtils::LTrim;
using BX::StringUtils::StartsWith;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
bool TransferFilter::Matches(const TransferRecord &transfer) const {
  string path = BX::Client::Utils::GetUrlPath(transfer.GetRemoteUrl());
  if (m_containerName &&
      !StartsWith(LTrim(path, '/'), *m_containerName)) {
    return false;
  }
  if (m_blobName && !EndsWith(path, *m_blobName)) {
    return false;
  }
  if (m_localPath && transfer.GetLocalPath() != *m_localPath) {
    return false;
  }
  if (m_state && transfer.GetState() != *m_state) {
    return false;
  }
  return true;
}

// --------------------------------------------------------------------------
TransferCollection::TransferCollection(const vector<TransferRecord> &transfers,
                                       TransferManager &manager)
    : m_transfers(transfers), m_manager(manager) {}

// --------------------------------------------------------------------------
RecordOutcome TransferCollection::Get(const string &id) const {
  BOOST_FOREACH (const TransferRecord &transfer, m_transfers) {
    if (transfer.GetId() == id) {
      return RecordOutcome(transfer);
    }
  }
  return RecordOutcome(MakeNotFoundError("No transfer " +
                                         FormatTransferId(id)));
}

// --------------------------------------------------------------------------
vector<TransferRecord> TransferCollection::FilterWhere(
    const TransferFilter &filter) const {
  return Filter(boost::bind(&TransferFilter::Matches, &filter, _1));
}

// --------------------------------------------------------------------------
RecordOutcome TransferCollection::FirstWith(
    const TransferFilter &filter) const {
  return First(boost::bind(&TransferFilter::Matches, &filter, _1));
}

// --------------------------------------------------------------------------
vector<TransferRecord> TransferCollection::Filter(
    const RecordPredicate &predicate) const {
  vector<TransferRecord> result;
  BOOST_FOREACH (const TransferRecord &transfer, m_transfers) {
    if (predicate(transfer)) {
      result.push_back(transfer);
    }
  }
  return result;
}

// --------------------------------------------------------------------------
RecordOutcome TransferCollection::First(
    const RecordPredicate &predicate) const {
  BOOST_FOREACH (const TransferRecord &transfer, m_transfers) {
    if (predicate(transfer)) {
      return RecordOutcome(transfer);
    }
  }
  return RecordOutcome(MakeNotFoundError("No transfer matches"));
}

// --------------------------------------------------------------------------
TransferClientError TransferCollection::CancelAll() {
  return ApplyToAll(&TransferManager::Cancel, "cancel");
}

// --------------------------------------------------------------------------
TransferClientError TransferCollection::RemoveAll() {
  return ApplyToAll(&TransferManager::Remove, "remove");
}

// --------------------------------------------------------------------------
TransferClientError TransferCollection::PauseAll() {
  return ApplyToAll(&TransferManager::Pause, "pause");
}

// --------------------------------------------------------------------------
TransferClientError TransferCollection::ResumeAll() {
  return ApplyToAll(&TransferManager::Resume, "resume");
}

// --------------------------------------------------------------------------
TransferClientError TransferCollection::ApplyToAll(Operation operation,
                                                   const char *name) {
  TransferClientError firstErr = MakeGoodError();
  BOOST_FOREACH (const TransferRecord &transfer, m_transfers) {
    TransferClientError err = (m_manager.*operation)(transfer.GetId());
    if (!IsGoodTransferError(err)) {
      Warning("Unable to " + string(name) + " transfer " +
              FormatTransferId(transfer.GetId()) + " " +
              GetMessageForTransferError(err));
      if (IsGoodTransferError(firstErr)) {
        firstErr = err;
      }
    }
  }
  return firstErr;
}

}  // namespace Transfer
}  // namespace BX
