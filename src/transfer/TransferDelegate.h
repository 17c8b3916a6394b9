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

#ifndef BLOBXFER_TRANSFER_TRANSFERDELEGATE_H_
#define BLOBXFER_TRANSFER_TRANSFERDELEGATE_H_

#include <stdint.h>

#include "client/TransferError.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

//
// TransferDelegate
//
// Observer of transfers registered to a manager. Callbacks are invoked on
// the notification thread of the manager, one at a time and in the order
// the transitions were persisted.
//
class TransferDelegate {
 public:
  TransferDelegate() {}
  virtual ~TransferDelegate() {}

 public:
  // State or progress of a transfer changed, including pause, resume and
  // cancel
  virtual void OnTransferUpdated(const TransferRecord &transfer,
                                 TransferState::Value state,
                                 uint64_t bytesTransferred) {}

  // Transfer failed, or its state could not be persisted
  virtual void OnTransferFailed(const TransferRecord &transfer,
                                const BX::Client::TransferClientError &error) {
  }

  virtual void OnTransferCompleted(const TransferRecord &transfer) {}
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERDELEGATE_H_
