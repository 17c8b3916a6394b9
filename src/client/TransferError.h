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

#ifndef BLOBXFER_CLIENT_TRANSFERERROR_H_
#define BLOBXFER_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace BX {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,
    INVALID_TRANSFER,      // rejected at add, never persisted as active
    TRANSIENT_EXECUTION,   // retried by the manager
    PERMANENT_EXECUTION,   // drives the chunk and its parent to failed
    PERSISTENCE,           // store read or write failure
    NOT_FOUND,             // unknown transfer id or store miss
    TRANSFER_CANCELLED     // chunk abandoned by pause or cancel
  };
};

typedef ClientError<TransferError::Value> TransferClientError;

std::string TransferErrorToString(TransferError::Value err);
TransferError::Value StringToTransferError(const std::string &name);

// Build the message of an error, format: "Code:Exception:Message"
std::string GetMessageForTransferError(const TransferClientError &error);

bool IsGoodTransferError(const TransferClientError &error);

// Classify a http status code which is not in the 2xx range
//
// @param  : status code, message
// @return : transient error for 408, 429, 500, 502, 503, 504,
//           permanent error for others
TransferClientError GetErrorForHttpStatus(int statusCode,
                                          const std::string &message);

TransferClientError MakeGoodError();
TransferClientError MakeInvalidTransferError(const std::string &message);
TransferClientError MakeTransientExecutionError(const std::string &message);
TransferClientError MakePermanentExecutionError(const std::string &message);
TransferClientError MakePersistenceError(const std::string &message);
TransferClientError MakeNotFoundError(const std::string &message);
TransferClientError MakeTransferCancelledError(const std::string &message);

}  // namespace Client
}  // namespace BX

#endif  // BLOBXFER_CLIENT_TRANSFERERROR_H_
