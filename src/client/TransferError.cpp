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

#include "client/TransferError.h"

#include <string.h>

#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

namespace BX {

namespace Client {

using boost::to_string;
using std::make_pair;
using std::pair;
using std::string;

namespace {

bool HttpStatusShouldRetry(int statusCode) {
  int codes[] = {
      // keep in sorted order
      408,  // RequestTimeout
      429,  // TooManyRequests
      500,  // InternalServerError
      502,  // BadGateway
      503,  // ServiceUnavailable
      504,  // GatewayTimeout
  };

  int n = sizeof(codes) / sizeof(codes[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (statusCode == codes[mid]) {
      return true;
    }
    if (statusCode < codes[mid]) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return false;
}

string HttpStatusToName(int statusCode) {
  pair<int, const char *> codeToNames[] = {
      // keep in sorted order
      make_pair(300, "MultipleChoices"),
      make_pair(301, "MovedPermanently"),
      make_pair(302, "Found"),
      make_pair(304, "NotModified"),
      make_pair(307, "TemporaryRedirect"),
      make_pair(400, "BadRequest"),
      make_pair(401, "Unauthorized"),
      make_pair(403, "Forbidden"),
      make_pair(404, "NotFound"),
      make_pair(405, "MethodNotAllowed"),
      make_pair(408, "RequestTimeout"),
      make_pair(409, "Conflict"),
      make_pair(412, "PreconditionFailed"),
      make_pair(416, "InvalidRange"),
      make_pair(429, "TooManyRequests"),
      make_pair(500, "InternalServerError"),
      make_pair(501, "NotImplemented"),
      make_pair(502, "BadGateway"),
      make_pair(503, "ServiceUnavailable"),
      make_pair(504, "GatewayTimeout"),
  };

  int n = sizeof(codeToNames) / sizeof(codeToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (statusCode == codeToNames[mid].first) {
      return string(codeToNames[mid].second) + "(" + to_string(statusCode) +
             ")";
    }
    if (statusCode < codeToNames[mid].first) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "HttpStatus(" + to_string(statusCode) + ")";
}

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value StringToTransferError(const string &name) {
  const char *err = name.c_str();
  if (strcmp(err, "Unknown") == 0) {
    return TransferError::UNKNOWN;
  }
  if (strcmp(err, "Good") == 0) {
    return TransferError::GOOD;
  }
  if (strcmp(err, "InvalidTransfer") == 0) {
    return TransferError::INVALID_TRANSFER;
  }
  if (strcmp(err, "TransientExecution") == 0) {
    return TransferError::TRANSIENT_EXECUTION;
  }
  if (strcmp(err, "PermanentExecution") == 0) {
    return TransferError::PERMANENT_EXECUTION;
  }
  if (strcmp(err, "Persistence") == 0) {
    return TransferError::PERSISTENCE;
  }
  if (strcmp(err, "NotFound") == 0) {
    return TransferError::NOT_FOUND;
  }
  if (strcmp(err, "TransferCancelled") == 0) {
    return TransferError::TRANSFER_CANCELLED;
  }

  return TransferError::UNKNOWN;
}

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  pair<TransferError::Value, const char *> errToNames[] = {
      // keep in sorted order
      make_pair(TransferError::UNKNOWN, "Unknown"),
      make_pair(TransferError::GOOD, "Good"),
      make_pair(TransferError::INVALID_TRANSFER, "InvalidTransfer"),
      make_pair(TransferError::TRANSIENT_EXECUTION, "TransientExecution"),
      make_pair(TransferError::PERMANENT_EXECUTION, "PermanentExecution"),
      make_pair(TransferError::PERSISTENCE, "Persistence"),
      make_pair(TransferError::NOT_FOUND, "NotFound"),
      make_pair(TransferError::TRANSFER_CANCELLED, "TransferCancelled"),
  };

  int n = sizeof(errToNames) / sizeof(errToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(const TransferClientError &error) {
  return TransferErrorToString(error.GetError()) + ":" +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const TransferClientError &error) {
  return error.GetError() == TransferError::GOOD;
}

// --------------------------------------------------------------------------
TransferClientError GetErrorForHttpStatus(int statusCode,
                                          const string &message) {
  if (HttpStatusShouldRetry(statusCode)) {
    return TransferClientError(TransferError::TRANSIENT_EXECUTION,
                               HttpStatusToName(statusCode), message, true,
                               statusCode);
  }
  return TransferClientError(TransferError::PERMANENT_EXECUTION,
                             HttpStatusToName(statusCode), message, false,
                             statusCode);
}

// --------------------------------------------------------------------------
TransferClientError MakeGoodError() {
  return TransferClientError(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
TransferClientError MakeInvalidTransferError(const string &message) {
  return TransferClientError(TransferError::INVALID_TRANSFER,
                             "InvalidTransferError", message, false);
}

// --------------------------------------------------------------------------
TransferClientError MakeTransientExecutionError(const string &message) {
  return TransferClientError(TransferError::TRANSIENT_EXECUTION,
                             "TransientExecutionError", message, true);
}

// --------------------------------------------------------------------------
TransferClientError MakePermanentExecutionError(const string &message) {
  return TransferClientError(TransferError::PERMANENT_EXECUTION,
                             "PermanentExecutionError", message, false);
}

// --------------------------------------------------------------------------
TransferClientError MakePersistenceError(const string &message) {
  return TransferClientError(TransferError::PERSISTENCE, "PersistenceError",
                             message, false);
}

// --------------------------------------------------------------------------
TransferClientError MakeNotFoundError(const string &message) {
  return TransferClientError(TransferError::NOT_FOUND, "NotFoundError",
                             message, false);
}

// --------------------------------------------------------------------------
TransferClientError MakeTransferCancelledError(const string &message) {
  return TransferClientError(TransferError::TRANSFER_CANCELLED,
                             "TransferCancelledError", message, false);
}

}  // namespace Client
}  // namespace BX
