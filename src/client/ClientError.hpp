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

#ifndef BLOBXFER_CLIENT_CLIENTERROR_HPP_
#define BLOBXFER_CLIENT_CLIENTERROR_HPP_

#include <string>

namespace BX {

namespace Client {

// Error value carried by every transfer operation. The retryable flag is
// what separates a transient failure from a permanent one. An error built
// from a storage service response keeps its http status, 0 otherwise.
template <typename ERROR_TYPE>
class ClientError {
 public:
  ClientError()
      : m_error(ERROR_TYPE()), m_isRetryable(false), m_httpStatus(0) {}
  ClientError(ERROR_TYPE error, const std::string &exceptionName,
              const std::string &errorMsg, bool isRetryable,
              int httpStatus = 0)
      : m_error(error),
        m_exceptionName(exceptionName),
        m_message(errorMsg),
        m_isRetryable(isRetryable),
        m_httpStatus(httpStatus) {}
  ClientError(ERROR_TYPE error, bool isRetryable)
      : m_error(error), m_isRetryable(isRetryable), m_httpStatus(0) {}

 public:
  ERROR_TYPE GetError() const { return m_error; }
  const std::string &GetExceptionName() const { return m_exceptionName; }
  const std::string &GetMessage() const { return m_message; }
  bool ShouldRetry() const { return m_isRetryable; }
  int GetHttpStatus() const { return m_httpStatus; }
  bool HasHttpStatus() const { return m_httpStatus != 0; }

  void SetMessage(const std::string &message) { m_message = message; }

 private:
  ERROR_TYPE m_error;
  std::string m_exceptionName;
  std::string m_message;
  bool m_isRetryable;
  int m_httpStatus;
};

}  // namespace Client
}  // namespace BX

#endif  // BLOBXFER_CLIENT_CLIENTERROR_HPP_
