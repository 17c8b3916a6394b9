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

#ifndef BLOBXFER_CLIENT_HTTPPIPELINE_H_
#define BLOBXFER_CLIENT_HTTPPIPELINE_H_

#include "boost/noncopyable.hpp"

#include "client/Http.h"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace BX {

namespace Client {

typedef Outcome<Http::HttpResponse, TransferClientError> HttpOutcome;

// HttpPipeline
//
// The request/response pipeline of the storage service, including its
// policy chain of authentication, wire retry and content decoding. Send is
// called concurrently from the chunk worker threads.
//
// A response with any status code is a successful outcome; the outcome
// carries an error only when no response was received. The error keeps
// its own retryable flag.
class HttpPipeline : private boost::noncopyable {
 public:
  HttpPipeline() {}
  virtual ~HttpPipeline() {}

 public:
  virtual HttpOutcome Send(const Http::HttpRequest &request) = 0;
};

}  // namespace Client
}  // namespace BX

#endif  // BLOBXFER_CLIENT_HTTPPIPELINE_H_
