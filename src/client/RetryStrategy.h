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

#ifndef BLOBXFER_CLIENT_RETRYSTRATEGY_H_
#define BLOBXFER_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "client/TransferError.h"

namespace BX {

namespace Client {

// Retry policy for a chunk. The delay before the n-th retry is
// 2^n * scaleFactor milliseconds, n stops growing at the max chunk retries.
class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxRetryTimes, uint16_t scaleFactor)
      : m_maxRetryTimes(maxRetryTimes), m_scaleFactor(scaleFactor) {}

  bool ShouldRetry(const TransferClientError &error,
                   uint16_t attemptedRetryTimes) const;

  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }
  uint16_t GetScaleFactor() const { return m_scaleFactor; }

 private:
  RetryStrategy() {}
  uint16_t m_maxRetryTimes;
  uint16_t m_scaleFactor;
};

RetryStrategy GetDefaultRetryStrategy();

}  // namespace Client
}  // namespace BX

#endif  // BLOBXFER_CLIENT_RETRYSTRATEGY_H_
