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

#ifndef BLOBXFER_TRANSFER_TRANSFERMANAGER_H_
#define BLOBXFER_TRANSFER_TRANSFERMANAGER_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "configure/Default.h"
#include "transfer/ChunkExecutor.h"
#include "transfer/ChunkPlanner.h"
#include "transfer/TransferRecord.h"
#include "transfer/TransferStore.h"

namespace BX {

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Transfer {

class TransferCollection;
class TransferDelegate;
class TransferHandle;

struct TransferManagerConfigure {
  // Number of chunks executed in parallel
  size_t m_maxParallelTransfers;

  // Downloads of known size larger than the threshold are split into
  // chunks of chunk size
  uint64_t m_downloadChunkSize;
  uint64_t m_downloadSplitThreshold;

  uint64_t m_uploadBlockSize;

  // Retries of a chunk failed with a transient error, the delay before the
  // n-th retry is 2^n * scale factor milliseconds
  uint16_t m_maxChunkRetries;
  uint16_t m_retryScaleFactor;

  TransferManagerConfigure(
      size_t maxParallelTransfers =
          BX::Configure::Default::GetDefaultParallelTransfers(),
      uint64_t downloadChunkSize =
          BX::Configure::Default::GetDefaultDownloadChunkSize(),
      uint64_t downloadSplitThreshold =
          BX::Configure::Default::GetDefaultDownloadSplitThreshold(),
      uint64_t uploadBlockSize =
          BX::Configure::Default::GetDefaultUploadBlockSize(),
      uint16_t maxChunkRetries =
          BX::Configure::Default::GetDefaultChunkRetries(),
      uint16_t retryScaleFactor =
          BX::Configure::Default::GetDefaultRetryScaleFactor())
      : m_maxParallelTransfers(maxParallelTransfers),
        m_downloadChunkSize(downloadChunkSize),
        m_downloadSplitThreshold(downloadSplitThreshold),
        m_uploadBlockSize(uploadBlockSize),
        m_maxChunkRetries(maxChunkRetries),
        m_retryScaleFactor(retryScaleFactor) {}
};

//
// TransferManager
//
// Tracks every transfer of a store, splits transfers into chunks, executes
// chunks on a bounded worker pool and folds chunk outcomes into transfer
// state. Every transition is saved to the store before the in-memory state
// is updated and before delegates are notified.
//
// Initialize must succeed before any other operation. Operations on a
// transfer take its top-level id.
//
class TransferManager : private boost::noncopyable {
 public:
  TransferManager(const TransferManagerConfigure &config,
                  const boost::shared_ptr<TransferStore> &store,
                  const boost::shared_ptr<ChunkExecutor> &chunkExecutor);

  // Stop admitting chunks, wait for running chunks. Chunks left in progress
  // are resumed by the next Initialize on the same store.
  ~TransferManager();

 public:
  // Start workers and resume unfinished transfers of the store
  //
  // @param  : void
  // @return : INVALID_TRANSFER for an invalid configure, PERSISTENCE if the
  //           store cannot be queried
  BX::Client::TransferClientError Initialize();

  // Persist a transfer with its chunks and start it
  //
  // @param  : top-level pending record, see MakeDownloadRecord and
  //           MakeUploadRecord
  // @return : INVALID_TRANSFER for malformed endpoints, an unreadable
  //           upload source or a known id, PERSISTENCE if it cannot be saved
  BX::Client::TransferClientError Add(const TransferRecord &transfer);

  // Pause transfer, chunks in flight finish but no new chunk is started.
  // No-op for paused or terminal transfer.
  BX::Client::TransferClientError Pause(const std::string &id);

  // Resume paused transfer, only incomplete chunks are executed again.
  // No-op for transfer which is not paused.
  BX::Client::TransferClientError Resume(const std::string &id);

  // Cancel transfer, chunks in flight are abandoned. The record is kept.
  // No-op for terminal transfer.
  BX::Client::TransferClientError Cancel(const std::string &id);

  // Cancel transfer, wait for its chunks in flight, delete the partial
  // local file of an incomplete download and delete the records
  BX::Client::TransferClientError Remove(const std::string &id);

  RecordOutcome Get(const std::string &id) const;
  RecordListOutcome GetChunks(const std::string &id) const;

  // Error of a failed or halted transfer, GOOD if none
  BX::Client::TransferClientError GetError(const std::string &id) const;

  // Block until transfer is terminal, or is paused or halted with no chunk
  // in flight
  //
  // @param  : transfer id
  // @return : record at the time it settled, NOT_FOUND for unknown id
  RecordOutcome WaitUntilFinished(const std::string &id) const;

  // Snapshot of all top-level transfers in the order they were added
  TransferCollection Transfers();

  void AddDelegate(const boost::shared_ptr<TransferDelegate> &delegate);
  void RemoveDelegate(const boost::shared_ptr<TransferDelegate> &delegate);

  const TransferManagerConfigure &GetConfigure() const { return m_configure; }
  size_t GetTransferCount() const;

 private:
  typedef std::map<std::string, boost::shared_ptr<TransferHandle> >
      HandleMap;

  boost::shared_ptr<TransferHandle> FindHandle(const std::string &id) const;
  void IndexHandle(const boost::shared_ptr<TransferHandle> &handle);
  void UnindexHandle(const std::string &id);
  bool IsStopping() const;

  // The following methods require the lock of the handle
  bool ShouldRunChunks(const TransferHandle &handle) const;
  BX::Client::TransferClientError PersistFamily(
      TransferHandle *handle, const std::vector<TransferRecord> &chunks,
      const TransferRecord &transfer);
  BX::Client::TransferClientError AdmitReadyChunks(
      const boost::shared_ptr<TransferHandle> &handle);
  void OnChunkSucceeded(const boost::shared_ptr<TransferHandle> &handle,
                        const std::string &chunkId,
                        const ChunkResult &result);
  void OnChunkFailed(const boost::shared_ptr<TransferHandle> &handle,
                     const std::string &chunkId,
                     const BX::Client::TransferClientError &error);
  void OnChunkInterrupted(const boost::shared_ptr<TransferHandle> &handle,
                          const std::string &chunkId);
  void OnPersistenceFailure(const boost::shared_ptr<TransferHandle> &handle,
                            const BX::Client::TransferClientError &error);
  void NotifyTransition(const TransferRecord &previous,
                        const TransferRecord &current);
  bool WaitBeforeRetry(const boost::shared_ptr<TransferHandle> &handle,
                       boost::unique_lock<boost::mutex> &lock,
                       uint32_t delayInMilliseconds);

  // Worker task of a chunk
  void RunChunk(const boost::shared_ptr<TransferHandle> &handle,
                const std::string &chunkId);

  BX::Client::TransferClientError ResumeFromStore(
      const TransferRecord &transfer, const std::vector<TransferRecord> &chunks);

  // Run on the notification thread
  void DoNotifyUpdated(const TransferRecord &transfer);
  void DoNotifyFailed(const TransferRecord &transfer,
                      const BX::Client::TransferClientError &error);
  void DoNotifyCompleted(const TransferRecord &transfer);
  std::vector<boost::shared_ptr<TransferDelegate> > GetDelegates() const;

 private:
  TransferManagerConfigure m_configure;
  ChunkPlanner m_planner;
  BX::Client::RetryStrategy m_retryStrategy;
  boost::shared_ptr<TransferStore> m_store;
  boost::shared_ptr<ChunkExecutor> m_chunkExecutor;

  HandleMap m_handles;
  std::vector<std::string> m_handleOrder;
  mutable boost::mutex m_handlesLock;

  std::vector<boost::shared_ptr<TransferDelegate> > m_delegates;
  mutable boost::mutex m_delegatesLock;

  bool m_initialized;
  bool m_stopping;
  mutable boost::mutex m_stateLock;

  // Workers executing chunks
  boost::shared_ptr<BX::Threading::ThreadPool> m_executor;
  // Single worker delivering notifications in order
  boost::shared_ptr<BX::Threading::ThreadPool> m_notifier;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_TRANSFERMANAGER_H_
