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

#include "transfer/TransferManager.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/LogMacros.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/Utils.h"
#include "transfer/TransferCollection.h"
#include "transfer/TransferDelegate.h"
#include "transfer/TransferHandle.h"

namespace BX {

namespace Transfer {

using BX::Client::GetMessageForTransferError;
using BX::Client::IsGoodTransferError;
using BX::Client::MakeGoodError;
using BX::Client::MakeInvalidTransferError;
using BX::Client::MakeNotFoundError;
using BX::Client::MakePermanentExecutionError;
using BX::Client::TransferClientError;
using BX::Client::TransferError;
using BX::StringUtils::FormatPath;
using BX::StringUtils::FormatTransferId;
using BX::Threading::ThreadPool;
using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using std::map;
using std::pair;
using std::string;
using std::vector;

namespace {

bool AnyRecord(const TransferRecord &record) { return true; }

TransferClientError ValidateConfigure(const TransferManagerConfigure &config) {
  if (config.m_maxParallelTransfers == 0) {
    return MakeInvalidTransferError("Zero parallel transfers");
  }
  if (config.m_downloadChunkSize == 0) {
    return MakeInvalidTransferError("Zero download chunk size");
  }
  if (config.m_uploadBlockSize == 0) {
    return MakeInvalidTransferError("Zero upload block size");
  }
  if (config.m_maxChunkRetries >
      BX::Configure::Default::GetMaxChunkRetries()) {
    return MakeInvalidTransferError(
        "Chunk retries " + to_string(config.m_maxChunkRetries) +
        " exceeds limit " +
        to_string(BX::Configure::Default::GetMaxChunkRetries()));
  }
  if (config.m_uploadBlockSize >
      BX::Configure::Default::GetUploadMaxBlockSize()) {
    return MakeInvalidTransferError(
        "Upload block size " + to_string(config.m_uploadBlockSize) +
        " exceeds limit " +
        to_string(BX::Configure::Default::GetUploadMaxBlockSize()));
  }
  return MakeGoodError();
}

TransferClientError ValidateEndpoints(const TransferRecord &transfer) {
  if (!BX::Client::Utils::IsValidBlobUrl(transfer.GetRemoteUrl())) {
    return MakeInvalidTransferError("Malformed blob url '" +
                                    transfer.GetRemoteUrl() + "'");
  }
  const string &localPath = transfer.GetLocalPath();
  if (localPath.empty() || !BX::Utils::IsAbsolutePath(localPath) ||
      localPath[localPath.size() - 1] == '/') {
    return MakeInvalidTransferError("Malformed local path " +
                                    FormatPath(localPath));
  }
  if (transfer.IsDownload()) {
    string dir = BX::Utils::GetDirName(localPath);
    if (dir.empty() || !BX::Utils::IsDirectory(dir).first) {
      return MakeInvalidTransferError("No such directory " + FormatPath(dir));
    }
  }
  return MakeGoodError();
}

}  // namespace

// --------------------------------------------------------------------------
TransferManager::TransferManager(const TransferManagerConfigure &config,
                                 const shared_ptr<TransferStore> &store,
                                 const shared_ptr<ChunkExecutor> &chunkExecutor)
    : m_configure(config),
      m_planner(config.m_downloadChunkSize, config.m_downloadSplitThreshold,
                config.m_uploadBlockSize,
                BX::Configure::Default::GetUploadMaxBlockCount()),
      m_retryStrategy(config.m_maxChunkRetries, config.m_retryScaleFactor),
      m_store(store),
      m_chunkExecutor(chunkExecutor),
      m_initialized(false),
      m_stopping(false) {
  m_executor = shared_ptr<ThreadPool>(
      new ThreadPool(config.m_maxParallelTransfers, "chunk"));
  m_notifier = shared_ptr<ThreadPool>(new ThreadPool(1, "notification"));
}

// --------------------------------------------------------------------------
TransferManager::~TransferManager() {
  {
    lock_guard<mutex> lock(m_stateLock);
    m_stopping = true;
  }
  vector<shared_ptr<TransferHandle> > handles;
  {
    lock_guard<mutex> lock(m_handlesLock);
    BOOST_FOREACH (const HandleMap::value_type &p, m_handles) {
      handles.push_back(p.second);
    }
  }
  // wake up chunks waiting for retry
  BOOST_FOREACH (const shared_ptr<TransferHandle> &handle, handles) {
    lock_guard<mutex> lock(handle->m_lock);
    handle->m_signal.notify_all();
  }

  // running chunks may still notify, so executor goes first
  m_executor.reset();
  m_notifier.reset();

  lock_guard<mutex> lock(m_handlesLock);
  m_handles.clear();
  m_handleOrder.clear();
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Initialize() {
  {
    lock_guard<mutex> lock(m_stateLock);
    if (m_initialized) {
      DebugWarning("Transfer manager is already initialized");
      return MakeGoodError();
    }
  }
  TransferClientError err = ValidateConfigure(m_configure);
  if (!IsGoodTransferError(err)) {
    Error("Invalid transfer manager configure " +
          GetMessageForTransferError(err));
    return err;
  }
  if (!m_store || !m_chunkExecutor) {
    return MakeInvalidTransferError("Null transfer store or chunk executor");
  }

  RecordListOutcome outcome = m_store->Query(AnyRecord);
  if (!outcome.IsSuccess()) {
    Error("Unable to query transfer store " +
          GetMessageForTransferError(outcome.GetError()));
    return outcome.GetError();
  }

  m_executor->Initialize();
  m_notifier->Initialize();
  {
    lock_guard<mutex> lock(m_stateLock);
    m_initialized = true;
  }

  vector<TransferRecord> transfers;
  map<string, vector<TransferRecord> > chunks;
  BOOST_FOREACH (const TransferRecord &record, outcome.GetResult()) {
    if (record.IsChunk()) {
      chunks[record.GetParentId()].push_back(record);
    } else {
      transfers.push_back(record);
    }
  }

  TransferClientError firstErr = MakeGoodError();
  size_t resumed = 0;
  BOOST_FOREACH (const TransferRecord &transfer, transfers) {
    if (!transfer.IsTerminal()) {
      ++resumed;
    }
    err = ResumeFromStore(transfer, chunks[transfer.GetId()]);
    if (!IsGoodTransferError(err) && IsGoodTransferError(firstErr)) {
      firstErr = err;
    }
  }
  Info("Initialized transfer manager with " + to_string(transfers.size()) +
       " transfers, " + to_string(resumed) + " unfinished");
  return firstErr;
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::ResumeFromStore(
    const TransferRecord &transfer, const vector<TransferRecord> &chunks) {
  shared_ptr<TransferHandle> handle =
      boost::make_shared<TransferHandle>(transfer, chunks);
  IndexHandle(handle);
  if (transfer.IsTerminal()) {
    return MakeGoodError();
  }

  lock_guard<mutex> lock(handle->m_lock);
  vector<TransferRecord> staged;
  if (chunks.empty()) {
    ChunkPlanOutcome plan = m_planner.Plan(transfer);
    if (!plan.IsSuccess()) {
      Error("Unable to plan chunks of " + transfer.ToString() + " " +
            GetMessageForTransferError(plan.GetError()));
      handle->m_halted = true;
      handle->m_haltError = plan.GetError();
      return plan.GetError();
    }
    staged = plan.GetResult();
  }
  // chunks left in progress by the last run are executed again
  BOOST_FOREACH (const TransferRecord &chunk, handle->GetChunks()) {
    if (chunk.GetState() == TransferState::InProgress) {
      TransferRecord reset(chunk);
      reset.SetState(TransferState::Pending);
      staged.push_back(reset);
    }
  }

  TransferRecord reconciled =
      ReconcileTransfer(transfer, handle->GetChunksWith(staged));
  if (!staged.empty() || reconciled.GetState() != transfer.GetState() ||
      reconciled.GetBytesTransferred() != transfer.GetBytesTransferred()) {
    TransferClientError err = PersistFamily(handle.get(), staged, reconciled);
    if (!IsGoodTransferError(err)) {
      handle->m_halted = true;
      handle->m_haltError = err;
      return err;
    }
  }
  Info("Resume transfer " + reconciled.ToString() + " with " +
       to_string(staged.size()) + " chunks reset");
  NotifyTransition(transfer, reconciled);
  return AdmitReadyChunks(handle);
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Add(const TransferRecord &transfer) {
  {
    lock_guard<mutex> lock(m_stateLock);
    if (!m_initialized || m_stopping) {
      return MakeInvalidTransferError("Transfer manager is not running");
    }
  }
  if (transfer.IsChunk()) {
    return MakeInvalidTransferError("Not a top-level transfer " +
                                    transfer.ToString());
  }
  if (!IsValidTransferId(transfer.GetId())) {
    return MakeInvalidTransferError("Malformed transfer id '" +
                                    transfer.GetId() + "'");
  }
  if (transfer.GetState() != TransferState::Pending) {
    return MakeInvalidTransferError("Not a pending transfer " +
                                    transfer.ToString());
  }
  TransferClientError err = ValidateEndpoints(transfer);
  if (!IsGoodTransferError(err)) {
    Warning("Reject transfer " + transfer.ToString() + " " +
            GetMessageForTransferError(err));
    return err;
  }
  if (FindHandle(transfer.GetId())) {
    return MakeInvalidTransferError("Transfer already exists " +
                                    FormatTransferId(transfer.GetId()));
  }
  RecordOutcome existing = m_store->Load(transfer.GetId());
  if (existing.IsSuccess()) {
    return MakeInvalidTransferError("Transfer already exists " +
                                    FormatTransferId(transfer.GetId()));
  } else if (existing.GetError().GetError() != TransferError::NOT_FOUND) {
    return existing.GetError();
  }

  TransferRecord record(transfer);
  if (record.IsUpload()) {
    if (record.GetStartOffset() != 0) {
      return MakeInvalidTransferError("Upload must start at offset 0 " +
                                      record.ToString());
    }
    pair<uint64_t, string> size =
        BX::Utils::GetReadableFileSize(record.GetSource());
    if (!size.second.empty()) {
      Warning("Reject transfer " + record.ToString() + " " + size.second);
      return MakeInvalidTransferError(size.second);
    }
    record.SetEndOffset(size.first);
  }

  ChunkPlanOutcome plan = m_planner.Plan(record);
  if (!plan.IsSuccess()) {
    Warning("Reject transfer " + record.ToString() + " " +
            GetMessageForTransferError(plan.GetError()));
    return plan.GetError();
  }
  const vector<TransferRecord> &chunks = plan.GetResult();
  record = ReconcileTransfer(record, chunks);
  if (record.IsDownload()) {
    // no bytes of an earlier file may outlive the download
    pair<bool, string> resized = BX::Utils::ResizeFile(
        record.GetDestination(),
        record.IsSizeKnown() ? record.GetTotalBytes() : 0);
    if (!resized.first) {
      Warning("Reject transfer " + record.ToString() + " " + resized.second);
      return MakeInvalidTransferError(resized.second);
    }
  }

  shared_ptr<TransferHandle> handle =
      boost::make_shared<TransferHandle>(record, chunks);
  {
    lock_guard<mutex> lock(handle->m_lock);
    vector<TransferRecord> batch(chunks);
    batch.push_back(record);
    err = m_store->SaveBatch(batch);
    if (!IsGoodTransferError(err)) {
      Error("Unable to save transfer " + record.ToString() + " " +
            GetMessageForTransferError(err));
      return err;
    }
  }
  IndexHandle(handle);
  Info("Added transfer " + record.ToString() + " with " +
       to_string(chunks.size()) + " chunks");

  lock_guard<mutex> lock(handle->m_lock);
  NotifyTransition(transfer, handle->GetTransfer());
  return AdmitReadyChunks(handle);
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Pause(const string &id) {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return MakeNotFoundError("No transfer " + FormatTransferId(id));
  }
  lock_guard<mutex> lock(handle->m_lock);
  TransferRecord previous = handle->GetTransfer();
  if (previous.IsTerminal() ||
      previous.GetState() == TransferState::Paused) {
    DebugInfo("Skip pausing transfer " + previous.ToString());
    return MakeGoodError();
  }
  TransferRecord transfer(previous);
  transfer.SetState(TransferState::Paused);
  TransferClientError err =
      PersistFamily(handle.get(), vector<TransferRecord>(), transfer);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  Info("Paused transfer " + transfer.ToString() + " with " +
       to_string(handle->GetInFlightCount()) + " chunks in flight");
  NotifyTransition(previous, transfer);
  return err;
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Resume(const string &id) {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return MakeNotFoundError("No transfer " + FormatTransferId(id));
  }
  lock_guard<mutex> lock(handle->m_lock);
  TransferRecord previous = handle->GetTransfer();
  if (previous.IsTerminal() ||
      (previous.GetState() != TransferState::Paused && !handle->IsHalted())) {
    DebugInfo("Skip resuming transfer " + previous.ToString());
    return MakeGoodError();
  }
  handle->m_halted = false;
  handle->m_haltError = MakeGoodError();

  // chunks whose result was not persisted are executed again
  vector<TransferRecord> staged;
  BOOST_FOREACH (const TransferRecord &chunk, handle->GetChunks()) {
    if (chunk.GetState() == TransferState::InProgress &&
        !handle->IsChunkInFlight(chunk.GetId())) {
      TransferRecord reset(chunk);
      reset.SetState(TransferState::Pending);
      staged.push_back(reset);
    }
  }
  TransferRecord transfer(previous);
  transfer.SetState(TransferState::Pending);
  transfer = ReconcileTransfer(transfer, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, transfer);
  if (!IsGoodTransferError(err)) {
    handle->m_halted = true;
    handle->m_haltError = err;
    return err;
  }
  Info("Resumed transfer " + transfer.ToString());
  NotifyTransition(previous, transfer);
  return AdmitReadyChunks(handle);
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Cancel(const string &id) {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return MakeNotFoundError("No transfer " + FormatTransferId(id));
  }
  lock_guard<mutex> lock(handle->m_lock);
  TransferRecord previous = handle->GetTransfer();
  if (previous.IsTerminal()) {
    DebugInfo("Skip cancelling transfer " + previous.ToString());
    return MakeGoodError();
  }

  vector<TransferRecord> staged;
  BOOST_FOREACH (const TransferRecord &chunk, handle->GetChunks()) {
    if (!chunk.IsTerminal()) {
      TransferRecord cancelled(chunk);
      cancelled.SetState(TransferState::Cancelled);
      staged.push_back(cancelled);
    }
  }
  TransferRecord transfer(previous);
  transfer.SetState(TransferState::Cancelled);
  transfer = ReconcileTransfer(transfer, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, transfer);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  Info("Cancelled transfer " + transfer.ToString() + " with " +
       to_string(handle->GetInFlightCount()) + " chunks in flight");
  NotifyTransition(previous, transfer);
  return err;
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::Remove(const string &id) {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return MakeNotFoundError("No transfer " + FormatTransferId(id));
  }
  TransferClientError err = Cancel(id);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  {
    unique_lock<mutex> lock(handle->m_lock);
    while (handle->GetInFlightCount() > 0) {
      handle->m_signal.wait(lock);
    }
    const TransferRecord &transfer = handle->GetTransfer();
    if (transfer.IsDownload() &&
        transfer.GetState() != TransferState::Complete) {
      if (!BX::Utils::RemoveFileIfExists(transfer.GetDestination())) {
        Warning("Unable to remove partial download " +
                FormatPath(transfer.GetDestination()));
      }
    }
    err = m_store->Delete(id);
    if (!IsGoodTransferError(err) &&
        err.GetError() != TransferError::NOT_FOUND) {
      Error("Unable to remove transfer " + transfer.ToString() + " " +
            GetMessageForTransferError(err));
      return err;
    }
    handle->m_removed = true;
    handle->m_signal.notify_all();
  }
  UnindexHandle(id);
  Info("Removed transfer " + FormatTransferId(id));
  return MakeGoodError();
}

// --------------------------------------------------------------------------
RecordOutcome TransferManager::Get(const string &id) const {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return RecordOutcome(MakeNotFoundError("No transfer " +
                                           FormatTransferId(id)));
  }
  lock_guard<mutex> lock(handle->m_lock);
  return RecordOutcome(handle->GetTransfer());
}

// --------------------------------------------------------------------------
RecordListOutcome TransferManager::GetChunks(const string &id) const {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return RecordListOutcome(MakeNotFoundError("No transfer " +
                                               FormatTransferId(id)));
  }
  lock_guard<mutex> lock(handle->m_lock);
  return RecordListOutcome(handle->GetChunks());
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::GetError(const string &id) const {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return MakeNotFoundError("No transfer " + FormatTransferId(id));
  }
  lock_guard<mutex> lock(handle->m_lock);
  return handle->GetError();
}

// --------------------------------------------------------------------------
RecordOutcome TransferManager::WaitUntilFinished(const string &id) const {
  shared_ptr<TransferHandle> handle = FindHandle(id);
  if (!handle) {
    return RecordOutcome(MakeNotFoundError("No transfer " +
                                           FormatTransferId(id)));
  }
  unique_lock<mutex> lock(handle->m_lock);
  while (!handle->IsSettled() && !IsStopping()) {
    handle->m_signal.wait(lock);
  }
  return RecordOutcome(handle->GetTransfer());
}

// --------------------------------------------------------------------------
TransferCollection TransferManager::Transfers() {
  vector<shared_ptr<TransferHandle> > handles;
  {
    lock_guard<mutex> lock(m_handlesLock);
    BOOST_FOREACH (const string &id, m_handleOrder) {
      HandleMap::const_iterator it = m_handles.find(id);
      if (it != m_handles.end()) {
        handles.push_back(it->second);
      }
    }
  }
  vector<TransferRecord> transfers;
  transfers.reserve(handles.size());
  BOOST_FOREACH (const shared_ptr<TransferHandle> &handle, handles) {
    lock_guard<mutex> lock(handle->m_lock);
    transfers.push_back(handle->GetTransfer());
  }
  return TransferCollection(transfers, *this);
}

// --------------------------------------------------------------------------
void TransferManager::AddDelegate(const shared_ptr<TransferDelegate> &delegate) {
  if (!delegate) {
    DebugWarning("Null transfer delegate");
    return;
  }
  lock_guard<mutex> lock(m_delegatesLock);
  if (std::find(m_delegates.begin(), m_delegates.end(), delegate) ==
      m_delegates.end()) {
    m_delegates.push_back(delegate);
  }
}

// --------------------------------------------------------------------------
void TransferManager::RemoveDelegate(
    const shared_ptr<TransferDelegate> &delegate) {
  lock_guard<mutex> lock(m_delegatesLock);
  m_delegates.erase(
      std::remove(m_delegates.begin(), m_delegates.end(), delegate),
      m_delegates.end());
}

// --------------------------------------------------------------------------
size_t TransferManager::GetTransferCount() const {
  lock_guard<mutex> lock(m_handlesLock);
  return m_handles.size();
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::FindHandle(const string &id) const {
  lock_guard<mutex> lock(m_handlesLock);
  HandleMap::const_iterator it = m_handles.find(id);
  return it != m_handles.end() ? it->second : shared_ptr<TransferHandle>();
}

// --------------------------------------------------------------------------
void TransferManager::IndexHandle(const shared_ptr<TransferHandle> &handle) {
  lock_guard<mutex> lock(m_handlesLock);
  if (m_handles.insert(std::make_pair(handle->GetId(), handle)).second) {
    m_handleOrder.push_back(handle->GetId());
  }
}

// --------------------------------------------------------------------------
void TransferManager::UnindexHandle(const string &id) {
  lock_guard<mutex> lock(m_handlesLock);
  m_handles.erase(id);
  m_handleOrder.erase(
      std::remove(m_handleOrder.begin(), m_handleOrder.end(), id),
      m_handleOrder.end());
}

// --------------------------------------------------------------------------
bool TransferManager::IsStopping() const {
  lock_guard<mutex> lock(m_stateLock);
  return m_stopping;
}

// --------------------------------------------------------------------------
bool TransferManager::ShouldRunChunks(const TransferHandle &handle) const {
  TransferState::Value state = handle.GetTransfer().GetState();
  return (state == TransferState::Pending ||
          state == TransferState::InProgress) &&
         !handle.IsHalted() && !handle.IsRemoved() && !IsStopping();
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::PersistFamily(
    TransferHandle *handle, const vector<TransferRecord> &chunks,
    const TransferRecord &transfer) {
  vector<TransferRecord> batch(chunks);
  batch.push_back(transfer);
  TransferClientError err = m_store->SaveBatch(batch);
  if (!IsGoodTransferError(err)) {
    Error("Unable to persist transfer " + transfer.ToString() + " " +
          GetMessageForTransferError(err));
    return err;
  }
  BOOST_FOREACH (const TransferRecord &chunk, chunks) {
    handle->PutChunk(chunk);
  }
  handle->SetTransfer(transfer);
  handle->m_signal.notify_all();
  return err;
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::AdmitReadyChunks(
    const shared_ptr<TransferHandle> &handle) {
  if (!ShouldRunChunks(*handle)) {
    return MakeGoodError();
  }
  vector<string> ready = handle->GetReadyChunkIds();
  if (ready.empty()) {
    return MakeGoodError();
  }

  vector<TransferRecord> staged;
  BOOST_FOREACH (const string &chunkId, ready) {
    TransferRecord chunk = handle->GetChunk(chunkId);
    chunk.SetState(TransferState::InProgress);
    staged.push_back(chunk);
  }
  TransferRecord previous = handle->GetTransfer();
  TransferRecord transfer =
      ReconcileTransfer(previous, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, transfer);
  if (!IsGoodTransferError(err)) {
    handle->m_halted = true;
    handle->m_haltError = err;
    return err;
  }

  BOOST_FOREACH (const string &chunkId, ready) {
    handle->m_inFlightChunks.insert(chunkId);
    m_executor->SubmitToThread(
        boost::bind(&TransferManager::RunChunk, this, handle, chunkId));
  }
  DebugInfo("Admitted " + to_string(ready.size()) + " chunks of " +
            transfer.ToString());
  NotifyTransition(previous, transfer);
  return err;
}

// --------------------------------------------------------------------------
void TransferManager::RunChunk(const shared_ptr<TransferHandle> &handle,
                               const string &chunkId) {
  shared_ptr<ChunkTask> task;
  {
    lock_guard<mutex> lock(handle->m_lock);
    TransferRecord chunk = handle->GetChunk(chunkId);
    if (!ShouldRunChunks(*handle) ||
        chunk.GetState() != TransferState::InProgress) {
      OnChunkInterrupted(handle, chunkId);
      handle->m_inFlightChunks.erase(chunkId);
      handle->m_signal.notify_all();
      return;
    }
    task = boost::make_shared<ChunkTask>(
        chunk, chunk.IsDownload() ? handle->GetTransfer().GetStartOffset() : 0,
        chunk.IsCommit() ? handle->GetBlockIds() : vector<string>());
  }

  ChunkOutcome outcome;
  bool interrupted = false;
  uint16_t attemptedRetryTimes = 0;
  while (true) {
    try {
      outcome = m_chunkExecutor->Execute(*task);
    } catch (const std::exception &ex) {
      outcome = ChunkOutcome(MakePermanentExecutionError(
          "Chunk executor raised exception: " + string(ex.what())));
    }
    if (outcome.IsSuccess() ||
        !m_retryStrategy.ShouldRetry(outcome.GetError(),
                                     attemptedRetryTimes)) {
      break;
    }
    ++attemptedRetryTimes;
    uint32_t delay =
        m_retryStrategy.CalculateDelayBeforeNextRetry(attemptedRetryTimes);
    Warning("Retry(" + to_string(attemptedRetryTimes) + ") chunk in " +
            to_string(delay) + "ms " + task->GetChunk().ToString() + " " +
            GetMessageForTransferError(outcome.GetError()));

    unique_lock<mutex> lock(handle->m_lock);
    if (!WaitBeforeRetry(handle, lock, delay)) {
      interrupted = true;
      break;
    }
  }

  lock_guard<mutex> lock(handle->m_lock);
  if (interrupted) {
    OnChunkInterrupted(handle, chunkId);
  } else if (outcome.IsSuccess()) {
    OnChunkSucceeded(handle, chunkId, outcome.GetResult());
  } else {
    OnChunkFailed(handle, chunkId, outcome.GetError());
  }
  handle->m_inFlightChunks.erase(chunkId);
  handle->m_signal.notify_all();
}

// --------------------------------------------------------------------------
bool TransferManager::WaitBeforeRetry(const shared_ptr<TransferHandle> &handle,
                                      unique_lock<mutex> &lock,
                                      uint32_t delayInMilliseconds) {
  boost::system_time deadline =
      boost::get_system_time() +
      boost::posix_time::milliseconds(delayInMilliseconds);
  while (ShouldRunChunks(*handle)) {
    if (!handle->m_signal.timed_wait(lock, deadline)) {
      return ShouldRunChunks(*handle);
    }
  }
  return false;
}

// --------------------------------------------------------------------------
void TransferManager::OnChunkSucceeded(
    const shared_ptr<TransferHandle> &handle, const string &chunkId,
    const ChunkResult &result) {
  TransferRecord previous = handle->GetTransfer();
  TransferRecord chunk = handle->GetChunk(chunkId);
  if (handle->IsRemoved() || handle->IsHalted() || previous.IsTerminal() ||
      chunk.GetState() != TransferState::InProgress) {
    DebugInfo("Discard result of chunk " + chunk.ToString());
    return;
  }

  chunk.SetState(TransferState::Complete);
  chunk.SetBytesTransferred(result.bytesWritten);
  chunk.ClearError();
  TransferRecord transfer(previous);
  vector<TransferRecord> staged;
  if (chunk.IsRangeChunk() && !transfer.IsSizeKnown()) {
    // probe chunk
    if (result.objectSize == BX::Size::UnknownSize) {
      OnChunkFailed(handle, chunkId,
                    MakePermanentExecutionError(
                        "Object size unknown after probe " + chunk.ToString()));
      return;
    }
    transfer.SetEndOffset(result.objectSize);
    if (transfer.IsSizeKnown()) {
      pair<bool, string> resized = BX::Utils::ResizeFile(
          transfer.GetDestination(), transfer.GetTotalBytes());
      if (!resized.first) {
        OnChunkFailed(handle, chunkId,
                      MakePermanentExecutionError(resized.second));
        return;
      }
    }
    chunk.SetEndOffset(std::min(chunk.GetEndOffset(), result.objectSize));
    staged.push_back(chunk);
    vector<TransferRecord> rest = m_planner.PlanRemainingRanges(
        transfer, chunk.GetEndOffset(), result.objectSize);
    staged.insert(staged.end(), rest.begin(), rest.end());
    Info("Object size is " + to_string(result.objectSize) + ", planned " +
         to_string(rest.size()) + " more chunks of " +
         FormatTransferId(transfer.GetId()));
  } else {
    staged.push_back(chunk);
  }

  transfer = ReconcileTransfer(transfer, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, transfer);
  if (!IsGoodTransferError(err)) {
    OnPersistenceFailure(handle, err);
    return;
  }
  DebugInfo("Chunk complete " + chunk.ToString());
  if (transfer.GetState() == TransferState::Complete) {
    Info("Completed transfer " + transfer.ToString());
  }
  NotifyTransition(previous, transfer);

  err = AdmitReadyChunks(handle);
  if (!IsGoodTransferError(err)) {
    OnPersistenceFailure(handle, err);
  }
}

// --------------------------------------------------------------------------
void TransferManager::OnChunkFailed(const shared_ptr<TransferHandle> &handle,
                                    const string &chunkId,
                                    const TransferClientError &error) {
  TransferRecord previous = handle->GetTransfer();
  TransferRecord chunk = handle->GetChunk(chunkId);
  if (handle->IsRemoved() || handle->IsHalted() || previous.IsTerminal() ||
      chunk.GetState() != TransferState::InProgress) {
    DebugInfo("Discard failure of chunk " + chunk.ToString() + " " +
              GetMessageForTransferError(error));
    return;
  }

  chunk.SetState(TransferState::Failed);
  chunk.SetError(error);
  vector<TransferRecord> staged;
  staged.push_back(chunk);
  // siblings are not started any more
  BOOST_FOREACH (const TransferRecord &sibling, handle->GetChunks()) {
    if (sibling.GetId() != chunkId && !sibling.IsTerminal()) {
      TransferRecord cancelled(sibling);
      cancelled.SetState(TransferState::Cancelled);
      staged.push_back(cancelled);
    }
  }
  TransferRecord transfer =
      ReconcileTransfer(previous, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, transfer);
  if (!IsGoodTransferError(err)) {
    OnPersistenceFailure(handle, err);
    return;
  }
  Error("Failed transfer " + transfer.ToString() + " by chunk " +
        chunk.ToString());
  NotifyTransition(previous, transfer);
}

// --------------------------------------------------------------------------
void TransferManager::OnChunkInterrupted(
    const shared_ptr<TransferHandle> &handle, const string &chunkId) {
  const TransferRecord &transfer = handle->GetTransfer();
  TransferRecord chunk = handle->GetChunk(chunkId);
  // chunks of a terminal or stopping transfer are left as they are
  if (handle->IsRemoved() || handle->IsHalted() || IsStopping() ||
      transfer.GetState() != TransferState::Paused ||
      chunk.GetState() != TransferState::InProgress) {
    DebugInfo("Abandon chunk " + chunk.ToString());
    return;
  }

  chunk.SetState(TransferState::Pending);
  vector<TransferRecord> staged(1, chunk);
  TransferRecord reconciled =
      ReconcileTransfer(transfer, handle->GetChunksWith(staged));
  TransferClientError err = PersistFamily(handle.get(), staged, reconciled);
  if (!IsGoodTransferError(err)) {
    OnPersistenceFailure(handle, err);
    return;
  }
  DebugInfo("Chunk back to pending " + chunk.ToString());
}

// --------------------------------------------------------------------------
void TransferManager::OnPersistenceFailure(
    const shared_ptr<TransferHandle> &handle,
    const TransferClientError &error) {
  handle->m_halted = true;
  handle->m_haltError = error;
  Error("Halt transfer " + handle->GetTransfer().ToString() + " " +
        GetMessageForTransferError(error));
  m_notifier->SubmitToThread(boost::bind(&TransferManager::DoNotifyFailed,
                                         this, handle->GetTransfer(), error));
  handle->m_signal.notify_all();
}

// --------------------------------------------------------------------------
void TransferManager::NotifyTransition(const TransferRecord &previous,
                                       const TransferRecord &current) {
  TransferState::Value state = current.GetState();
  if (state == TransferState::Complete &&
      previous.GetState() != TransferState::Complete) {
    m_notifier->SubmitToThread(
        boost::bind(&TransferManager::DoNotifyCompleted, this, current));
  } else if (state == TransferState::Failed &&
             previous.GetState() != TransferState::Failed) {
    m_notifier->SubmitToThread(boost::bind(&TransferManager::DoNotifyFailed,
                                           this, current, current.GetError()));
  } else if (state != previous.GetState() ||
             current.GetBytesTransferred() !=
                 previous.GetBytesTransferred()) {
    m_notifier->SubmitToThread(
        boost::bind(&TransferManager::DoNotifyUpdated, this, current));
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoNotifyUpdated(const TransferRecord &transfer) {
  BOOST_FOREACH (const shared_ptr<TransferDelegate> &delegate,
                 GetDelegates()) {
    delegate->OnTransferUpdated(transfer, transfer.GetState(),
                                transfer.GetBytesTransferred());
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoNotifyFailed(const TransferRecord &transfer,
                                     const TransferClientError &error) {
  BOOST_FOREACH (const shared_ptr<TransferDelegate> &delegate,
                 GetDelegates()) {
    delegate->OnTransferFailed(transfer, error);
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoNotifyCompleted(const TransferRecord &transfer) {
  BOOST_FOREACH (const shared_ptr<TransferDelegate> &delegate,
                 GetDelegates()) {
    delegate->OnTransferCompleted(transfer);
  }
}

// --------------------------------------------------------------------------
vector<shared_ptr<TransferDelegate> > TransferManager::GetDelegates() const {
  lock_guard<mutex> lock(m_delegatesLock);
  return m_delegates;
}

}  // namespace Transfer
}  // namespace BX
