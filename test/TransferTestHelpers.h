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

#ifndef BLOBXFER_TEST_TRANSFERTESTHELPERS_H_
#define BLOBXFER_TEST_TRANSFERTESTHELPERS_H_

#include <stdint.h>
#include <stdlib.h>  // for mkdtemp
#include <unistd.h>  // for rmdir

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/Size.h"
#include "base/Utils.h"
#include "client/Constants.h"
#include "client/HttpPipeline.h"
#include "client/TransferError.h"
#include "client/Utils.h"
#include "transfer/ChunkExecutor.h"
#include "transfer/MemoryTransferStore.h"
#include "transfer/TransferDelegate.h"
#include "transfer/TransferRecord.h"
#include "transfer/TransferStore.h"

namespace BX {

namespace Testing {

// Deterministic content of given size
inline std::string MakeContent(size_t size) {
  std::string content(size, '\0');
  for (size_t i = 0; i < size; ++i) {
    content[i] = static_cast<char>((i * 31 + i / 251) % 251);
  }
  return content;
}

inline std::string ReadLocalFile(const std::string &path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline void WriteLocalFile(const std::string &path,
                           const std::string &content) {
  std::ofstream out(path.c_str(),
                    std::ios::out | std::ios::binary | std::ios::trunc);
  out << content;
}

//
// TempDirectory
//
// A fresh directory under /tmp, removed with the files directly under it
// when destructed.
//
class TempDirectory : private boost::noncopyable {
 public:
  TempDirectory() {
    char tmpl[] = "/tmp/blobxfer.test.XXXXXX";
    char *dir = mkdtemp(tmpl);
    m_path = dir != NULL ? std::string(dir) + "/" : std::string();
  }

  ~TempDirectory() {
    if (m_path.empty()) {
      return;
    }
    std::pair<bool, std::vector<std::string> > files =
        BX::Utils::ListFilesInDirectory(m_path);
    BOOST_FOREACH (const std::string &name, files.second) {
      BX::Utils::RemoveFileIfExists(m_path + name);
    }
    rmdir(m_path.c_str());
  }

  // Path with trailing '/'
  const std::string &GetPath() const { return m_path; }
  std::string File(const std::string &name) const { return m_path + name; }

 private:
  std::string m_path;
};

//
// FakeBlobPipeline
//
// In-memory block blob service. Blobs are keyed by url without query.
//   GET with 'Range'   : 206 with Content-Range, 416 beyond the blob,
//                        200 with the whole blob if no range is given
//   PUT comp=block     : stages a block
//   PUT comp=blocklist : assembles the blob from staged blocks
// Failures can be injected for the next requests.
//
class FakeBlobPipeline : public BX::Client::HttpPipeline {
 public:
  FakeBlobPipeline()
      : m_failStatus(0),
        m_failTimes(0),
        m_truncateTimes(0),
        m_omitContentRange(false) {}

 public:
  void PutBlob(const std::string &url, const std::string &content) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_blobs[url] = content;
  }

  bool HasBlob(const std::string &url) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_blobs.find(url) != m_blobs.end();
  }

  std::string GetBlob(const std::string &url) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    std::map<std::string, std::string>::const_iterator it = m_blobs.find(url);
    return it != m_blobs.end() ? it->second : std::string();
  }

  // Answer the next times requests with status, negative times for all
  void FailWith(int status, int times) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_failStatus = status;
    m_failTimes = times;
  }

  // Answer ranged GET with 200 and the whole blob
  void SetOmitContentRange(bool omit) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_omitContentRange = omit;
  }

  // Shorten the body of the next ranged GET responses by one byte
  void TruncateBodies(int times) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_truncateTimes = times;
  }

  std::vector<BX::Client::Http::HttpRequest> GetRequests() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_requests;
  }

  size_t GetRequestCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_requests.size();
  }

  BX::Client::HttpOutcome Send(const BX::Client::Http::HttpRequest &request) {
    using BX::Client::Http::HttpMethod;
    using BX::Client::Http::HttpResponse;
    namespace Constants = BX::Client::Constants;

    boost::lock_guard<boost::mutex> lock(m_lock);
    m_requests.push_back(request);
    if (m_failTimes != 0) {
      if (m_failTimes > 0) {
        --m_failTimes;
      }
      HttpResponse response(m_failStatus);
      response.SetBody("injected failure");
      return BX::Client::HttpOutcome(response);
    }

    const std::string &url = request.GetUrl();
    std::string::size_type q = url.find('?');
    std::string base = url.substr(0, q);
    std::string query = q == std::string::npos ? std::string()
                                               : url.substr(q + 1);

    if (request.GetMethod() == HttpMethod::GET) {
      return BX::Client::HttpOutcome(Get(base, request));
    }
    if (request.GetMethod() == HttpMethod::PUT) {
      if (query.find(Constants::QueryPutBlockList) != std::string::npos) {
        return BX::Client::HttpOutcome(CommitBlocks(base, request.GetBody()));
      }
      std::string::size_type pos = query.find(Constants::QueryBlockId);
      if (query.find(Constants::QueryPutBlock) != std::string::npos &&
          pos != std::string::npos) {
        std::string blockId =
            query.substr(pos + std::string(Constants::QueryBlockId).size());
        m_staged[base][blockId] = request.GetBody();
        return BX::Client::HttpOutcome(HttpResponse(201));
      }
    }
    return BX::Client::HttpOutcome(HttpResponse(400));
  }

 private:
  BX::Client::Http::HttpResponse Get(
      const std::string &base, const BX::Client::Http::HttpRequest &request) {
    using BX::Client::Http::HttpResponse;
    namespace Constants = BX::Client::Constants;

    std::map<std::string, std::string>::const_iterator it = m_blobs.find(base);
    if (it == m_blobs.end()) {
      return HttpResponse(404);
    }
    const std::string &blob = it->second;
    std::string range = request.GetHeader(Constants::HeaderRange);
    if (range.empty() || m_omitContentRange) {
      HttpResponse response(200);
      response.SetBody(blob);
      return response;
    }
    std::pair<uint64_t, uint64_t> requested =
        BX::Client::Utils::ParseRequestContentRange(range);
    uint64_t start = requested.first;
    if (start >= blob.size()) {
      return HttpResponse(416);
    }
    uint64_t stop = std::min(static_cast<uint64_t>(blob.size()),
                             start + requested.second);
    HttpResponse response(206);
    response.SetHeader(Constants::HeaderContentRange,
                       "bytes " + boost::to_string(start) + "-" +
                           boost::to_string(stop - 1) + "/" +
                           boost::to_string(blob.size()));
    std::string body = blob.substr(start, stop - start);
    if (m_truncateTimes > 0 && !body.empty()) {
      --m_truncateTimes;
      body.resize(body.size() - 1);
    }
    response.SetBody(body);
    return response;
  }

  BX::Client::Http::HttpResponse CommitBlocks(const std::string &base,
                                              const std::string &xml) {
    using BX::Client::Http::HttpResponse;
    static const std::string openTag = "<Latest>";
    static const std::string closeTag = "</Latest>";

    std::map<std::string, std::string> &staged = m_staged[base];
    std::string content;
    std::string::size_type pos = 0;
    while ((pos = xml.find(openTag, pos)) != std::string::npos) {
      pos += openTag.size();
      std::string::size_type end = xml.find(closeTag, pos);
      if (end == std::string::npos) {
        return HttpResponse(400);
      }
      std::map<std::string, std::string>::const_iterator block =
          staged.find(xml.substr(pos, end - pos));
      if (block == staged.end()) {
        return HttpResponse(400);
      }
      content += block->second;
      pos = end + closeTag.size();
    }
    m_blobs[base] = content;
    staged.clear();
    return HttpResponse(201);
  }

 private:
  std::map<std::string, std::string> m_blobs;
  std::map<std::string, std::map<std::string, std::string> > m_staged;
  std::vector<BX::Client::Http::HttpRequest> m_requests;
  int m_failStatus;
  int m_failTimes;
  int m_truncateTimes;
  bool m_omitContentRange;
  boost::mutex m_lock;
};

//
// ScriptedChunkExecutor
//
// Completes every chunk with its full size unless a failure is scripted
// for the start offset of the chunk. Can be blocked to keep chunks in
// flight.
//
class ScriptedChunkExecutor : public BX::Transfer::ChunkExecutor {
 public:
  ScriptedChunkExecutor()
      : m_objectSize(BX::Size::UnknownSize), m_blocked(false), m_entered(0) {}

 public:
  // Object size reported by every chunk
  void SetObjectSize(uint64_t size) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_objectSize = size;
  }

  // Fail chunk starting at offset the next times calls, negative for all
  void FailChunkAt(uint64_t start, const BX::Client::TransferClientError &err,
                   int times) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_failures[start] = std::make_pair(err, times);
  }

  void Block() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_blocked = true;
  }

  void Release() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_blocked = false;
    m_cond.notify_all();
  }

  // Wait until count calls have entered Execute
  bool WaitForEntered(size_t count, int timeoutInMilliseconds = 5000) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    boost::system_time deadline =
        boost::get_system_time() +
        boost::posix_time::milliseconds(timeoutInMilliseconds);
    while (m_entered < count) {
      if (!m_cond.timed_wait(lock, deadline)) {
        return m_entered >= count;
      }
    }
    return true;
  }

  size_t GetEnteredCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_entered;
  }

  // Start offsets of every call, in call order
  std::vector<uint64_t> GetExecutedStarts() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_executed;
  }

  std::vector<std::string> GetExecutedChunkIds() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_executedIds;
  }

  std::vector<std::vector<std::string> > GetCommittedBlockLists() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_commits;
  }

  BX::Transfer::ChunkOutcome Execute(const BX::Transfer::ChunkTask &task) {
    const BX::Transfer::TransferRecord &chunk = task.GetChunk();
    boost::unique_lock<boost::mutex> lock(m_lock);
    ++m_entered;
    m_cond.notify_all();
    while (m_blocked) {
      m_cond.wait(lock);
    }
    m_executed.push_back(chunk.GetStartOffset());
    m_executedIds.push_back(chunk.GetId());
    if (chunk.IsCommit()) {
      m_commits.push_back(task.GetBlockIds());
    }

    FailureMap::iterator it = m_failures.find(chunk.GetStartOffset());
    if (it != m_failures.end() && it->second.second != 0) {
      if (it->second.second > 0) {
        --it->second.second;
      }
      return BX::Transfer::ChunkOutcome(it->second.first);
    }
    return BX::Transfer::ChunkOutcome(
        BX::Transfer::ChunkResult(chunk.GetTotalBytes(), m_objectSize));
  }

 private:
  typedef std::map<uint64_t, std::pair<BX::Client::TransferClientError, int> >
      FailureMap;

  uint64_t m_objectSize;
  bool m_blocked;
  size_t m_entered;
  FailureMap m_failures;
  std::vector<uint64_t> m_executed;
  std::vector<std::string> m_executedIds;
  std::vector<std::vector<std::string> > m_commits;
  boost::mutex m_lock;
  boost::condition_variable m_cond;
};

//
// FlakyTransferStore
//
// Memory store whose writes start failing after a number of successful
// writes, until it is healed.
//
class FlakyTransferStore : public BX::Transfer::TransferStore {
 public:
  FlakyTransferStore()
      : m_failAfter(-1), m_writes(0), m_failQuery(false) {}

 public:
  // Writes after the first n ones fail, negative to never fail
  void FailWritesAfter(int n) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_failAfter = n;
    m_writes = 0;
  }

  void Heal() { FailWritesAfter(-1); }

  void SetFailQuery(bool fail) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_failQuery = fail;
  }

  BX::Client::TransferClientError Save(
      const BX::Transfer::TransferRecord &record) {
    if (ShouldFailWrite()) {
      return BX::Client::MakePersistenceError("injected write failure");
    }
    return m_store.Save(record);
  }

  BX::Client::TransferClientError SaveBatch(
      const std::vector<BX::Transfer::TransferRecord> &records) {
    if (ShouldFailWrite()) {
      return BX::Client::MakePersistenceError("injected write failure");
    }
    return m_store.SaveBatch(records);
  }

  BX::Transfer::RecordOutcome Load(const std::string &id) {
    return m_store.Load(id);
  }

  BX::Transfer::RecordListOutcome Query(
      const BX::Transfer::RecordPredicate &predicate) {
    {
      boost::lock_guard<boost::mutex> lock(m_lock);
      if (m_failQuery) {
        return BX::Transfer::RecordListOutcome(
            BX::Client::MakePersistenceError("injected query failure"));
      }
    }
    return m_store.Query(predicate);
  }

  BX::Client::TransferClientError Delete(const std::string &id) {
    if (ShouldFailWrite()) {
      return BX::Client::MakePersistenceError("injected write failure");
    }
    return m_store.Delete(id);
  }

 private:
  bool ShouldFailWrite() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    if (m_failAfter < 0) {
      return false;
    }
    if (m_writes < m_failAfter) {
      ++m_writes;
      return false;
    }
    return true;
  }

 private:
  BX::Transfer::MemoryTransferStore m_store;
  int m_failAfter;
  int m_writes;
  bool m_failQuery;
  boost::mutex m_lock;
};

// Event received by a RecordingDelegate
struct TransferEvent {
  enum Kind { Updated, Failed, Completed };

  TransferEvent(Kind k, const BX::Transfer::TransferRecord &record,
                const BX::Client::TransferClientError &err)
      : kind(k),
        id(record.GetId()),
        state(record.GetState()),
        bytesTransferred(record.GetBytesTransferred()),
        error(err) {}

  Kind kind;
  std::string id;
  BX::Transfer::TransferState::Value state;
  uint64_t bytesTransferred;
  BX::Client::TransferClientError error;
};

class RecordingDelegate : public BX::Transfer::TransferDelegate {
 public:
  void OnTransferUpdated(const BX::Transfer::TransferRecord &transfer,
                         BX::Transfer::TransferState::Value state,
                         uint64_t bytesTransferred) {
    Record(TransferEvent(TransferEvent::Updated, transfer,
                         BX::Client::MakeGoodError()));
  }

  void OnTransferFailed(const BX::Transfer::TransferRecord &transfer,
                        const BX::Client::TransferClientError &error) {
    Record(TransferEvent(TransferEvent::Failed, transfer, error));
  }

  void OnTransferCompleted(const BX::Transfer::TransferRecord &transfer) {
    Record(TransferEvent(TransferEvent::Completed, transfer,
                         BX::Client::MakeGoodError()));
  }

  // Wait until count events of kind have been received
  bool WaitForEvents(TransferEvent::Kind kind, size_t count,
                     int timeoutInMilliseconds = 5000) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    boost::system_time deadline =
        boost::get_system_time() +
        boost::posix_time::milliseconds(timeoutInMilliseconds);
    while (CountLocked(kind) < count) {
      if (!m_cond.timed_wait(lock, deadline)) {
        return CountLocked(kind) >= count;
      }
    }
    return true;
  }

  size_t Count(TransferEvent::Kind kind) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return CountLocked(kind);
  }

  std::vector<TransferEvent> GetEvents() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_events;
  }

 private:
  void Record(const TransferEvent &event) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_events.push_back(event);
    m_cond.notify_all();
  }

  size_t CountLocked(TransferEvent::Kind kind) const {
    size_t n = 0;
    BOOST_FOREACH (const TransferEvent &event, m_events) {
      if (event.kind == kind) {
        ++n;
      }
    }
    return n;
  }

 private:
  std::vector<TransferEvent> m_events;
  boost::mutex m_lock;
  boost::condition_variable m_cond;
};

}  // namespace Testing
}  // namespace BX

#endif  // BLOBXFER_TEST_TRANSFERTESTHELPERS_H_
