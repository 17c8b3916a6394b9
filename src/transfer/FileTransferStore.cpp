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

#include "transfer/FileTransferStore.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <fcntl.h>
#include <stdio.h>  // for rename
#include <sys/types.h>
#include <unistd.h>

#include <fstream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/scope_exit.hpp"
#include "boost/thread/locks.hpp"

#include "json/json.h"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "transfer/TransferRecord.h"

namespace BX {

namespace Transfer {

using BX::Client::MakeGoodError;
using BX::Client::MakeInvalidTransferError;
using BX::Client::MakeNotFoundError;
using BX::Client::MakePersistenceError;
using BX::Client::StringToTransferError;
using BX::Client::TransferClientError;
using BX::Client::TransferErrorToString;
using BX::StringUtils::FormatPath;
using BX::StringUtils::FormatTransferId;
using boost::lock_guard;
using boost::mutex;
using std::map;
using std::pair;
using std::set;
using std::string;
using std::vector;

static const char *const FAMILY_FILE_SUFFIX = ".json";
static const char *const TEMP_FILE_SUFFIX = ".tmp";
static const int FAMILY_FILE_VERSION = 1;

namespace {

string SysErrMsg(const string &what, const string &path) {
  return what + ": " + strerror(errno) + " " + FormatPath(path);
}

Json::Value RecordToJson(const TransferRecord &record) {
  Json::Value value(Json::objectValue);
  value["id"] = record.GetId();
  value["kind"] = GetTransferTypeName(record.GetType());
  value["source"] = record.GetSource();
  value["destination"] = record.GetDestination();
  value["startOffset"] = Json::UInt64(record.GetStartOffset());
  value["endOffset"] = Json::UInt64(record.GetEndOffset());
  value["state"] = GetTransferStateName(record.GetState());
  value["bytesTransferred"] = Json::UInt64(record.GetBytesTransferred());
  value["parentId"] = record.GetParentId();
  value["blockId"] = record.GetBlockId();
  if (record.HasError()) {
    const TransferClientError &err = record.GetError();
    value["error"] = err.GetMessage();
    value["errorCode"] = TransferErrorToString(err.GetError());
    value["errorName"] = err.GetExceptionName();
    value["errorRetryable"] = err.ShouldRetry();
    value["httpStatus"] = err.GetHttpStatus();
  } else {
    value["error"] = "";
  }
  return value;
}

bool JsonToRecord(const Json::Value &value, TransferRecord *record) {
  const char *stringFields[] = {"id",       "kind",     "source",
                                "destination", "state", "parentId",
                                "blockId"};
  int n = sizeof(stringFields) / sizeof(stringFields[0]);
  for (int i = 0; i < n; ++i) {
    if (!value.isMember(stringFields[i]) ||
        !value[stringFields[i]].isString()) {
      return false;
    }
  }
  const char *numberFields[] = {"startOffset", "endOffset",
                                "bytesTransferred"};
  n = sizeof(numberFields) / sizeof(numberFields[0]);
  for (int i = 0; i < n; ++i) {
    if (!value.isMember(numberFields[i]) ||
        !value[numberFields[i]].isUInt64()) {
      return false;
    }
  }

  TransferType::Value type;
  TransferState::Value state;
  if (!ParseTransferType(value["kind"].asString(), &type) ||
      !ParseTransferState(value["state"].asString(), &state)) {
    return false;
  }

  TransferRecord parsed(value["id"].asString(), type,
                        value["source"].asString(),
                        value["destination"].asString(),
                        value["startOffset"].asUInt64(),
                        value["endOffset"].asUInt64());
  parsed.SetState(state);
  parsed.SetBytesTransferred(value["bytesTransferred"].asUInt64());
  parsed.SetParentId(value["parentId"].asString());
  parsed.SetBlockId(value["blockId"].asString());
  string errMsg = value.get("error", "").asString();
  string errCode = value.get("errorCode", "").asString();
  if (!errMsg.empty() || !errCode.empty()) {
    parsed.SetError(TransferClientError(
        StringToTransferError(errCode), value.get("errorName", "").asString(),
        errMsg, value.get("errorRetryable", false).asBool(),
        value.get("httpStatus", 0).asInt()));
  }
  *record = parsed;
  return true;
}

// Write all content to fd
bool WriteAll(int fd, const string &content) {
  const char *data = content.data();
  size_t left = content.size();
  while (left > 0) {
    ssize_t n = write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

// --------------------------------------------------------------------------
FileTransferStore::FileTransferStore(const string &directory)
    : m_directory(BX::Utils::AppendPathDelim(directory)), m_opened(false) {}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::Open() {
  lock_guard<mutex> lock(m_lock);
  if (m_opened) {
    return MakeGoodError();
  }
  if (!BX::Utils::CreateDirectoryIfNotExists(m_directory)) {
    return MakePersistenceError(
        SysErrMsg("Unable to create store directory", m_directory));
  }
  pair<bool, string> permission = BX::Utils::HavePermission(m_directory);
  if (!permission.first) {
    return MakePersistenceError(permission.second);
  }

  // leftover of an interrupted write
  pair<bool, vector<string> > temps =
      BX::Utils::ListFilesInDirectory(m_directory, TEMP_FILE_SUFFIX);
  BOOST_FOREACH (const string &name, temps.second) {
    if (!BX::Utils::RemoveFileIfExists(m_directory + name)) {
      Warning(SysErrMsg("Unable to remove temporary file",
                        m_directory + name));
    }
  }

  pair<bool, vector<string> > files =
      BX::Utils::ListFilesInDirectory(m_directory, FAMILY_FILE_SUFFIX);
  if (!files.first) {
    return MakePersistenceError(
        SysErrMsg("Unable to list store directory", m_directory));
  }
  BOOST_FOREACH (const string &name, files.second) {
    TransferClientError err = LoadFamilyFile(name);
    if (!BX::Client::IsGoodTransferError(err)) {
      Error("Skip unreadable store file " +
            BX::Client::GetMessageForTransferError(err));
    }
  }
  m_opened = true;
  Info("Opened transfer store " + FormatPath(m_directory) + " with " +
       boost::to_string(m_families.size()) + " transfers");
  return MakeGoodError();
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::Save(const TransferRecord &record) {
  vector<TransferRecord> records;
  records.push_back(record);
  return SaveBatch(records);
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::SaveBatch(
    const vector<TransferRecord> &records) {
  lock_guard<mutex> lock(m_lock);
  TransferClientError err = CheckOpened();
  if (!BX::Client::IsGoodTransferError(err)) {
    return err;
  }

  // stage the new content of every touched family
  FamilyMap staged;
  BOOST_FOREACH (const TransferRecord &record, records) {
    const string &rootId = record.GetRootId();
    if (!IsValidTransferId(rootId)) {
      return MakeInvalidTransferError("Malformed transfer id '" + rootId +
                                      "'");
    }
    FamilyMap::iterator it = staged.find(rootId);
    if (it == staged.end()) {
      FamilyMap::const_iterator cur = m_families.find(rootId);
      it = staged.insert(std::make_pair(rootId, cur == m_families.end()
                                                    ? RecordMap()
                                                    : cur->second))
               .first;
    }
    it->second[record.GetId()] = record;
  }

  BOOST_FOREACH (const FamilyMap::value_type &family, staged) {
    err = WriteFamilyFile(family.first, family.second);
    if (!BX::Client::IsGoodTransferError(err)) {
      return err;
    }
  }

  BOOST_FOREACH (const FamilyMap::value_type &family, staged) {
    m_families[family.first] = family.second;
    BOOST_FOREACH (const RecordMap::value_type &p, family.second) {
      m_idToRootId[p.first] = family.first;
    }
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
RecordOutcome FileTransferStore::Load(const string &id) {
  lock_guard<mutex> lock(m_lock);
  TransferClientError err = CheckOpened();
  if (!BX::Client::IsGoodTransferError(err)) {
    return RecordOutcome(err);
  }
  map<string, string>::const_iterator root = m_idToRootId.find(id);
  if (root != m_idToRootId.end()) {
    FamilyMap::const_iterator family = m_families.find(root->second);
    if (family != m_families.end()) {
      RecordMap::const_iterator it = family->second.find(id);
      if (it != family->second.end()) {
        return RecordOutcome(it->second);
      }
    }
  }
  return RecordOutcome(
      MakeNotFoundError("No record of " + FormatTransferId(id)));
}

// --------------------------------------------------------------------------
RecordListOutcome FileTransferStore::Query(const RecordPredicate &predicate) {
  lock_guard<mutex> lock(m_lock);
  TransferClientError err = CheckOpened();
  if (!BX::Client::IsGoodTransferError(err)) {
    return RecordListOutcome(err);
  }
  vector<TransferRecord> result;
  BOOST_FOREACH (const FamilyMap::value_type &family, m_families) {
    BOOST_FOREACH (const RecordMap::value_type &p, family.second) {
      if (predicate(p.second)) {
        result.push_back(p.second);
      }
    }
  }
  return RecordListOutcome(result);
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::Delete(const string &id) {
  lock_guard<mutex> lock(m_lock);
  TransferClientError err = CheckOpened();
  if (!BX::Client::IsGoodTransferError(err)) {
    return err;
  }
  map<string, string>::iterator root = m_idToRootId.find(id);
  if (root == m_idToRootId.end()) {
    return MakeNotFoundError("No record of " + FormatTransferId(id));
  }
  string rootId = root->second;
  FamilyMap::iterator family = m_families.find(rootId);
  if (family == m_families.end()) {
    m_idToRootId.erase(root);
    return MakeNotFoundError("No record of " + FormatTransferId(id));
  }

  if (id == rootId) {
    err = DeleteFamilyFile(rootId);
    if (!BX::Client::IsGoodTransferError(err)) {
      return err;
    }
    BOOST_FOREACH (const RecordMap::value_type &p, family->second) {
      m_idToRootId.erase(p.first);
    }
    m_families.erase(family);
    return MakeGoodError();
  }

  RecordMap staged(family->second);
  set<string> removed;
  removed.insert(id);
  staged.erase(id);
  for (RecordMap::iterator it = staged.begin(); it != staged.end();) {
    if (it->second.GetParentId() == id) {
      removed.insert(it->first);
      staged.erase(it++);
    } else {
      ++it;
    }
  }
  err = WriteFamilyFile(rootId, staged);
  if (!BX::Client::IsGoodTransferError(err)) {
    return err;
  }
  family->second = staged;
  BOOST_FOREACH (const string &removedId, removed) {
    m_idToRootId.erase(removedId);
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
string FileTransferStore::GetFamilyFilePath(const string &rootId) const {
  return m_directory + rootId + FAMILY_FILE_SUFFIX;
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::LoadFamilyFile(const string &fileName) {
  string path = m_directory + fileName;
  std::ifstream in(path.c_str());
  if (!in) {
    return MakePersistenceError(SysErrMsg("Unable to open", path));
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs)) {
    return MakePersistenceError("Invalid json " + FormatPath(path) + ": " +
                                errs);
  }
  if (!root.isObject() || !root["rootId"].isString() ||
      !root["records"].isArray()) {
    return MakePersistenceError("Unrecognized layout " + FormatPath(path));
  }

  string rootId = root["rootId"].asString();
  RecordMap records;
  for (Json::ArrayIndex i = 0; i < root["records"].size(); ++i) {
    TransferRecord record;
    if (!JsonToRecord(root["records"][i], &record) ||
        record.GetRootId() != rootId) {
      return MakePersistenceError("Invalid record at index " +
                                  boost::to_string(i) + " " +
                                  FormatPath(path));
    }
    records[record.GetId()] = record;
  }

  BOOST_FOREACH (const RecordMap::value_type &p, records) {
    m_idToRootId[p.first] = rootId;
  }
  m_families[rootId] = records;
  return MakeGoodError();
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::WriteFamilyFile(
    const string &rootId, const RecordMap &records) {
  Json::Value root(Json::objectValue);
  root["version"] = FAMILY_FILE_VERSION;
  root["rootId"] = rootId;
  root["records"] = Json::Value(Json::arrayValue);
  BOOST_FOREACH (const RecordMap::value_type &p, records) {
    root["records"].append(RecordToJson(p.second));
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  string content = Json::writeString(builder, root);

  string path = GetFamilyFilePath(rootId);
  string tmpPath = path + TEMP_FILE_SUFFIX;
  int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                BX::Configure::Default::GetDefineFileMode());
  if (fd < 0) {
    return MakePersistenceError(SysErrMsg("Unable to create", tmpPath));
  }
  bool success = false;
  BOOST_SCOPE_EXIT((&success)(&tmpPath)) {
    if (!success) {
      BX::Utils::RemoveFileIfExists(tmpPath);
    }
  }
  BOOST_SCOPE_EXIT_END

  if (!WriteAll(fd, content) || fsync(fd) != 0) {
    TransferClientError err =
        MakePersistenceError(SysErrMsg("Unable to write", tmpPath));
    close(fd);
    return err;
  }
  if (close(fd) != 0) {
    return MakePersistenceError(SysErrMsg("Unable to close", tmpPath));
  }
  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    return MakePersistenceError(SysErrMsg("Unable to rename", tmpPath));
  }
  success = true;

  // make the rename durable
  int dirFd = open(m_directory.c_str(), O_RDONLY);
  if (dirFd >= 0) {
    if (fsync(dirFd) != 0) {
      DebugWarning(SysErrMsg("Unable to sync", m_directory));
    }
    close(dirFd);
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::DeleteFamilyFile(const string &rootId) {
  string path = GetFamilyFilePath(rootId);
  if (!BX::Utils::RemoveFileIfExists(path)) {
    return MakePersistenceError(SysErrMsg("Unable to remove", path));
  }
  return MakeGoodError();
}

// --------------------------------------------------------------------------
TransferClientError FileTransferStore::CheckOpened() const {
  if (!m_opened) {
    return MakePersistenceError("Store is not opened " +
                                FormatPath(m_directory));
  }
  return MakeGoodError();
}

}  // namespace Transfer
}  // namespace BX
