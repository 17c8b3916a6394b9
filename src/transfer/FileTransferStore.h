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

#ifndef BLOBXFER_TRANSFER_FILETRANSFERSTORE_H_
#define BLOBXFER_TRANSFER_FILETRANSFERSTORE_H_

#include <map>
#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "configure/Default.h"
#include "transfer/TransferStore.h"

namespace BX {

namespace Transfer {

//
// FileTransferStore
//
// Keeps one json file per transfer family (a top-level record and its
// chunks) in a directory. A file is rewritten by writing a temporary file,
// syncing it and renaming it over the old one, so a family file is always
// either the old or the new version.
//
// All files are read into memory by Open, which must succeed before any
// other call. A file which cannot be parsed is skipped with an error log.
//
class FileTransferStore : public TransferStore {
 public:
  explicit FileTransferStore(
      const std::string &directory =
          BX::Configure::Default::GetDefaultStoreDirectory());
  ~FileTransferStore() {}

 public:
  BX::Client::TransferClientError Open();

  BX::Client::TransferClientError Save(const TransferRecord &record);
  BX::Client::TransferClientError SaveBatch(
      const std::vector<TransferRecord> &records);
  RecordOutcome Load(const std::string &id);
  RecordListOutcome Query(const RecordPredicate &predicate);
  BX::Client::TransferClientError Delete(const std::string &id);

  const std::string &GetDirectory() const { return m_directory; }

 private:
  typedef std::map<std::string, TransferRecord> RecordMap;
  // root id -> records of the family
  typedef std::map<std::string, RecordMap> FamilyMap;

  std::string GetFamilyFilePath(const std::string &rootId) const;
  BX::Client::TransferClientError LoadFamilyFile(const std::string &fileName);
  BX::Client::TransferClientError WriteFamilyFile(const std::string &rootId,
                                                  const RecordMap &records);
  BX::Client::TransferClientError DeleteFamilyFile(const std::string &rootId);
  BX::Client::TransferClientError CheckOpened() const;

 private:
  std::string m_directory;
  bool m_opened;
  FamilyMap m_families;
  std::map<std::string, std::string> m_idToRootId;
  boost::mutex m_lock;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_FILETRANSFERSTORE_H_
