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

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/shared_ptr.hpp"

#include "base/Utils.h"
#include "client/TransferError.h"
#include "configure/Default.h"
#include "transfer/FileTransferStore.h"
#include "transfer/MemoryTransferStore.h"
#include "transfer/TransferRecord.h"
#include "transfer/TransferStore.h"

#include "TransferTestHelpers.h"

namespace {

using BX::Client::IsGoodTransferError;
using BX::Client::MakePermanentExecutionError;
using BX::Client::TransferError;
using BX::Testing::TempDirectory;
using BX::Testing::WriteLocalFile;
using BX::Transfer::FileTransferStore;
using BX::Transfer::MakeChunkRecord;
using BX::Transfer::MakeDownloadRecord;
using BX::Transfer::MemoryTransferStore;
using BX::Transfer::RecordListOutcome;
using BX::Transfer::RecordOutcome;
using BX::Transfer::TransferRecord;
using BX::Transfer::TransferState;
using BX::Transfer::TransferType;
using BX::Transfer::TransferStore;
using std::string;
using std::vector;

static const char *const blobUrl = "https://account.host/c1/blob";

bool AnyRecord(const TransferRecord &record) { return true; }
bool IsTopLevel(const TransferRecord &record) { return !record.IsChunk(); }

// A transfer with two chunks
vector<TransferRecord> MakeFamily(const string &localPath) {
  TransferRecord transfer = MakeDownloadRecord(blobUrl, localPath, 0, 200);
  vector<TransferRecord> family;
  family.push_back(transfer);
  family.push_back(MakeChunkRecord(transfer, 0, 100));
  family.push_back(MakeChunkRecord(transfer, 100, 200));
  return family;
}

// Checks shared by every store
void VerifyBasicOperations(TransferStore *store) {
  vector<TransferRecord> family = MakeFamily("/tmp/blob");
  const string &rootId = family[0].GetId();
  ASSERT_TRUE(IsGoodTransferError(store->SaveBatch(family)));

  RecordOutcome loaded = store->Load(family[1].GetId());
  ASSERT_TRUE(loaded.IsSuccess());
  EXPECT_EQ(rootId, loaded.GetResult().GetParentId());
  EXPECT_EQ(100u, loaded.GetResult().GetEndOffset());

  TransferRecord updated(family[1]);
  updated.SetState(TransferState::Failed);
  updated.SetError(MakePermanentExecutionError("denied"));
  ASSERT_TRUE(IsGoodTransferError(store->Save(updated)));
  loaded = store->Load(updated.GetId());
  ASSERT_TRUE(loaded.IsSuccess());
  EXPECT_EQ(TransferState::Failed, loaded.GetResult().GetState());
  EXPECT_EQ(TransferError::PERMANENT_EXECUTION,
            loaded.GetResult().GetError().GetError());

  RecordListOutcome all = store->Query(AnyRecord);
  ASSERT_TRUE(all.IsSuccess());
  EXPECT_EQ(3u, all.GetResult().size());
  RecordListOutcome top = store->Query(IsTopLevel);
  ASSERT_TRUE(top.IsSuccess());
  ASSERT_EQ(1u, top.GetResult().size());
  EXPECT_EQ(rootId, top.GetResult()[0].GetId());

  // delete a chunk
  ASSERT_TRUE(IsGoodTransferError(store->Delete(family[2].GetId())));
  EXPECT_EQ(TransferError::NOT_FOUND,
            store->Load(family[2].GetId()).GetError().GetError());
  EXPECT_TRUE(store->Load(rootId).IsSuccess());

  // delete a transfer with its chunks
  ASSERT_TRUE(IsGoodTransferError(store->Delete(rootId)));
  EXPECT_FALSE(store->Load(rootId).IsSuccess());
  EXPECT_FALSE(store->Load(family[1].GetId()).IsSuccess());
  EXPECT_TRUE(store->Query(AnyRecord).GetResult().empty());

  EXPECT_EQ(TransferError::NOT_FOUND, store->Delete(rootId).GetError());
  EXPECT_EQ(TransferError::NOT_FOUND,
            store->Load("no-such-id").GetError().GetError());
}

}  // namespace

TEST(MemoryTransferStoreTest, BasicOperations) {
  MemoryTransferStore store;
  VerifyBasicOperations(&store);
  EXPECT_EQ(0u, store.GetRecordCount());
}

TEST(FileTransferStoreTest, BasicOperations) {
  TempDirectory dir;
  FileTransferStore store(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(store.Open()));
  VerifyBasicOperations(&store);
}

TEST(FileTransferStoreTest, NotOpened) {
  TempDirectory dir;
  FileTransferStore store(dir.GetPath());
  EXPECT_EQ(TransferError::PERSISTENCE,
            store.SaveBatch(MakeFamily("/tmp/blob")).GetError());
  EXPECT_EQ(TransferError::PERSISTENCE,
            store.Query(AnyRecord).GetError().GetError());
}

TEST(FileTransferStoreTest, RejectsIdOutsideDirectory) {
  TempDirectory dir;
  FileTransferStore store(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(store.Open()));
  TransferRecord escaping("../blobxfer-escape", TransferType::Download,
                          blobUrl, "/tmp/blob", 0, 100);
  EXPECT_EQ(TransferError::INVALID_TRANSFER, store.Save(escaping).GetError());
  EXPECT_FALSE(BX::Utils::FileExists(BX::Utils::GetDirName(dir.GetPath()) +
                                     "blobxfer-escape.json"));
  EXPECT_TRUE(store.Query(AnyRecord).GetResult().empty());
}

TEST(FileTransferStoreTest, Directory) {
  FileTransferStore byDefault;
  EXPECT_EQ(BX::Configure::Default::GetDefaultStoreDirectory(),
            byDefault.GetDirectory());
  FileTransferStore noDelim("/tmp/blobxfer.store");
  EXPECT_EQ(string("/tmp/blobxfer.store/"), noDelim.GetDirectory());
}

TEST(FileTransferStoreTest, SurvivesReopen) {
  TempDirectory dir;
  vector<TransferRecord> family = MakeFamily("/tmp/blob");
  family[1].SetState(TransferState::Complete);
  family[1].SetBytesTransferred(100);
  family[2].SetState(TransferState::Failed);
  family[2].SetError(MakePermanentExecutionError("Forbidden"));
  family[0].SetError(BX::Client::GetErrorForHttpStatus(503, "busy"));
  {
    FileTransferStore store(dir.GetPath());
    ASSERT_TRUE(IsGoodTransferError(store.Open()));
    ASSERT_TRUE(IsGoodTransferError(store.SaveBatch(family)));
  }

  FileTransferStore reopened(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(reopened.Open()));
  RecordListOutcome all = reopened.Query(AnyRecord);
  ASSERT_TRUE(all.IsSuccess());
  EXPECT_EQ(3u, all.GetResult().size());

  RecordOutcome transfer = reopened.Load(family[0].GetId());
  ASSERT_TRUE(transfer.IsSuccess());
  EXPECT_EQ(string(blobUrl), transfer.GetResult().GetSource());
  EXPECT_EQ(200u, transfer.GetResult().GetEndOffset());
  EXPECT_TRUE(transfer.GetResult().IsDownload());
  EXPECT_TRUE(transfer.GetResult().GetError().ShouldRetry());
  EXPECT_EQ(503, transfer.GetResult().GetError().GetHttpStatus());

  RecordOutcome complete = reopened.Load(family[1].GetId());
  ASSERT_TRUE(complete.IsSuccess());
  EXPECT_EQ(TransferState::Complete, complete.GetResult().GetState());
  EXPECT_EQ(100u, complete.GetResult().GetBytesTransferred());

  RecordOutcome failed = reopened.Load(family[2].GetId());
  ASSERT_TRUE(failed.IsSuccess());
  EXPECT_EQ(TransferState::Failed, failed.GetResult().GetState());
  EXPECT_EQ(TransferError::PERMANENT_EXECUTION,
            failed.GetResult().GetError().GetError());
  EXPECT_EQ(string("Forbidden"), failed.GetResult().GetError().GetMessage());
  EXPECT_FALSE(failed.GetResult().GetError().ShouldRetry());
  EXPECT_FALSE(failed.GetResult().GetError().HasHttpStatus());
}

TEST(FileTransferStoreTest, UnknownSizeSurvivesReopen) {
  TempDirectory dir;
  TransferRecord transfer = MakeDownloadRecord(blobUrl, "/tmp/blob");
  {
    FileTransferStore store(dir.GetPath());
    ASSERT_TRUE(IsGoodTransferError(store.Open()));
    ASSERT_TRUE(IsGoodTransferError(store.Save(transfer)));
  }
  FileTransferStore reopened(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(reopened.Open()));
  RecordOutcome loaded = reopened.Load(transfer.GetId());
  ASSERT_TRUE(loaded.IsSuccess());
  EXPECT_FALSE(loaded.GetResult().IsSizeKnown());
}

TEST(FileTransferStoreTest, SkipsCorruptFiles) {
  TempDirectory dir;
  vector<TransferRecord> family = MakeFamily("/tmp/blob");
  {
    FileTransferStore store(dir.GetPath());
    ASSERT_TRUE(IsGoodTransferError(store.Open()));
    ASSERT_TRUE(IsGoodTransferError(store.SaveBatch(family)));
  }
  WriteLocalFile(dir.File("garbage.json"), "{ \"rootId\": ");
  WriteLocalFile(dir.File("leftover.json.tmp"), "partial");

  FileTransferStore reopened(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(reopened.Open()));
  EXPECT_EQ(3u, reopened.Query(AnyRecord).GetResult().size());
  EXPECT_FALSE(BX::Utils::FileExists(dir.File("leftover.json.tmp")));
}

TEST(FileTransferStoreTest, DeleteRemovesFamilyFile) {
  TempDirectory dir;
  vector<TransferRecord> family = MakeFamily("/tmp/blob");
  FileTransferStore store(dir.GetPath());
  ASSERT_TRUE(IsGoodTransferError(store.Open()));
  ASSERT_TRUE(IsGoodTransferError(store.SaveBatch(family)));
  string path = dir.File(family[0].GetId() + ".json");
  EXPECT_TRUE(BX::Utils::FileExists(path));

  ASSERT_TRUE(IsGoodTransferError(store.Delete(family[0].GetId())));
  EXPECT_FALSE(BX::Utils::FileExists(path));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
