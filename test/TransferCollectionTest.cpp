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

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "client/TransferError.h"
#include "transfer/MemoryTransferStore.h"
#include "transfer/TransferCollection.h"
#include "transfer/TransferManager.h"
#include "transfer/TransferRecord.h"

#include "TransferTestHelpers.h"

namespace {

using BX::Client::IsGoodTransferError;
using BX::Client::TransferError;
using BX::Testing::MakeContent;
using BX::Testing::ScriptedChunkExecutor;
using BX::Testing::TempDirectory;
using BX::Testing::WriteLocalFile;
using BX::Transfer::MakeDownloadRecord;
using BX::Transfer::MakeUploadRecord;
using BX::Transfer::MemoryTransferStore;
using BX::Transfer::RecordOutcome;
using BX::Transfer::TransferCollection;
using BX::Transfer::TransferFilter;
using BX::Transfer::TransferManager;
using BX::Transfer::TransferManagerConfigure;
using BX::Transfer::TransferRecord;
using BX::Transfer::TransferState;
using boost::shared_ptr;
using std::string;
using std::vector;

bool IsUploadRecord(const TransferRecord &record) {
  return record.IsUpload();
}

class TransferCollectionTest : public ::testing::Test {
 protected:
  void SetUp() {
    m_store = boost::make_shared<MemoryTransferStore>();
    m_executor = boost::make_shared<ScriptedChunkExecutor>();
    // one worker, so queued chunks stay behind a blocked one
    m_manager = boost::make_shared<TransferManager>(
        TransferManagerConfigure(1, 256, 256, 256, 3, 1), m_store,
        m_executor);
    ASSERT_TRUE(IsGoodTransferError(m_manager->Initialize()));

    m_photo = MakeDownloadRecord("https://account.host/photos/2024/a.jpg",
                                 m_dir.File("a.jpg"), 0, 256);
    m_image = MakeDownloadRecord("https://account.host/photos/b.png",
                                 m_dir.File("b.png"), 0, 256);
    WriteLocalFile(m_dir.File("c.txt"), MakeContent(100));
    m_doc = MakeUploadRecord(m_dir.File("c.txt"),
                             "https://account.host/docs/c.txt");
  }

  void TearDown() {
    m_executor->Release();
    m_manager.reset();
  }

  void AddAll() {
    ASSERT_TRUE(IsGoodTransferError(m_manager->Add(m_photo)));
    ASSERT_TRUE(IsGoodTransferError(m_manager->Add(m_image)));
    ASSERT_TRUE(IsGoodTransferError(m_manager->Add(m_doc)));
  }

  TransferState::Value GetState(const TransferRecord &transfer) {
    RecordOutcome outcome = m_manager->WaitUntilFinished(transfer.GetId());
    EXPECT_TRUE(outcome.IsSuccess());
    return outcome.GetResult().GetState();
  }

  TempDirectory m_dir;
  shared_ptr<MemoryTransferStore> m_store;
  shared_ptr<ScriptedChunkExecutor> m_executor;
  shared_ptr<TransferManager> m_manager;
  TransferRecord m_photo;
  TransferRecord m_image;
  TransferRecord m_doc;
};

}  // namespace

TEST_F(TransferCollectionTest, SnapshotInInsertionOrder) {
  m_executor->Block();
  AddAll();
  ASSERT_TRUE(m_executor->WaitForEntered(1));
  ASSERT_TRUE(IsGoodTransferError(m_manager->Pause(m_image.GetId())));

  TransferCollection transfers = m_manager->Transfers();
  ASSERT_EQ(3u, transfers.Size());
  EXPECT_FALSE(transfers.Empty());
  EXPECT_EQ(m_photo.GetId(), transfers.All()[0].GetId());
  EXPECT_EQ(m_image.GetId(), transfers.All()[1].GetId());
  EXPECT_EQ(m_doc.GetId(), transfers.All()[2].GetId());

  RecordOutcome image = transfers.Get(m_image.GetId());
  ASSERT_TRUE(image.IsSuccess());
  EXPECT_EQ(TransferState::Paused, image.GetResult().GetState());
  EXPECT_EQ(TransferError::NOT_FOUND,
            transfers.Get("none").GetError().GetError());
}

TEST_F(TransferCollectionTest, Filters) {
  m_executor->Block();
  AddAll();
  ASSERT_TRUE(m_executor->WaitForEntered(1));
  ASSERT_TRUE(IsGoodTransferError(m_manager->Pause(m_image.GetId())));
  TransferCollection transfers = m_manager->Transfers();

  TransferFilter byContainer;
  byContainer.m_containerName = string("photos");
  vector<TransferRecord> photos = transfers.FilterWhere(byContainer);
  ASSERT_EQ(2u, photos.size());
  EXPECT_EQ(m_photo.GetId(), photos[0].GetId());
  EXPECT_EQ(m_image.GetId(), photos[1].GetId());

  TransferFilter byBlob;
  byBlob.m_blobName = string(".png");
  vector<TransferRecord> images = transfers.FilterWhere(byBlob);
  ASSERT_EQ(1u, images.size());
  EXPECT_EQ(m_image.GetId(), images[0].GetId());

  TransferFilter byLocalPath;
  byLocalPath.m_localPath = m_dir.File("c.txt");
  RecordOutcome doc = transfers.FirstWith(byLocalPath);
  ASSERT_TRUE(doc.IsSuccess());
  EXPECT_EQ(m_doc.GetId(), doc.GetResult().GetId());

  TransferFilter byState;
  byState.m_state = TransferState::Paused;
  vector<TransferRecord> paused = transfers.FilterWhere(byState);
  ASSERT_EQ(1u, paused.size());
  EXPECT_EQ(m_image.GetId(), paused[0].GetId());

  // conditions combine
  TransferFilter combined;
  combined.m_containerName = string("photos");
  combined.m_blobName = string(".jpg");
  combined.m_state = TransferState::Paused;
  EXPECT_TRUE(transfers.FilterWhere(combined).empty());
  EXPECT_EQ(TransferError::NOT_FOUND,
            transfers.FirstWith(combined).GetError().GetError());

  EXPECT_EQ(3u, transfers.FilterWhere(TransferFilter()).size());

  vector<TransferRecord> uploads = transfers.Filter(IsUploadRecord);
  ASSERT_EQ(1u, uploads.size());
  EXPECT_EQ(m_doc.GetId(), uploads[0].GetId());
  RecordOutcome first = transfers.First(IsUploadRecord);
  ASSERT_TRUE(first.IsSuccess());
  EXPECT_EQ(m_doc.GetId(), first.GetResult().GetId());
}

TEST_F(TransferCollectionTest, PauseAllAndResumeAll) {
  m_executor->Block();
  AddAll();
  ASSERT_TRUE(m_executor->WaitForEntered(1));
  EXPECT_TRUE(IsGoodTransferError(m_manager->Transfers().PauseAll()));
  m_executor->Release();

  // the chunk in flight completes the single chunk download
  EXPECT_EQ(TransferState::Complete, GetState(m_photo));
  EXPECT_EQ(TransferState::Paused, GetState(m_image));
  EXPECT_EQ(TransferState::Paused, GetState(m_doc));
  EXPECT_EQ(1u, m_executor->GetExecutedStarts().size());

  EXPECT_TRUE(IsGoodTransferError(m_manager->Transfers().ResumeAll()));
  EXPECT_EQ(TransferState::Complete, GetState(m_image));
  EXPECT_EQ(TransferState::Complete, GetState(m_doc));
  // block and commit of the upload
  EXPECT_EQ(4u, m_executor->GetExecutedStarts().size());
}

TEST_F(TransferCollectionTest, CancelAllAndRemoveAll) {
  m_executor->Block();
  AddAll();
  ASSERT_TRUE(m_executor->WaitForEntered(1));
  EXPECT_TRUE(IsGoodTransferError(m_manager->Transfers().CancelAll()));
  m_executor->Release();

  EXPECT_EQ(TransferState::Cancelled, GetState(m_photo));
  EXPECT_EQ(TransferState::Cancelled, GetState(m_image));
  EXPECT_EQ(TransferState::Cancelled, GetState(m_doc));
  TransferFilter cancelled;
  cancelled.m_state = TransferState::Cancelled;
  EXPECT_EQ(3u, m_manager->Transfers().FilterWhere(cancelled).size());

  EXPECT_TRUE(IsGoodTransferError(m_manager->Transfers().RemoveAll()));
  EXPECT_EQ(0u, m_manager->GetTransferCount());
  EXPECT_TRUE(m_manager->Transfers().Empty());
  EXPECT_EQ(0u, m_store->GetRecordCount());
}

TEST_F(TransferCollectionTest, ApplyToAllReportsFirstError) {
  AddAll();
  EXPECT_EQ(TransferState::Complete, GetState(m_photo));
  EXPECT_EQ(TransferState::Complete, GetState(m_image));
  EXPECT_EQ(TransferState::Complete, GetState(m_doc));

  TransferCollection transfers = m_manager->Transfers();
  ASSERT_TRUE(IsGoodTransferError(m_manager->Remove(m_image.GetId())));
  // snapshot still holds the removed transfer
  EXPECT_EQ(3u, transfers.Size());
  EXPECT_EQ(TransferError::NOT_FOUND, transfers.RemoveAll().GetError());
  EXPECT_EQ(0u, m_manager->GetTransferCount());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
