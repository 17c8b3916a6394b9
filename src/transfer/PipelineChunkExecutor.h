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

#ifndef BLOBXFER_TRANSFER_PIPELINECHUNKEXECUTOR_H_
#define BLOBXFER_TRANSFER_PIPELINECHUNKEXECUTOR_H_

#include "boost/shared_ptr.hpp"

#include "client/HttpPipeline.h"
#include "transfer/ChunkExecutor.h"

namespace BX {

namespace Transfer {

//
// PipelineChunkExecutor
//
// Executes chunks as block blob requests sent through a http pipeline.
//   range chunk : GET <source> with 'Range', body written to the local
//                 file at the chunk offset, file is never truncated
//   block chunk : PUT <destination>?comp=block&blockid=<id> with the bytes
//                 of the block read from the local file
//   commit chunk: PUT <destination>?comp=blocklist with the block list
//
class PipelineChunkExecutor : public ChunkExecutor {
 public:
  explicit PipelineChunkExecutor(
      const boost::shared_ptr<BX::Client::HttpPipeline> &pipeline);
  ~PipelineChunkExecutor() {}

 public:
  ChunkOutcome Execute(const ChunkTask &task);

 private:
  ChunkOutcome DownloadRange(const ChunkTask &task);
  ChunkOutcome UploadBlock(const ChunkTask &task);
  ChunkOutcome CommitBlockList(const ChunkTask &task);

 private:
  boost::shared_ptr<BX::Client::HttpPipeline> m_pipeline;
};

}  // namespace Transfer
}  // namespace BX

#endif  // BLOBXFER_TRANSFER_PIPELINECHUNKEXECUTOR_H_
