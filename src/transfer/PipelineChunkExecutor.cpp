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

#include "transfer/PipelineChunkExecutor.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>  // for strerror

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>  // for pread pwrite

#include <algorithm>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "client/Constants.h"
#include "client/Http.h"
#include "client/Utils.h"
#include "configure/Default.h"

namespace BX {

namespace Transfer {

using BX::Client::GetErrorForHttpStatus;
using BX::Client::HttpOutcome;
using BX::Client::HttpPipeline;
using BX::Client::MakePermanentExecutionError;
using BX::Client::MakeTransientExecutionError;
using BX::Client::Http::HttpMethod;
using BX::Client::Http::HttpRequest;
using BX::Client::Http::HttpResponse;
using BX::StringUtils::FormatPath;
using BX::StringUtils::UrlEncode;
using boost::shared_ptr;
using boost::to_string;
using std::string;
using std::vector;

namespace Constants = BX::Client::Constants;
namespace ClientUtils = BX::Client::Utils;

namespace {

string SysErrMsg(const string &what, const string &path) {
  return what + ": " + strerror(errno) + " " + FormatPath(path);
}

// Write data at offset of file, the file is created if missing
//
// @return : empty string on success, error message otherwise
string WriteToFile(const string &path, uint64_t offset, const char *data,
                   size_t len) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT,
                BX::Configure::Default::GetDefineFileMode());
  if (fd < 0) {
    return SysErrMsg("Unable to open", path);
  }
  while (len > 0) {
    ssize_t n = pwrite(fd, data, len, static_cast<off_t>(offset));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      string msg = SysErrMsg("Unable to write", path);
      close(fd);
      return msg;
    }
    data += n;
    len -= static_cast<size_t>(n);
    offset += static_cast<uint64_t>(n);
  }
  if (close(fd) != 0) {
    return SysErrMsg("Unable to close", path);
  }
  return string();
}

// Read len bytes at offset of file
//
// @return : empty string on success, error message otherwise
string ReadFromFile(const string &path, uint64_t offset, size_t len,
                    string *data) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return SysErrMsg("Unable to open", path);
  }
  data->resize(len);
  size_t done = 0;
  while (done < len) {
    ssize_t n = pread(fd, &(*data)[done], len - done,
                      static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      string msg = SysErrMsg("Unable to read", path);
      close(fd);
      return msg;
    }
    if (n == 0) {
      close(fd);
      return "Source is shorter than expected, read " + to_string(done) +
             " of " + to_string(len) + " bytes at offset " +
             to_string(offset) + " " + FormatPath(path);
    }
    done += static_cast<size_t>(n);
  }
  close(fd);
  return string();
}

string DescribeRequest(const HttpRequest &request) {
  string str = BX::Client::Http::HttpMethodToString(request.GetMethod()) +
               " " + request.GetUrl();
  string range = request.GetHeader(Constants::HeaderRange);
  if (!range.empty()) {
    str += " [" + range + "]";
  }
  return str;
}

}  // namespace

// --------------------------------------------------------------------------
PipelineChunkExecutor::PipelineChunkExecutor(
    const shared_ptr<HttpPipeline> &pipeline)
    : m_pipeline(pipeline) {}

// --------------------------------------------------------------------------
ChunkOutcome PipelineChunkExecutor::Execute(const ChunkTask &task) {
  const TransferRecord &chunk = task.GetChunk();
  if (!m_pipeline) {
    return ChunkOutcome(
        MakePermanentExecutionError("Null http pipeline " + chunk.ToString()));
  }
  if (chunk.IsRangeChunk()) {
    return DownloadRange(task);
  } else if (chunk.IsBlock()) {
    return UploadBlock(task);
  } else if (chunk.IsCommit()) {
    return CommitBlockList(task);
  }
  return ChunkOutcome(MakePermanentExecutionError(
      "Unable to execute a record which is not a chunk " + chunk.ToString()));
}

// --------------------------------------------------------------------------
ChunkOutcome PipelineChunkExecutor::DownloadRange(const ChunkTask &task) {
  const TransferRecord &chunk = task.GetChunk();
  const string &path = chunk.GetDestination();
  uint64_t start = chunk.GetStartOffset();
  uint64_t end = chunk.GetEndOffset();

  if (chunk.IsSizeKnown() && end <= start) {
    string err = WriteToFile(path, task.GetLocalOffset(), NULL, 0);
    if (!err.empty()) {
      return ChunkOutcome(MakePermanentExecutionError(err));
    }
    return ChunkOutcome(ChunkResult(0, BX::Size::UnknownSize));
  }

  HttpRequest request(HttpMethod::GET, chunk.GetSource());
  request.SetHeader(Constants::HeaderRange,
                    ClientUtils::BuildRequestRange(start, end - start));
  HttpOutcome outcome = m_pipeline->Send(request);
  if (!outcome.IsSuccess()) {
    return ChunkOutcome(outcome.GetError());
  }
  const HttpResponse &response = outcome.GetResult();
  if (!response.IsSuccess()) {
    return ChunkOutcome(GetErrorForHttpStatus(
        response.GetStatusCode(), DescribeRequest(request) + " " +
                                      response.GetBody().substr(0, 256)));
  }

  const string &body = response.GetBody();
  uint64_t objectSize = BX::Size::UnknownSize;
  uint64_t bodyOffset = 0;  // position of byte 'start' in body
  string contentRange = response.GetHeader(Constants::HeaderContentRange);
  if (!contentRange.empty()) {
    boost::tuple<uint64_t, uint64_t, uint64_t> range =
        ClientUtils::ParseResponseContentRange(contentRange);
    if (boost::get<1>(range) == 0 || boost::get<0>(range) != start) {
      return ChunkOutcome(MakePermanentExecutionError(
          "Unexpected Content-Range '" + contentRange + "' for " +
          DescribeRequest(request)));
    }
    objectSize = boost::get<2>(range);
  } else if (response.GetStatusCode() == 200) {
    // whole object returned
    objectSize = body.size();
    bodyOffset = start;
  } else {
    return ChunkOutcome(MakePermanentExecutionError(
        "Missing Content-Range for " + DescribeRequest(request)));
  }

  if (start >= objectSize) {
    return ChunkOutcome(MakePermanentExecutionError(
        "Range starts beyond object size " + to_string(objectSize) + " " +
        DescribeRequest(request)));
  }
  uint64_t expected = std::min(end, objectSize) - start;
  uint64_t available = body.size() > bodyOffset ? body.size() - bodyOffset : 0;
  if (available < expected) {
    return ChunkOutcome(MakeTransientExecutionError(
        "Short body, got " + to_string(available) + " of " +
        to_string(expected) + " bytes " + DescribeRequest(request)));
  }

  string err = WriteToFile(path, task.GetLocalOffset(),
                           body.data() + bodyOffset,
                           static_cast<size_t>(expected));
  if (!err.empty()) {
    return ChunkOutcome(MakePermanentExecutionError(err));
  }
  DebugInfo("Downloaded " + to_string(expected) + " bytes " +
            DescribeRequest(request));
  return ChunkOutcome(ChunkResult(expected, objectSize));
}

// --------------------------------------------------------------------------
ChunkOutcome PipelineChunkExecutor::UploadBlock(const ChunkTask &task) {
  const TransferRecord &chunk = task.GetChunk();
  uint64_t size = chunk.GetTotalBytes();
  string data;
  string err = ReadFromFile(chunk.GetSource(), task.GetLocalOffset(),
                            static_cast<size_t>(size), &data);
  if (!err.empty()) {
    return ChunkOutcome(MakePermanentExecutionError(err));
  }

  string query = string(Constants::QueryPutBlock) + "&" +
                 Constants::QueryBlockId + UrlEncode(chunk.GetBlockId());
  HttpRequest request(HttpMethod::PUT,
                      ClientUtils::AppendUrlQuery(chunk.GetDestination(), query));
  request.SetHeader(Constants::HeaderContentLength, to_string(size));
  request.SetBody(data);
  HttpOutcome outcome = m_pipeline->Send(request);
  if (!outcome.IsSuccess()) {
    return ChunkOutcome(outcome.GetError());
  }
  const HttpResponse &response = outcome.GetResult();
  if (!response.IsSuccess()) {
    return ChunkOutcome(GetErrorForHttpStatus(
        response.GetStatusCode(), DescribeRequest(request) + " " +
                                      response.GetBody().substr(0, 256)));
  }
  DebugInfo("Uploaded block " + chunk.GetBlockId() + " of " +
            to_string(size) + " bytes " + DescribeRequest(request));
  return ChunkOutcome(ChunkResult(size, BX::Size::UnknownSize));
}

// --------------------------------------------------------------------------
ChunkOutcome PipelineChunkExecutor::CommitBlockList(const ChunkTask &task) {
  const TransferRecord &chunk = task.GetChunk();
  string body = ClientUtils::BuildBlockListXml(task.GetBlockIds());
  HttpRequest request(
      HttpMethod::PUT,
      ClientUtils::AppendUrlQuery(chunk.GetDestination(),
                                  Constants::QueryPutBlockList));
  request.SetHeader(Constants::HeaderContentType,
                    Constants::BlockListContentType);
  request.SetHeader(Constants::HeaderContentLength, to_string(body.size()));
  request.SetBody(body);
  HttpOutcome outcome = m_pipeline->Send(request);
  if (!outcome.IsSuccess()) {
    return ChunkOutcome(outcome.GetError());
  }
  const HttpResponse &response = outcome.GetResult();
  if (!response.IsSuccess()) {
    return ChunkOutcome(GetErrorForHttpStatus(
        response.GetStatusCode(), DescribeRequest(request) + " " +
                                      response.GetBody().substr(0, 256)));
  }
  DebugInfo("Committed " + to_string(task.GetBlockIds().size()) +
            " blocks " + DescribeRequest(request));
  return ChunkOutcome(ChunkResult(0, BX::Size::UnknownSize));
}

}  // namespace Transfer
}  // namespace BX
