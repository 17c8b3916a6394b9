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

#ifndef BLOBXFER_CLIENT_UTILS_H_
#define BLOBXFER_CLIENT_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "boost/tuple/tuple.hpp"

namespace BX {

namespace Client {

namespace Utils {

// Build request header of 'Range'
//
// @param  : start, size
// @return : string with format of "bytes=start_offset-stop_offset"
std::string BuildRequestRange(uint64_t start, uint64_t size);

// Parse response header of 'Range'
//
// @param  : 'Content-Range' which has format of
//           "bytes start_offset-stop_offset/file_size"
// @return : start, body length(stop - start + 1), total file_size
//           {0, 0, 0} if input is invalid
boost::tuple<uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const std::string &responseRange);

// Parse request header of 'Range'
//
// @param  : request range with format of "bytes=start_offset-stop_offset"
// @return : start, size(stop - start + 1)
std::pair<uint64_t, uint64_t> ParseRequestContentRange(
    const std::string &requestRange);

// Get path of url
//
// @param  : url, e.g. "https://account.host/c1/dir/blob?x=y"
// @return : path without query, e.g. "/c1/dir/blob"; empty if url has no
//           path or is not in format of scheme://host/path
std::string GetUrlPath(const std::string &url);

// Check if url is in format of scheme://host/path
bool IsValidBlobUrl(const std::string &url);

// Append query string to url
std::string AppendUrlQuery(const std::string &url, const std::string &query);

// Build id of a block in a block blob
//
// @param  : block index
// @return : base64 encoded 6 digits zero padded index, all ids of a blob
//           have equal length
std::string BuildBlockId(uint32_t index);

// Build body of put block list, blocks are committed in the given order
std::string BuildBlockListXml(const std::vector<std::string> &blockIds);

}  // namespace Utils
}  // namespace Client
}  // namespace BX


#endif  // BLOBXFER_CLIENT_UTILS_H_
