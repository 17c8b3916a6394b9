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

#ifndef BLOBXFER_CLIENT_CONSTANTS_H_
#define BLOBXFER_CLIENT_CONSTANTS_H_

namespace BX {

namespace Client {

namespace Constants {

// Header names are compared case-insensitively by HttpResponse::GetHeader
static const char *const HeaderRange = "Range";
static const char *const HeaderContentRange = "Content-Range";
static const char *const HeaderContentLength = "Content-Length";
static const char *const HeaderContentType = "Content-Type";

// Block blob operations, appended to the destination url
static const char *const QueryPutBlock = "comp=block";
static const char *const QueryBlockId = "blockid=";
static const char *const QueryPutBlockList = "comp=blocklist";

static const char *const BlockListContentType = "application/xml";

}  // namespace Constants
}  // namespace Client
}  // namespace BX


#endif  // BLOBXFER_CLIENT_CONSTANTS_H_
