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

#ifndef BLOBXFER_BASE_STRINGUTILS_H_
#define BLOBXFER_BASE_STRINGUTILS_H_

#include <string>

namespace BX {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

bool StartsWith(const std::string &str, const std::string &prefix);
bool EndsWith(const std::string &str, const std::string &suffix);

// Percent-encode every byte outside the RFC 3986 unreserved set
std::string UrlEncode(const std::string &str);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);
std::string FormatPath(const std::string &from, const std::string &to);

// Format transfer id for log lines
std::string FormatTransferId(const std::string &id);

}  // namespace StringUtils
}  // namespace BX

#endif  // BLOBXFER_BASE_STRINGUTILS_H_
