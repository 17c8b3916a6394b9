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

#ifndef BLOBXFER_BASE_UTILS_H_
#define BLOBXFER_BASE_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

namespace BX {

namespace Utils {

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file if it exists
//
// @param  : file path
// @return : bool
bool RemoveFileIfExists(const std::string &path);

// Create the file if it doesn't exist, then cut or extend it to size
//
// @param  : file path, length in bytes
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> ResizeFile(const std::string &path,
                                        uint64_t size);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if process can read, write and search the directory
//
// @param  : dir path
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> HavePermission(const std::string &path);

// Get size of a regular file the process is able to read
//
// @param  : file path
// @return : a pair of {size, ""} or {0, message}, message is not empty
//           if the file is missing, not regular or not readable
std::pair<uint64_t, std::string> GetReadableFileSize(const std::string &path);

// List names of regular files in dir
//
// @param  : dir path, suffix filter (empty for all files)
// @return : a pair of {true, names} or {false, names read so far}
std::pair<bool, std::vector<std::string> > ListFilesInDirectory(
    const std::string &path, const std::string &suffix = std::string());

// Check if path is root
bool IsRootDirectory(const std::string &path);

// Append delim to path
//
// @param  : file path
// @return : path appended
std::string AppendPathDelim(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
//
// If path is root or cannot find dir, return null string
std::string GetDirName(const std::string &path);

// Check if path is absolute
bool IsAbsolutePath(const std::string &path);

}  // namespace Utils
}  // namespace BX

#endif  // BLOBXFER_BASE_UTILS_H_
