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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>  // for strerror

#include <dirent.h>  // for opendir readdir
#include <fcntl.h>  // for open
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access ftruncate

#include <string>
#include <utility>
#include <vector>

#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace BX {

namespace Utils {

using BX::StringUtils::EndsWith;
using BX::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  } else {
    // if parent dir exist or created
    if (CreateDirectoryIfNotExists(GetDirName(path))) {
      int errorCode =
          mkdir(path.c_str(), BX::Configure::Default::GetDefineDirMode());
      bool success = (errorCode == 0 || errno == EEXIST);
      return success;
    } else {
      return false;
    }
  }
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
pair<bool, string> ResizeFile(const string &path, uint64_t size) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT,
                BX::Configure::Default::GetDefineFileMode());
  if (fd < 0) {
    return make_pair(false, "Unable to open file " + PostErrMsg(path));
  }
  BOOST_SCOPE_EXIT((fd)) { close(fd); }
  BOOST_SCOPE_EXIT_END

  if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
    return make_pair(false, "Unable to resize file " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  int errorCode = access(path.c_str(), F_OK);
  return errorCode == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  bool success = true;
  string msg;

  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    msg.assign("Unable to access path " + PostErrMsg(path));
    success = false;
  } else {
    success = S_ISDIR(stBuf.st_mode);
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
pair<bool, string> HavePermission(const string &path) {
  if (access(path.c_str(), R_OK | W_OK | X_OK) != 0) {
    return make_pair(false, "No permission " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<uint64_t, string> GetReadableFileSize(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(0, "Unable to access file " + PostErrMsg(path));
  }
  if (!S_ISREG(st.st_mode)) {
    return make_pair(0, "Not a regular file " + FormatPath(path));
  }
  if (access(path.c_str(), R_OK) != 0) {
    return make_pair(0, "Unable to read file " + PostErrMsg(path));
  }
  return make_pair(static_cast<uint64_t>(st.st_size), string());
}

// --------------------------------------------------------------------------
pair<bool, vector<string> > ListFilesInDirectory(const string &path,
                                                 const string &suffix) {
  vector<string> names;
  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
      dir = NULL;
    }
  }
  BOOST_SCOPE_EXIT_END

  if (!dir) {
    return make_pair(false, names);
  }

  struct dirent *nextEntry = NULL;
  while ((nextEntry = readdir(dir)) != NULL) {
    string name(nextEntry->d_name);
    if (name == "." || name == "..") {
      continue;
    }
    if (!suffix.empty() && !EndsWith(name, suffix)) {
      continue;
    }
    struct stat st;
    string fullPath = AppendPathDelim(path) + name;
    if (stat(fullPath.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
      names.push_back(name);
    }
  }
  return make_pair(true, names);
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string copy(path);
  if (copy.empty() || copy[copy.size() - 1] != PATH_DELIM) {
    copy.append(1, PATH_DELIM);
  }
  return copy;
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (path.empty() || IsRootDirectory(path)) {
    return string();
  }

  string copy(path);
  // remove trailing delims
  while (copy.size() > 1 && copy[copy.size() - 1] == PATH_DELIM) {
    copy.erase(copy.size() - 1);
  }
  string::size_type pos = copy.find_last_of(PATH_DELIM);
  if (pos == string::npos) {
    return string();
  }
  return copy.substr(0, pos + 1);
}

// --------------------------------------------------------------------------
bool IsAbsolutePath(const string &path) {
  return !path.empty() && path[0] == PATH_DELIM;
}

}  // namespace Utils
}  // namespace BX
