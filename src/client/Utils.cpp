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

#include "client/Utils.h"

#include <stdio.h>

#include <istream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "boost/archive/iterators/base64_from_binary.hpp"
#include "boost/archive/iterators/transform_width.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace BX {

namespace Client {

namespace Utils {

using boost::make_tuple;
using boost::to_string;
using boost::tuple;
using std::istream;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

template <char C>
istream &expect(istream &in) {
  if ((in >> std::ws).peek() == C) {
    in.ignore();
  } else {
    in.setstate(std::ios_base::failbit);
  }
  return in;
}
template istream &expect<'-'>(istream &in);
template istream &expect<'/'>(istream &in);

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t size) {
  DebugWarningIf(size == 0, "Invalid input with zero range size");
  // format: "bytes=start_offset-stop_offset"
  // e.g. bytes=0-0 return the first byte
  string range = "bytes=";
  range += to_string(start);
  range += "-";
  range += to_string(size == 0 ? start : start + size - 1);
  return range;
}

// --------------------------------------------------------------------------
tuple<uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const string &contentRange) {
  string cpy(BX::StringUtils::Trim(contentRange, ' '));
  if (cpy.empty()) {
    DebugWarning("Invalid input with empty content range");
    return make_tuple(0, 0, 0);
  }

  // format: "bytes start_offset-stop_offset/file_size"
  if (cpy.find("bytes ") != 0 || cpy.find("-") == string::npos ||
      cpy.find("/") == string::npos) {
    DebugWarning("Invalid input: " + cpy);
    return make_tuple(0, 0, 0);
  }
  cpy = cpy.substr(6);  // remove leading "bytes "
  uint64_t start = 0;
  uint64_t stop = 0;
  uint64_t size = 0;
  std::istringstream in(cpy);
  if (in >> start >> expect<'-'> >> stop >> expect<'/'> >> size) {
    if (!(stop >= start && size > stop)) {
      DebugWarning("Invalid input: " + cpy);
      return make_tuple(0, 0, 0);
    }
    return make_tuple(start, stop - start + 1, size);
  } else {
    DebugWarning("Invalid input: " + cpy);
    return make_tuple(0, 0, 0);
  }
}

// --------------------------------------------------------------------------
pair<uint64_t, uint64_t> ParseRequestContentRange(const string &requestRange) {
  string cpy(BX::StringUtils::Trim(requestRange, ' '));
  if (cpy.empty()) {
    DebugWarning("Invalid input with empty content range");
    return make_pair(0, 0);
  }

  // format: "bytes=start_offset-stop_offset"
  if (cpy.find("bytes=") != 0 || cpy.find("-") == string::npos) {
    DebugWarning("Invalid input: " + cpy);
    return make_pair(0, 0);
  }
  cpy = cpy.substr(6);  // remove leading "bytes="
  uint64_t start = 0;
  uint64_t stop = 0;
  std::istringstream in(cpy);
  if (in >> start >> expect<'-'> >> stop) {
    if (!(stop >= start)) {
      DebugWarning("Invalid input: " + cpy);
      return make_pair(0, 0);
    }
    return make_pair(start, stop - start + 1);
  } else {
    DebugWarning("Invalid input: " + cpy);
    return make_pair(0, 0);
  }
}

// --------------------------------------------------------------------------
string GetUrlPath(const string &url) {
  string::size_type schemeEnd = url.find("://");
  if (schemeEnd == string::npos || schemeEnd == 0) {
    return string();
  }
  string::size_type pathStart = url.find('/', schemeEnd + 3);
  if (pathStart == string::npos || pathStart == schemeEnd + 3) {
    return string();
  }
  string::size_type queryStart = url.find('?', pathStart);
  return queryStart == string::npos
             ? url.substr(pathStart)
             : url.substr(pathStart, queryStart - pathStart);
}

// --------------------------------------------------------------------------
bool IsValidBlobUrl(const string &url) {
  string path = GetUrlPath(url);
  // at least one char after the leading '/'
  return path.size() > 1;
}

// --------------------------------------------------------------------------
string AppendUrlQuery(const string &url, const string &query) {
  if (query.empty()) {
    return url;
  }
  return url.find('?') == string::npos ? url + "?" + query
                                        : url + "&" + query;
}

// --------------------------------------------------------------------------
string BuildBlockId(uint32_t index) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%06u", index);
  string raw(buf);

  typedef boost::archive::iterators::base64_from_binary<
      boost::archive::iterators::transform_width<string::const_iterator, 6,
                                                 8> >
      Base64Iterator;
  string encoded(Base64Iterator(raw.begin()), Base64Iterator(raw.end()));
  // pad to a multiple of 4
  encoded.append((4 - encoded.size() % 4) % 4, '=');
  return encoded;
}

// --------------------------------------------------------------------------
string BuildBlockListXml(const vector<string> &blockIds) {
  string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
  BOOST_FOREACH (const string &id, blockIds) {
    xml += "<Latest>";
    xml += id;
    xml += "</Latest>";
  }
  xml += "</BlockList>";
  return xml;
}

}  // namespace Utils
}  // namespace Client
}  // namespace BX
