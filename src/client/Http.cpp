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

#include "client/Http.h"

#include <string>

#include "boost/foreach.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace BX {

namespace Client {

namespace Http {

using std::string;

namespace {

string FindHeader(const HeaderMap &headers, const string &name) {
  HeaderMap::const_iterator it = headers.find(name);
  if (it != headers.end()) {
    return it->second;
  }
  string lowerName = StringUtils::ToLower(name);
  BOOST_FOREACH (const HeaderMap::value_type &p, headers) {
    if (StringUtils::ToLower(p.first) == lowerName) {
      return p.second;
    }
  }
  return string();
}

}  // namespace

// --------------------------------------------------------------------------
string HttpMethodToString(HttpMethod::Value method) {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::DELETE:
      return "DELETE";
    default:
      DebugWarning("Trying to get name of unrecognized http method");
  }
  return "GET";
}

// --------------------------------------------------------------------------
string HttpRequest::GetHeader(const string &name) const {
  return FindHeader(m_headers, name);
}

// --------------------------------------------------------------------------
string HttpResponse::GetHeader(const string &name) const {
  return FindHeader(m_headers, name);
}

}  // namespace Http
}  // namespace Client
}  // namespace BX
