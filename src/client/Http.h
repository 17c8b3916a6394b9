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

#ifndef BLOBXFER_CLIENT_HTTP_H_
#define BLOBXFER_CLIENT_HTTP_H_

#include <map>
#include <string>

namespace BX {

namespace Client {

namespace Http {

struct HttpMethod {
  enum Value { GET, PUT, HEAD, DELETE };
};

std::string HttpMethodToString(HttpMethod::Value method);

typedef std::map<std::string, std::string> HeaderMap;

class HttpRequest {
 public:
  HttpRequest(HttpMethod::Value method, const std::string &url)
      : m_method(method), m_url(url) {}

 public:
  HttpMethod::Value GetMethod() const { return m_method; }
  const std::string &GetUrl() const { return m_url; }
  const HeaderMap &GetHeaders() const { return m_headers; }
  const std::string &GetBody() const { return m_body; }

  // Return header value or empty string if not set
  std::string GetHeader(const std::string &name) const;

  void SetHeader(const std::string &name, const std::string &value) {
    m_headers[name] = value;
  }
  void SetBody(const std::string &body) { m_body = body; }

 private:
  HttpMethod::Value m_method;
  std::string m_url;
  HeaderMap m_headers;
  std::string m_body;
};

class HttpResponse {
 public:
  HttpResponse() : m_statusCode(0) {}
  explicit HttpResponse(int statusCode) : m_statusCode(statusCode) {}

 public:
  int GetStatusCode() const { return m_statusCode; }
  const HeaderMap &GetHeaders() const { return m_headers; }
  const std::string &GetBody() const { return m_body; }
  bool IsSuccess() const { return m_statusCode >= 200 && m_statusCode < 300; }

  // Header lookup ignoring case of the name
  //
  // @param  : header name
  // @return : header value or empty string if not found
  std::string GetHeader(const std::string &name) const;

  void SetStatusCode(int statusCode) { m_statusCode = statusCode; }
  void SetHeader(const std::string &name, const std::string &value) {
    m_headers[name] = value;
  }
  void SetBody(const std::string &body) { m_body = body; }

 private:
  int m_statusCode;
  HeaderMap m_headers;
  std::string m_body;
};

}  // namespace Http
}  // namespace Client
}  // namespace BX

#endif  // BLOBXFER_CLIENT_HTTP_H_
