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

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "boost/tuple/tuple.hpp"

#include "client/Http.h"
#include "client/Utils.h"

namespace {

using BX::Client::Http::HttpMethod;
using BX::Client::Http::HttpMethodToString;
using BX::Client::Http::HttpRequest;
using BX::Client::Http::HttpResponse;
using BX::Client::Utils::AppendUrlQuery;
using BX::Client::Utils::BuildBlockId;
using BX::Client::Utils::BuildBlockListXml;
using BX::Client::Utils::BuildRequestRange;
using BX::Client::Utils::GetUrlPath;
using BX::Client::Utils::IsValidBlobUrl;
using BX::Client::Utils::ParseRequestContentRange;
using BX::Client::Utils::ParseResponseContentRange;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

typedef boost::tuple<uint64_t, uint64_t, uint64_t> RangeTuple;

}  // namespace

TEST(ClientUtilsTest, RequestRange) {
  EXPECT_EQ(string("bytes=0-4194303"), BuildRequestRange(0, 4194304));
  EXPECT_EQ(string("bytes=10-10"), BuildRequestRange(10, 1));

  pair<uint64_t, uint64_t> range = ParseRequestContentRange("bytes=2-5");
  EXPECT_EQ(2u, range.first);
  EXPECT_EQ(4u, range.second);

  range = ParseRequestContentRange(BuildRequestRange(1048576, 2097152));
  EXPECT_EQ(1048576u, range.first);
  EXPECT_EQ(2097152u, range.second);

  EXPECT_EQ(make_pair(static_cast<uint64_t>(0), static_cast<uint64_t>(0)),
            ParseRequestContentRange("bytes=5-2"));
  EXPECT_EQ(make_pair(static_cast<uint64_t>(0), static_cast<uint64_t>(0)),
            ParseRequestContentRange("2-5"));
}

TEST(ClientUtilsTest, ResponseContentRange) {
  RangeTuple range = ParseResponseContentRange("bytes 0-2097151/10485760");
  EXPECT_EQ(0u, boost::get<0>(range));
  EXPECT_EQ(2097152u, boost::get<1>(range));
  EXPECT_EQ(10485760u, boost::get<2>(range));

  range = ParseResponseContentRange(" bytes 8-9/10 ");
  EXPECT_EQ(8u, boost::get<0>(range));
  EXPECT_EQ(2u, boost::get<1>(range));
  EXPECT_EQ(10u, boost::get<2>(range));

  // stop beyond total
  range = ParseResponseContentRange("bytes 0-10/10");
  EXPECT_EQ(0u, boost::get<2>(range));
  // unknown total
  range = ParseResponseContentRange("bytes 0-9/*");
  EXPECT_EQ(0u, boost::get<2>(range));
  range = ParseResponseContentRange("items 0-9/10");
  EXPECT_EQ(0u, boost::get<2>(range));
  range = ParseResponseContentRange("");
  EXPECT_EQ(0u, boost::get<2>(range));
}

TEST(ClientUtilsTest, UrlPath) {
  EXPECT_EQ(string("/c1/dir/blob"),
            GetUrlPath("https://account.host/c1/dir/blob?sv=1&sig=x"));
  EXPECT_EQ(string("/c1/blob"), GetUrlPath("http://127.0.0.1:10000/c1/blob"));
  EXPECT_EQ(string("/"), GetUrlPath("https://account.host/"));
  EXPECT_EQ(string(), GetUrlPath("https://account.host"));
  EXPECT_EQ(string(), GetUrlPath("account.host/c1/blob"));
  EXPECT_EQ(string(), GetUrlPath("https:///c1/blob"));

  EXPECT_TRUE(IsValidBlobUrl("https://account.host/c1/blob"));
  EXPECT_FALSE(IsValidBlobUrl("https://account.host/"));
  EXPECT_FALSE(IsValidBlobUrl("/local/file"));
  EXPECT_FALSE(IsValidBlobUrl(""));
}

TEST(ClientUtilsTest, UrlQuery) {
  EXPECT_EQ(string("https://h/c/b?comp=block"),
            AppendUrlQuery("https://h/c/b", "comp=block"));
  EXPECT_EQ(string("https://h/c/b?sig=x&comp=blocklist"),
            AppendUrlQuery("https://h/c/b?sig=x", "comp=blocklist"));
  EXPECT_EQ(string("https://h/c/b"), AppendUrlQuery("https://h/c/b", ""));
}

TEST(ClientUtilsTest, BlockId) {
  EXPECT_EQ(string("MDAwMDAw"), BuildBlockId(0));
  EXPECT_EQ(string("MDAwMDAx"), BuildBlockId(1));
  EXPECT_EQ(string("MDQ5OTk5"), BuildBlockId(49999));

  // ids of one blob have equal length and are distinct
  EXPECT_EQ(BuildBlockId(7).size(), BuildBlockId(12345).size());
  EXPECT_NE(BuildBlockId(7), BuildBlockId(8));
}

TEST(ClientUtilsTest, BlockListXml) {
  vector<string> ids;
  EXPECT_EQ(string("<?xml version=\"1.0\" encoding=\"utf-8\"?>"
                   "<BlockList></BlockList>"),
            BuildBlockListXml(ids));

  ids.push_back(BuildBlockId(0));
  ids.push_back(BuildBlockId(1));
  EXPECT_EQ(string("<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>"
                   "<Latest>MDAwMDAw</Latest><Latest>MDAwMDAx</Latest>"
                   "</BlockList>"),
            BuildBlockListXml(ids));
}

TEST(ClientUtilsTest, HttpMessage) {
  EXPECT_EQ(string("GET"), HttpMethodToString(HttpMethod::GET));
  EXPECT_EQ(string("PUT"), HttpMethodToString(HttpMethod::PUT));

  HttpRequest request(HttpMethod::GET, "https://h/c/b");
  request.SetHeader("Range", "bytes=0-9");
  EXPECT_EQ(string("bytes=0-9"), request.GetHeader("range"));
  EXPECT_EQ(string(), request.GetHeader("Content-Length"));

  HttpResponse response(206);
  response.SetHeader("content-range", "bytes 0-9/100");
  EXPECT_TRUE(response.IsSuccess());
  EXPECT_EQ(string("bytes 0-9/100"), response.GetHeader("Content-Range"));

  response.SetStatusCode(304);
  EXPECT_FALSE(response.IsSuccess());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
