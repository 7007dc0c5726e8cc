#include "GzipUtils.hpp"

#include <zlib.h>

#include "TestHeaders.hpp"

using namespace sb;

namespace {
string gunzip(const string& compressed) {
  z_stream strm;
  memset(&strm, 0, sizeof(strm));
  REQUIRE(inflateInit2(&strm, 15 + 16) == Z_OK);
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  strm.avail_in = static_cast<uInt>(compressed.size());

  string output;
  char buffer[4096];
  int rc;
  do {
    strm.next_out = reinterpret_cast<Bytef*>(buffer);
    strm.avail_out = sizeof(buffer);
    rc = inflate(&strm, Z_NO_FLUSH);
    REQUIRE((rc == Z_OK || rc == Z_STREAM_END));
    output.append(buffer, sizeof(buffer) - strm.avail_out);
  } while (rc != Z_STREAM_END);
  // A single gzip member: nothing may follow the end of the stream
  REQUIRE(strm.avail_in == 0);
  inflateEnd(&strm);
  return output;
}
}  // namespace

TEST_CASE("gzipCompress produces one gzip member", "[GzipUtils]") {
  string report = "{\"guid\":\"abc\",\"players_online\":5}";
  string compressed = gzipCompress(report);

  REQUIRE(compressed.size() > 18);
  REQUIRE(static_cast<unsigned char>(compressed[0]) == 0x1f);
  REQUIRE(static_cast<unsigned char>(compressed[1]) == 0x8b);
  REQUIRE(gunzip(compressed) == report);
}

TEST_CASE("gzipCompress handles empty and large input", "[GzipUtils]") {
  REQUIRE(gunzip(gzipCompress("")) == "");

  string large;
  for (int i = 0; i < 20000; i++) {
    large += to_string(i % 97) + ",";
  }
  string compressed = gzipCompress(large);
  REQUIRE(compressed.size() < large.size());
  REQUIRE(gunzip(compressed) == large);
}
