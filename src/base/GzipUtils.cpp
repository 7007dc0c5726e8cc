#include "GzipUtils.hpp"

#include <zlib.h>

namespace sb {
namespace {
// 15 window bits, +16 selects the gzip wrapper instead of zlib
const int GZIP_WINDOW_BITS = 15 + 16;
const int GZIP_MEM_LEVEL = 8;
}  // namespace

string gzipCompress(const string& input) {
  z_stream strm;
  memset(&strm, 0, sizeof(strm));
  int rc = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                        GZIP_WINDOW_BITS, GZIP_MEM_LEVEL, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error("deflateInit2 failed with code " +
                             to_string(rc));
  }

  string output;
  output.resize(deflateBound(&strm, input.size()));
  strm.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  strm.avail_in = static_cast<uInt>(input.size());
  strm.next_out = reinterpret_cast<Bytef*>(&output[0]);
  strm.avail_out = static_cast<uInt>(output.size());

  rc = deflate(&strm, Z_FINISH);
  if (rc != Z_STREAM_END) {
    deflateEnd(&strm);
    throw std::runtime_error("deflate did not finish the stream, code " +
                             to_string(rc));
  }
  output.resize(strm.total_out);
  deflateEnd(&strm);
  VLOG(2) << "Compressed " << input.size() << " bytes into " << output.size();
  return output;
}
}  // namespace sb
