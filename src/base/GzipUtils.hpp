#ifndef __SB_GZIP_UTILS__
#define __SB_GZIP_UTILS__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Compresses `input` into a single-member gzip stream.
 *
 * Throws std::runtime_error if zlib reports a failure.
 */
string gzipCompress(const string& input);
}  // namespace sb

#endif  // __SB_GZIP_UTILS__
