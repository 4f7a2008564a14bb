/**
 * Copyright (C) 2026 The lzwutil authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * Decode a whole code stream from one vio into another, the way the
 * command line tool does it: Config.chunk_size bytes per decode() call.
 */

#ifndef LZWUTIL_DECODE_HPP
#define LZWUTIL_DECODE_HPP

#include <stddef.h>

#include "LZW.hpp"
#include "common.hpp"
#include "error.hpp"

class vio;

namespace lzwutil
{
  struct stream_summary
  {
    LZW_stats stats{};
    Endian order = Endian::LITTLE;
    unsigned root_bits = 0;
    bool finished = false;
    bool partial_code = false;
    size_t trailing_bytes = 0;
  };

  /**
   * Decode `in` with the root code size, bit order, flags and chunk size
   * in Config. Decoded data is written to `out` unless it is null.
   * A stream without an end-of-information code is not an error; check
   * `summary->finished`.
   */
  lzwutil::error decode_stream(vio &in, vio *out, stream_summary *summary = nullptr);
}

#endif /* LZWUTIL_DECODE_HPP */
