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

#include "Config.hpp"
#include "decode.hpp"
#include "format.hpp"
#include "vio.hpp"

#include <stdint.h>
#include <exception>
#include <memory>
#include <vector>

namespace lzwutil
{
static int flags_from_config()
{
  return Config.strict ? LZW_FLAG_STRICT : 0;
}

static lzwutil::error write_output(vio *out, const std::vector<uint8_t> &data)
{
  if(!out || data.empty())
    return lzwutil::SUCCESS;

  if(out->write(data.data(), data.size()) < data.size())
    return lzwutil::WRITE_ERROR;

  return lzwutil::SUCCESS;
}

lzwutil::error decode_stream(vio &in, vio *out, stream_summary *summary)
{
  LZW_decoder lzw;
  std::unique_ptr<uint8_t[]> buffer;
  std::vector<uint8_t> decoded;
  size_t trailing = 0;

  if(!Config.chunk_size)
    return lzwutil::INVALID;

  lzwutil::error ret = lzw.init(Config.code_size, Config.order, flags_from_config());
  if(ret)
    return ret;

  try
  {
    buffer.reset(new uint8_t[Config.chunk_size]);
  }
  catch(std::exception &e)
  {
    format::warning("input buffer alloc failed: %s", e.what());
    return lzwutil::ALLOC_ERROR;
  }

  while(!lzw.is_finished())
  {
    size_t len = in.read(buffer.get(), Config.chunk_size);
    if(len == 0)
      break;

    vio_buffer chunk(static_cast<const void *>(buffer.get()), len);

    decoded.clear();
    ret = lzw.decode(chunk, decoded);
    if(ret)
      return ret;

    ret = write_output(out, decoded);
    if(ret)
      return ret;

    if(lzw.is_finished())
      trailing = len - static_cast<size_t>(chunk.tell());
  }

  if(in.error())
    return lzwutil::READ_ERROR;

  if(lzw.is_finished())
  {
    /* Anything after the end code that was never read in. */
    int64_t length = in.length();
    int64_t pos = in.tell();
    if(length >= 0 && pos >= 0 && length > pos)
      trailing += static_cast<size_t>(length - pos);

    if(trailing)
      format::warning("%zu bytes of data after end of information code", trailing);
  }
  else
  {
    if(lzw.has_partial_code())
      format::warning("stream ends in the middle of a code");
    format::warning("missing end of information code");
  }

  if(summary)
  {
    summary->stats = lzw.get_stats();
    summary->order = lzw.get_order();
    summary->root_bits = lzw.get_root_bits();
    summary->finished = lzw.is_finished();
    summary->partial_code = lzw.has_partial_code();
    summary->trailing_bytes = trailing;
  }
  return lzwutil::SUCCESS;
}
} /* namespace lzwutil */
