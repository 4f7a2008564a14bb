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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <memory>
#include <vector>

#include "Config.hpp"
#include "LZW.hpp"
#include "decode.hpp"
#include "error.hpp"
#include "format.hpp"
#include "vio.hpp"

#define USAGE \
  "Decode a raw GIF/TIFF-style LZW code stream (no container).\n\n" \
  "Usage:\n" \
  "  %s [options] input.lzw [output]\n\n" \
  "If output is '-', decoded data is written to stdout. If it is omitted,\n" \
  "the stream is only decoded and summarized.\n\n"

namespace lzwutil
{
static void report(const stream_summary &s)
{
  format::reportline("Root bits", "%u (%s endian)", s.root_bits, endian_name(s.order));
  format::report("Bytes in", s.stats.bytes_in);
  format::report("Bytes out", s.stats.bytes_out);
  format::report("Codes", s.stats.codes_read);
  format::report("Clear codes", s.stats.clears);
  format::report("Entries added", s.stats.entries_added);
  format::reportline("Widest code", "%u bits", s.stats.max_width);
  if(s.trailing_bytes)
    format::report("Trailing bytes", s.trailing_bytes);
  if(s.stats.codes_skipped)
    format::warning("skipped %zu codes with no previous entry", s.stats.codes_skipped);
}

static bool decode_file(const char *filename, const char *outname)
{
  std::unique_ptr<vio> in;
  std::unique_ptr<vio> out;

  format::line("File", "%s", filename);

  try
  {
    if(!strcmp(filename, "-"))
      in.reset(new vio_file(stdin));
    else
      in.reset(new vio_file(filename, "rb"));
  }
  catch(const char *e)
  {
    format::error("%s '%s'.", e, filename);
    return false;
  }

  if(outname)
  {
    try
    {
      if(!strcmp(outname, "-"))
        out.reset(new vio_file(stdout));
      else
        out.reset(new vio_file(outname, "wb"));
    }
    catch(const char *e)
    {
      format::error("%s '%s'.", e, outname);
      return false;
    }
  }

  int64_t length = in->length();
  if(length >= 0)
    format::line("Size", "%" PRId64, length);

  stream_summary summary;
  lzwutil::error err = decode_stream(*in, out.get(), &summary);
  if(err)
  {
    format::error("%s", lzwutil::strerror(err));
    return false;
  }
  report(summary);
  return true;
}
} /* namespace lzwutil */


#ifdef LIBFUZZER_FRONTEND
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
  Config.quiet = true;

  /* Odd chunk size to exercise the carry-over. */
  static constexpr size_t CHUNK = 7;
  LZW_decoder lzw;
  std::vector<uint8_t> decoded;

  if(lzw.init(8) != lzwutil::SUCCESS)
    return 0;

  for(size_t pos = 0; pos < size && !lzw.is_finished(); pos += CHUNK)
  {
    vio_buffer chunk(static_cast<const void *>(data + pos), MIN(CHUNK, size - pos));
    decoded.clear();
    if(lzw.decode(chunk, decoded) != lzwutil::SUCCESS)
      break;
  }
  return 0;
}

#define main _main
static __attribute__((unused))
#endif

int main(int argc, char *argv[])
{
  if(!argv || argc < 2)
  {
    const char *name = argv ? argv[0] : "lzwutil";
    fprintf(stdout, USAGE "%s", name, Config.COMMON_FLAGS);
    return 0;
  }

  if(!Config.init(&argc, argv))
    return -1;

  if(argc < 2)
  {
    format::error("no input file.");
    return -1;
  }
  if(argc > 3)
  {
    format::error("too many arguments.");
    return -1;
  }

  bool ok = lzwutil::decode_file(argv[1], argc > 2 ? argv[2] : nullptr);
  format::endline();

  return ok ? 0 : 1;
}
