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
#include "format.hpp"

#include <stdlib.h>
#include <string.h>
#include <strings.h>

ConfigInfo Config;

constexpr unsigned ConfigInfo::DEFAULT_CODE_SIZE;
constexpr size_t ConfigInfo::DEFAULT_CHUNK_SIZE;
constexpr size_t ConfigInfo::MAX_CHUNK_SIZE;

const char ConfigInfo::COMMON_FLAGS[] =
  "Common flags:\n"
  "  -q[=N]    Suppress text output. N=1 enables (optional), N=0 disables (default).\n"
  "  -t[=N]    Trace decoder state changes (clears, width changes, bad codes).\n"
  "            N=1 enables (optional), N=0 disables (default).\n"
  "  -b=N      Root code size in bits (2-11). GIF streams store this before the\n"
  "            first data sub-block. Default: 8.\n"
  "  -e=ORDER  Bit order of the code stream: 'le' (GIF, default) or 'be' (TIFF).\n"
  "  -c=N      Feed the decoder N bytes of input per call. Default: 4096.\n"
  "  -S[=N]    Strict mode: fail on codes that can not be derived from the\n"
  "            dictionary instead of skipping them. N=1 enables (optional).\n"
  "  -         Read the code stream from stdin. Place after any other options.\n\n";

static bool parse_int(char opt, const char *str, long *ret)
{
  if(str[0])
  {
    char *end;
    long val = strtol(str, &end, 10);
    if(!end || !end[0])
    {
      *ret = val;
      return true;
    }
  }
  format::error("invalid value for option -%c", opt);
  return false;
}

static bool parse_endian(const char *str, Endian *ret)
{
  if(!strcasecmp(str, "le") || !strcasecmp(str, "little") || !strcasecmp(str, "lsb"))
  {
    *ret = Endian::LITTLE;
    return true;
  }
  if(!strcasecmp(str, "be") || !strcasecmp(str, "big") || !strcasecmp(str, "msb"))
  {
    *ret = Endian::BIG;
    return true;
  }
  format::error("invalid bit order '%s' (expected 'le' or 'be')", str);
  return false;
}

bool ConfigInfo::init(int *_argc, char **argv)
{
  int argc = *_argc;
  int new_argc = 1;
  long value;

  for(int i = 1; i < argc; i++)
  {
    char *arg = argv[i];
    if(arg[0] == '-' && arg[1])
    {
      switch(arg[1])
      {
        /* Suppress text output.
         * This does NOT completely disable text printing code,
         * just prevents it from printing. */
        case 'q':
          value = 1;
          if(arg[2] == '=' && !parse_int(arg[1], arg + 3, &value))
            return false;

          quiet = (value != 0);
          continue;

        /* Trace decoder internals. */
        case 't':
          value = 1;
          if(arg[2] == '=' && !parse_int(arg[1], arg + 3, &value))
            return false;

          trace = (value != 0);
          continue;

        /* Strict mode. */
        case 'S':
          value = 1;
          if(arg[2] == '=' && !parse_int(arg[1], arg + 3, &value))
            return false;

          strict = (value != 0);
          continue;

        /* Root code size. */
        case 'b':
          if(arg[2] != '=')
            break;

          if(!parse_int(arg[1], arg + 3, &value))
            return false;

          if(value < 2 || value > 11)
          {
            format::error("root code size must be 2 to 11 bits (got %ld)", value);
            return false;
          }
          code_size = value;
          continue;

        /* Bit order. */
        case 'e':
          if(arg[2] != '=')
            break;

          if(!parse_endian(arg + 3, &order))
            return false;
          continue;

        /* Input chunk size. */
        case 'c':
          if(arg[2] != '=')
            break;

          if(!parse_int(arg[1], arg + 3, &value))
            return false;

          if(value < 1 || static_cast<unsigned long>(value) > MAX_CHUNK_SIZE)
          {
            format::error("chunk size must be 1 to %zu bytes (got %ld)", MAX_CHUNK_SIZE, value);
            return false;
          }
          chunk_size = value;
          continue;
      }
      format::error("unknown option '%s'!", argv[i]);
      return false;
    }
    argv[new_argc++] = argv[i];
  }

  *_argc = new_argc;
  return true;
}
