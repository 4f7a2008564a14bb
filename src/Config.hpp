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

#ifndef LZWUTIL_CONFIG_HPP
#define LZWUTIL_CONFIG_HPP

#include <stddef.h>

#include "common.hpp"

struct ConfigInfo final
{
  static const char COMMON_FLAGS[];
  static constexpr unsigned DEFAULT_CODE_SIZE = 8;
  static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;
  static constexpr size_t MAX_CHUNK_SIZE = 1 << 24;

  bool quiet = false;
  bool trace = false;
  bool strict = false;
  unsigned code_size = DEFAULT_CODE_SIZE;
  Endian order = Endian::LITTLE;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;

  /**
   * Read configuration options out of argv.
   * This will remove all valid options from argv aside from '-',
   * which signifies stdin should be used as an input. If an invalid
   * option is encountered, this function will print an error and
   * return false.
   */
  bool init(int *argc, char **argv);
};

extern ConfigInfo Config;

#endif /* LZWUTIL_CONFIG_HPP */
