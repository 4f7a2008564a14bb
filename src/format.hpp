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

#ifndef LZWUTIL_FORMAT_HPP
#define LZWUTIL_FORMAT_HPP

#include <inttypes.h>
#include <stdarg.h>
#include <stdio.h>

#include "Config.hpp"

#ifdef __has_attribute
#define HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define HAS_ATTRIBUTE(x) 0
#endif

/**
 * GCC will emit warnings if this attribute is not used on printf-like
 * functions. Param numbers are 1-indexed for normal functions.
 */
#if (defined(__GNUC__) && !defined(__clang__)) || HAS_ATTRIBUTE(format)
#define ATTRIBUTE_PRINTF(string_index, first_to_check) \
 __attribute__((format(printf, string_index, first_to_check)))
#else
#define ATTRIBUTE_PRINTF(string_index, first_to_check)
#endif

namespace format
{
#define O_(...) do { \
  fprintf(stderr, ": " __VA_ARGS__); \
  fflush(stderr); \
} while(0)

  /**
   * Common line printing functions.
   * Everything except errors is suppressed by -q.
   */

  static inline void endline()
  {
    if(!Config.quiet)
      fprintf(stderr, "\n");
  }

  static inline void vprint(const char *label, const char *fmt, va_list args)
  {
    O_("%-8.8s: ", label);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
  }

  ATTRIBUTE_PRINTF(2, 3)
  static inline void line(const char *label, const char *fmt, ...)
  {
    if(Config.quiet)
      return;

    va_list args;
    va_start(args, fmt);
    vprint(label, fmt, args);
    va_end(args);
  }

  ATTRIBUTE_PRINTF(1, 2)
  static inline void warning(const char *fmt, ...)
  {
    if(Config.quiet)
      return;

    va_list args;
    va_start(args, fmt);
    vprint("Warning", fmt, args);
    va_end(args);
  }

  ATTRIBUTE_PRINTF(1, 2)
  static inline void error(const char *fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    vprint("Error", fmt, args);
    va_end(args);
  }

  /* Decoder internals; only printed with -t. */
  ATTRIBUTE_PRINTF(1, 2)
  static inline void trace(const char *fmt, ...)
  {
    if(!Config.trace)
      return;

    va_list args;
    va_start(args, fmt);
    vprint("Trace", fmt, args);
    va_end(args);
  }

  static inline void report(const char *label, size_t count)
  {
    if(Config.quiet)
      return;

    O_("%-22.22s: %zu\n", label, count);
  }

  ATTRIBUTE_PRINTF(2, 3)
  static inline void reportline(const char *label, const char *fmt, ...)
  {
    if(Config.quiet)
      return;

    O_("%-22.22s: ", label);
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fprintf(stderr, "\n");
    fflush(stderr); // MinGW buffers stderr...
  }
}

#endif /* LZWUTIL_FORMAT_HPP */
