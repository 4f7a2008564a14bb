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

#ifndef LZWUTIL_COMMON_HPP
#define LZWUTIL_COMMON_HPP

#include <stdint.h>

template<class T>
constexpr T MAX(T a, T b)
{
  return a > b ? a : b;
}

template<class T>
constexpr T MIN(T a, T b)
{
  return a < b ? a : b;
}

/* Bit order of a packed code stream.
 * LITTLE: GIF (low-order bits of each byte first).
 * BIG:    TIFF and PDF (high-order bits of each byte first). */
enum class Endian
{
  LITTLE,
  BIG
};

static inline constexpr const char *endian_name(Endian e)
{
  return e == Endian::BIG ? "big" : "little";
}

/* Mask of the low `bits` bits. Valid for 0 <= bits <= 31. */
static inline constexpr uint32_t bitmask(unsigned bits)
{
  return (1u << bits) - 1u;
}

#endif /* LZWUTIL_COMMON_HPP */
