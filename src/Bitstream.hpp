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

#ifndef LZWUTIL_BITSTREAM_HPP
#define LZWUTIL_BITSTREAM_HPP

#include <stdint.h>
#include <stdio.h>

#include "common.hpp"
#include "vio.hpp"

/**
 * Bitstream reader with a fixed bit order.
 *
 * Unlike a plain bitstream, a read that runs out of input is not a failure:
 * read() returns whatever bits were left and reports how many that was, so
 * the caller can hold onto a partial code until more input arrives.
 * Unread bits of the last byte consumed stay in `buf` for the next read().
 */
template<Endian E>
struct Bitstream
{
  static constexpr int MAX_READ_BITS = 16;

  vio &fp;
  uint32_t buf = 0;
  size_t num_read = 0;
  int buf_bits = 0;

  Bitstream(vio &_fp): fp(_fp) {}

  /**
   * Read up to `bits_to_read` bits (at most MAX_READ_BITS).
   *
   * LITTLE: the first bit read from the stream is the lowest bit returned.
   * BIG:    the first bit read from the stream is the highest bit returned;
   *         a short read is right-aligned (i.e. it holds the leading bits).
   *
   * @param bits_to_read  number of bits to read.
   * @param actual        receives the number of bits actually read (0 if
   *                      the source is exhausted).
   * @return              the bits read.
   */
  inline unsigned read(int bits_to_read, int *actual)
  {
    if(bits_to_read < 0 || bits_to_read > MAX_READ_BITS)
    {
      *actual = 0;
      return 0;
    }

    if(buf_bits < bits_to_read)
      fill(bits_to_read);

    int n = MIN(bits_to_read, buf_bits);
    *actual = n;
    return take(n);
  }

  /* Number of buffered bits not yet returned by read(). */
  inline int available() const
  {
    return buf_bits;
  }

private:
  inline int read_byte()
  {
    uint8_t byte;
    if(fp.read(&byte, 1) < 1)
      return -1;

    return byte;
  }

  inline void fill(int bits_to_read)
  {
    while(buf_bits < bits_to_read)
    {
      int byte = read_byte();
      if(byte < 0)
        return;

      push(byte);
      num_read++;
    }
  }

  inline void push(uint32_t byte);
  inline unsigned take(int n);
};

/* Little endian: new bytes go above the buffered bits, reads come off the bottom. */
template<>
inline void Bitstream<Endian::LITTLE>::push(uint32_t byte)
{
  buf |= byte << buf_bits;
  buf_bits += 8;
}

template<>
inline unsigned Bitstream<Endian::LITTLE>::take(int n)
{
  unsigned ret = buf & bitmask(n);
  buf >>= n;
  buf_bits -= n;
  return ret;
}

/* Big endian: new bytes shift in at the bottom, reads come off the top. */
template<>
inline void Bitstream<Endian::BIG>::push(uint32_t byte)
{
  buf = (buf << 8) | byte;
  buf_bits += 8;
}

template<>
inline unsigned Bitstream<Endian::BIG>::take(int n)
{
  buf_bits -= n;
  unsigned ret = (buf >> buf_bits) & bitmask(n);
  buf &= bitmask(buf_bits);
  return ret;
}

#endif /* LZWUTIL_BITSTREAM_HPP */
