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

#include <stdint.h>

#include <gtest/gtest.h>

#include "Bitstream.hpp"
#include "vio.hpp"

TEST(Bitstream, LittleEndianCodes)
{
  // 3-bit codes 4, 1, 5 packed low bits first.
  static const uint8_t data[] = { 0x4c, 0x01 };
  vio_buffer src(static_cast<const void *>(data), sizeof(data));
  Bitstream<Endian::LITTLE> bs(src);
  int actual;

  EXPECT_EQ(bs.read(3, &actual), 4u);
  EXPECT_EQ(actual, 3);
  EXPECT_EQ(bs.read(3, &actual), 1u);
  EXPECT_EQ(actual, 3);
  EXPECT_EQ(bs.read(3, &actual), 5u);
  EXPECT_EQ(actual, 3);
  EXPECT_EQ(bs.num_read, 2u);

  EXPECT_EQ(bs.available(), 7);
  EXPECT_EQ(bs.read(7, &actual), 0u);
  EXPECT_EQ(actual, 7);

  EXPECT_EQ(bs.read(3, &actual), 0u);
  EXPECT_EQ(actual, 0);
}

TEST(Bitstream, BigEndianCodes)
{
  // 101 0010100 00001111 -> 0xA5 0x0F, last read is short.
  static const uint8_t data[] = { 0xA5, 0x0F };
  vio_buffer src(static_cast<const void *>(data), sizeof(data));
  Bitstream<Endian::BIG> bs(src);
  int actual;

  EXPECT_EQ(bs.read(3, &actual), 5u);
  EXPECT_EQ(actual, 3);
  EXPECT_EQ(bs.read(7, &actual), 20u);
  EXPECT_EQ(actual, 7);
  EXPECT_EQ(bs.read(8, &actual), 15u);
  EXPECT_EQ(actual, 6);
  EXPECT_EQ(bs.num_read, 2u);
}

TEST(Bitstream, ShortReadLittleEndian)
{
  // Only the low 8 bits of a 12-bit read are available.
  static const uint8_t data[] = { 0xB7 };
  vio_buffer src(static_cast<const void *>(data), sizeof(data));
  Bitstream<Endian::LITTLE> bs(src);
  int actual;

  EXPECT_EQ(bs.read(12, &actual), 0xB7u);
  EXPECT_EQ(actual, 8);
  EXPECT_EQ(bs.available(), 0);
}

TEST(Bitstream, WideCodesAcrossBytes)
{
  // 12-bit codes 0xABC, 0x123 in both orders.
  {
    static const uint8_t data[] = { 0xBC, 0x3A, 0x12 };
    vio_buffer src(static_cast<const void *>(data), sizeof(data));
    Bitstream<Endian::LITTLE> bs(src);
    int actual;

    EXPECT_EQ(bs.read(12, &actual), 0xABCu);
    EXPECT_EQ(bs.read(12, &actual), 0x123u);
    EXPECT_EQ(actual, 12);
  }
  {
    static const uint8_t data[] = { 0xAB, 0xC1, 0x23 };
    vio_buffer src(static_cast<const void *>(data), sizeof(data));
    Bitstream<Endian::BIG> bs(src);
    int actual;

    EXPECT_EQ(bs.read(12, &actual), 0xABCu);
    EXPECT_EQ(bs.read(12, &actual), 0x123u);
    EXPECT_EQ(actual, 12);
  }
}

TEST(Bitstream, OnlyReadsBytesItNeeds)
{
  static const uint8_t data[] = { 0x01, 0x02, 0x03, 0x04 };
  vio_buffer src(static_cast<const void *>(data), sizeof(data));
  Bitstream<Endian::LITTLE> bs(src);
  int actual;

  EXPECT_EQ(bs.read(9, &actual), 0x201u & 0x1ffu);
  EXPECT_EQ(bs.num_read, 2u);
  EXPECT_EQ(src.tell(), 2);
}

TEST(Bitstream, RejectsOversizedRead)
{
  static const uint8_t data[] = { 0xff, 0xff, 0xff };
  vio_buffer src(static_cast<const void *>(data), sizeof(data));
  Bitstream<Endian::BIG> bs(src);
  int actual = -1;

  EXPECT_EQ(bs.read(17, &actual), 0u);
  EXPECT_EQ(actual, 0);
  EXPECT_EQ(bs.num_read, 0u);
}
