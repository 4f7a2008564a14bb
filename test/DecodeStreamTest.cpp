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
#include <string.h>
#include <vector>

#include <gtest/gtest.h>

#include "CodeWriter.hpp"
#include "Config.hpp"
#include "decode.hpp"
#include "vio.hpp"

class DecodeStreamTest : public ::testing::Test
{
protected:
  ConfigInfo saved;

  void SetUp() override
  {
    saved = Config;
    Config.quiet = true;
  }

  void TearDown() override
  {
    Config = saved;
  }

  /* Run decode_stream into a buffer of `capacity` bytes. */
  lzwutil::error run(const std::vector<uint8_t> &in, std::vector<uint8_t> &out,
   size_t capacity, lzwutil::stream_summary *summary)
  {
    std::vector<uint8_t> dest(capacity);
    vio_buffer src(static_cast<const void *>(in.data()), in.size());
    vio_buffer dst(static_cast<void *>(dest.data()), dest.size());

    lzwutil::error ret = lzwutil::decode_stream(src, &dst, summary);
    out.assign(dest.begin(), dest.begin() + dst.tell());
    return ret;
  }
};

TEST_F(DecodeStreamTest, ChunkSizeDoesNotChangeOutput)
{
  std::vector<uint8_t> data = make_test_data(5000, 5);

  for(Endian order : { Endian::LITTLE, Endian::BIG })
  {
    std::vector<uint8_t> in = lzw_compress(data, 8, order);
    Config.order = order;

    for(size_t chunk : { in.size(), static_cast<size_t>(1), static_cast<size_t>(3),
     static_cast<size_t>(4096) })
    {
      lzwutil::stream_summary summary;
      std::vector<uint8_t> out;

      Config.chunk_size = chunk;
      ASSERT_EQ(run(in, out, data.size() + 16, &summary), lzwutil::SUCCESS);
      EXPECT_EQ(out, data) << endian_name(order) << " chunk " << chunk;
      EXPECT_TRUE(summary.finished);
      EXPECT_FALSE(summary.partial_code);
      EXPECT_EQ(summary.trailing_bytes, 0u);
      EXPECT_EQ(summary.order, order);
      EXPECT_EQ(summary.root_bits, 8u);
      EXPECT_EQ(summary.stats.bytes_in, in.size());
      EXPECT_EQ(summary.stats.bytes_out, data.size());
    }
  }
}

TEST_F(DecodeStreamTest, NoOutputStillDecodes)
{
  std::vector<uint8_t> data = make_test_data(2000, 4);
  std::vector<uint8_t> in = lzw_compress(data, 2, Endian::LITTLE);
  lzwutil::stream_summary summary;

  Config.code_size = 2;
  Config.chunk_size = 7;

  vio_buffer src(static_cast<const void *>(in.data()), in.size());
  ASSERT_EQ(lzwutil::decode_stream(src, nullptr, &summary), lzwutil::SUCCESS);
  EXPECT_TRUE(summary.finished);
  EXPECT_EQ(summary.stats.bytes_out, data.size());
  EXPECT_GT(summary.stats.entries_added, 0u);
}

TEST_F(DecodeStreamTest, FullOutputIsWriteError)
{
  std::vector<uint8_t> data = make_test_data(1000, 3);
  std::vector<uint8_t> in = lzw_compress(data, 8, Endian::LITTLE);
  std::vector<uint8_t> out;

  ASSERT_EQ(run(in, out, 10, nullptr), lzwutil::WRITE_ERROR);
  EXPECT_EQ(out.size(), 10u);
  EXPECT_EQ(0, memcmp(out.data(), data.data(), 10));
}

TEST_F(DecodeStreamTest, CountsBytesAfterEndCode)
{
  LZWStreamWriter s(8, Endian::LITTLE);
  s.clear().code('o').code('k').end();
  std::vector<uint8_t> in = s.bytes();
  in.insert(in.end(), { 0xde, 0xad, 0xbe });

  for(size_t chunk : { static_cast<size_t>(1), static_cast<size_t>(2), in.size() })
  {
    lzwutil::stream_summary summary;
    std::vector<uint8_t> out;

    Config.chunk_size = chunk;
    ASSERT_EQ(run(in, out, 16, &summary), lzwutil::SUCCESS);
    EXPECT_EQ(out, std::vector<uint8_t>({ 'o', 'k' }));
    EXPECT_TRUE(summary.finished);
    EXPECT_EQ(summary.trailing_bytes, 3u) << "chunk " << chunk;
  }
}

TEST_F(DecodeStreamTest, MissingEndCodeIsNotAnError)
{
  // 9-bit codes: clear, 'a', 'b' and no end code; the last byte holds
  // 5 bits of padding which are carried over as a partial code.
  LZWStreamWriter s(8, Endian::LITTLE);
  s.clear().code('a').code('b');
  std::vector<uint8_t> in = s.bytes();
  lzwutil::stream_summary summary;
  std::vector<uint8_t> out;

  ASSERT_EQ(in.size(), 4u);
  ASSERT_EQ(run(in, out, 16, &summary), lzwutil::SUCCESS);
  EXPECT_EQ(out, std::vector<uint8_t>({ 'a', 'b' }));
  EXPECT_FALSE(summary.finished);
  EXPECT_TRUE(summary.partial_code);
  EXPECT_EQ(summary.trailing_bytes, 0u);
}

TEST_F(DecodeStreamTest, UsesConfigOptions)
{
  LZWStreamWriter s(2, Endian::LITTLE);
  s.clear().code(1).code(7).end();
  std::vector<uint8_t> in = s.bytes();
  std::vector<uint8_t> out;

  Config.code_size = 2;
  Config.strict = true;
  EXPECT_EQ(run(in, out, 16, nullptr), lzwutil::BAD_CODE);

  Config.strict = false;
  ASSERT_EQ(run(in, out, 16, nullptr), lzwutil::SUCCESS);
  EXPECT_EQ(out, std::vector<uint8_t>({ 1, 1, 1 }));

  Config.code_size = 12;
  EXPECT_EQ(run(in, out, 16, nullptr), lzwutil::INVALID_CODE_SIZE);

  Config.code_size = 2;
  Config.chunk_size = 0;
  EXPECT_EQ(run(in, out, 16, nullptr), lzwutil::INVALID);
}
