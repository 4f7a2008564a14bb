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
 * Streaming LZW decoder for GIF and TIFF style code streams.
 *
 * Codes start at (root bits + 1) wide and grow up to 12 bits. The root
 * code size is agreed with the encoder out-of-band (GIF stores it right
 * before the image data). Input can be supplied in chunks of any size; a
 * code split across two chunks is carried over to the next decode() call.
 */

#ifndef LZWUTIL_LZW_HPP
#define LZWUTIL_LZW_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "common.hpp"
#include "error.hpp"

class vio;

template<Endian E>
struct Bitstream;

/* Return BAD_CODE for codes that can't be derived from the dictionary
 * instead of skipping them. */
#define LZW_FLAG_STRICT   (1<<0)
#define LZW_FLAG_MASK     (LZW_FLAG_STRICT)

struct LZW_stats
{
  size_t codes_read = 0;
  size_t clears = 0;
  size_t entries_added = 0;
  size_t codes_skipped = 0;
  size_t bytes_in = 0;
  size_t bytes_out = 0;
  unsigned max_width = 0;
};

class LZW_decoder
{
public:
  static constexpr unsigned MIN_ROOT_BITS = 2;
  static constexpr unsigned MAX_ROOT_BITS = 11;
  static constexpr unsigned MAX_CODE_SIZE = 12;
  static constexpr unsigned MAX_CODES = 1 << MAX_CODE_SIZE;
  static constexpr uint16_t NO_CODE = 0xffff;

private:
  /* One independently owned buffer per code; an empty buffer is no entry. */
  std::vector<std::vector<uint8_t>> dict;

  Endian order = Endian::LITTLE;
  int flags = 0;
  bool initialized = false;
  bool finished = false;

  unsigned init_code_size = 0;
  unsigned code_size = 0;
  uint16_t clear_code = 0;
  uint16_t end_code = 0;
  uint16_t next_code = 0;
  uint16_t prev_code = NO_CODE;

  /* Carry-over of a code split across decode() calls. */
  uint16_t partial_code = 0;
  unsigned partial_bits = 0;

  LZW_stats stats{};

public:
  LZW_decoder() {}
  LZW_decoder(const LZW_decoder &) = delete;
  LZW_decoder &operator=(const LZW_decoder &) = delete;

  /**
   * Set up the decoder for a new stream.
   *
   * @param root_bits   root code size (2-11). Codes start root_bits + 1 wide.
   * @param bit_order   packing order of the code stream.
   * @param _flags      LZW_FLAG_* options.
   *
   * @return            SUCCESS, INVALID_CODE_SIZE, INVALID (unknown flags),
   *                    or ALLOC_ERROR.
   */
  lzwutil::error init(unsigned root_bits, Endian bit_order = Endian::LITTLE, int _flags = 0);

  /**
   * Restore the root dictionary and forget all stream state (carry-over,
   * previous code, end-of-information) so a new stream can be decoded.
   */
  lzwutil::error reset();

  /**
   * Decode as much of `src` as possible and append the output to `out`.
   * Returns SUCCESS both when the end-of-information code was read (see
   * is_finished()) and when `src` ran out; in the latter case call again
   * with more input.
   */
  lzwutil::error decode(vio &src, std::vector<uint8_t> &out);

  bool is_finished() const { return finished; }
  bool has_partial_code() const { return partial_bits > 0; }
  unsigned get_root_bits() const { return init_code_size; }
  unsigned get_code_size() const { return code_size; }
  unsigned get_width() const { return code_size + 1; }
  uint16_t get_clear_code() const { return clear_code; }
  uint16_t get_end_code() const { return end_code; }
  uint16_t get_next_code() const { return next_code; }
  uint16_t get_prev_code() const { return prev_code; }
  Endian get_order() const { return order; }
  const LZW_stats &get_stats() const { return stats; }

  /* nullptr if `code` currently has no dictionary entry. */
  const std::vector<uint8_t> *get_entry(unsigned code) const;

private:
  void clear_dictionary();
  bool has_entry(unsigned code) const;
  void add_entry(std::vector<uint8_t> &&value);
  lzwutil::error decode_code(uint16_t code, std::vector<uint8_t> &out);

  template<Endian E>
  lzwutil::error decode_codes(Bitstream<E> &bs, std::vector<uint8_t> &out);

  template<Endian E>
  lzwutil::error decode_stream(vio &src, std::vector<uint8_t> &out);
};

#endif /* LZWUTIL_LZW_HPP */
