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

#include "Bitstream.hpp"
#include "LZW.hpp"
#include "format.hpp"
#include "vio.hpp"

#include <stdint.h>
#include <exception>
#include <new>
#include <utility>
#include <vector>

constexpr unsigned LZW_decoder::MIN_ROOT_BITS;
constexpr unsigned LZW_decoder::MAX_ROOT_BITS;
constexpr unsigned LZW_decoder::MAX_CODE_SIZE;
constexpr unsigned LZW_decoder::MAX_CODES;
constexpr uint16_t LZW_decoder::NO_CODE;


/**
 * Combine a carried-over partial code with the rest of its bits.
 */
template<Endian E>
static inline uint16_t merge_partial(uint16_t saved, unsigned saved_bits,
 unsigned rest, unsigned rest_bits);

template<>
inline uint16_t merge_partial<Endian::LITTLE>(uint16_t saved, unsigned saved_bits,
 unsigned rest, unsigned)
{
  return saved | (rest << saved_bits);
}

template<>
inline uint16_t merge_partial<Endian::BIG>(uint16_t saved, unsigned,
 unsigned rest, unsigned rest_bits)
{
  return (saved << rest_bits) | rest;
}

/**
 * Copy an entry and append one byte. Entries never share storage.
 */
static std::vector<uint8_t> extend_entry(const std::vector<uint8_t> &prev, uint8_t next)
{
  std::vector<uint8_t> value;
  value.reserve(prev.size() + 1);
  value.insert(value.end(), prev.begin(), prev.end());
  value.push_back(next);
  return value;
}


lzwutil::error LZW_decoder::init(unsigned root_bits, Endian bit_order, int _flags)
{
  initialized = false;

  if(root_bits < MIN_ROOT_BITS || root_bits > MAX_ROOT_BITS)
    return lzwutil::INVALID_CODE_SIZE;

  if(_flags & ~LZW_FLAG_MASK)
    return lzwutil::INVALID;

  order = bit_order;
  flags = _flags;
  init_code_size = root_bits;
  code_size = root_bits;
  clear_code = 1 << root_bits;
  end_code = clear_code + 1;
  next_code = clear_code + 2;

  try
  {
    dict.resize(MAX_CODES);
  }
  catch(std::exception &e)
  {
    format::warning("LZW dictionary alloc failed: %s", e.what());
    return lzwutil::ALLOC_ERROR;
  }

  initialized = true;
  return reset();
}

/**
 * Free every entry and restore the root entries and initial code size.
 * This is the part of reset() that an in-stream clear code performs.
 * Throws std::bad_alloc.
 */
void LZW_decoder::clear_dictionary()
{
  for(std::vector<uint8_t> &entry : dict)
    std::vector<uint8_t>().swap(entry);

  code_size = init_code_size;
  next_code = clear_code + 2;

  unsigned root_size = 1u << code_size;
  for(unsigned i = 0; i < root_size; i++)
    dict[i].assign(1, static_cast<uint8_t>(i));
}

lzwutil::error LZW_decoder::reset()
{
  if(!initialized)
    return lzwutil::NOT_INITIALIZED;

  try
  {
    clear_dictionary();
  }
  catch(std::exception &e)
  {
    format::warning("LZW root entry alloc failed: %s", e.what());
    initialized = false;
    return lzwutil::ALLOC_ERROR;
  }

  prev_code = NO_CODE;
  partial_code = 0;
  partial_bits = 0;
  finished = false;

  stats = LZW_stats{};
  stats.max_width = get_width();
  return lzwutil::SUCCESS;
}

bool LZW_decoder::has_entry(unsigned code) const
{
  return code < dict.size() && !dict[code].empty();
}

const std::vector<uint8_t> *LZW_decoder::get_entry(unsigned code) const
{
  return has_entry(code) ? &dict[code] : nullptr;
}

/**
 * Store a new entry at next_code and widen the codes if it filled the
 * current code space. Once all 4096 codes are used nothing more is added
 * until the stream sends a clear code.
 */
void LZW_decoder::add_entry(std::vector<uint8_t> &&value)
{
  if(next_code >= MAX_CODES)
    return;

  dict[next_code] = std::move(value);
  next_code++;
  stats.entries_added++;

  /* Must happen exactly when next_code reaches the boundary or the
   * decoder falls out of step with the encoder. */
  if(next_code == (1u << (code_size + 1)) && code_size + 1 < MAX_CODE_SIZE)
  {
    code_size++;
    stats.max_width = MAX(stats.max_width, get_width());
    format::trace("LZW: code width increased to %u at code %u", get_width(), next_code);
  }
}

/**
 * Handle a single complete code.
 */
lzwutil::error LZW_decoder::decode_code(uint16_t code, std::vector<uint8_t> &out)
{
  stats.codes_read++;

  if(has_entry(code))
  {
    const std::vector<uint8_t> &value = dict[code];
    out.insert(out.end(), value.begin(), value.end());
    stats.bytes_out += value.size();

    if(has_entry(prev_code) && next_code < MAX_CODES)
      add_entry(extend_entry(dict[prev_code], value[0]));
  }
  else

  if(code == clear_code)
  {
    format::trace("LZW: clear code (next code was %u)", next_code);
    clear_dictionary();
    stats.clears++;

    /* The clear code has no entry, so the next code won't add one. */
    prev_code = clear_code;
    return lzwutil::SUCCESS;
  }
  else

  if(code == end_code)
  {
    format::trace("LZW: end of information after %zu codes", stats.codes_read);
    finished = true;
    return lzwutil::SUCCESS;
  }
  else
  {
    /* This is a special case--the code is the one about to be defined,
     * which can only be the previous string plus its own first character.
     * Anything past next_code can't be derived at all. */
    if(code > next_code)
    {
      format::trace("LZW: code %u is past the next code %u", code, next_code);
      if(flags & LZW_FLAG_STRICT)
        return lzwutil::BAD_CODE;
    }

    if(has_entry(prev_code))
    {
      const std::vector<uint8_t> &prev = dict[prev_code];
      std::vector<uint8_t> value = extend_entry(prev, prev[0]);

      out.insert(out.end(), value.begin(), value.end());
      stats.bytes_out += value.size();
      add_entry(std::move(value));
    }
    else
    {
      format::trace("LZW: skipping code %u: no previous entry to build it from", code);
      if(flags & LZW_FLAG_STRICT)
        return lzwutil::BAD_CODE;

      stats.codes_skipped++;
    }
  }

  prev_code = code;
  return lzwutil::SUCCESS;
}

template<Endian E>
lzwutil::error LZW_decoder::decode_codes(Bitstream<E> &bs, std::vector<uint8_t> &out)
{
  int width = get_width();
  int actual;
  unsigned code;

  if(partial_bits)
  {
    /* Finish the code that was split at the end of the previous input. */
    unsigned rest = bs.read(width - partial_bits, &actual);
    if(actual == 0)
      return lzwutil::SUCCESS;

    partial_code = merge_partial<E>(partial_code, partial_bits, rest, actual);
    partial_bits += actual;
    if(static_cast<int>(partial_bits) < width)
      return lzwutil::SUCCESS;

    code = partial_code;
    actual = width;
    partial_code = 0;
    partial_bits = 0;
  }
  else
    code = bs.read(width, &actual);

  while(true)
  {
    if(actual < width)
    {
      /* Out of input mid-code (or exactly between codes if actual is 0). */
      partial_code = code;
      partial_bits = actual;
      return lzwutil::SUCCESS;
    }

    lzwutil::error ret = decode_code(code, out);
    if(ret != lzwutil::SUCCESS || finished)
      return ret;

    width = get_width();
    code = bs.read(width, &actual);
  }
}

template<Endian E>
lzwutil::error LZW_decoder::decode_stream(vio &src, std::vector<uint8_t> &out)
{
  Bitstream<E> bs(src);
  lzwutil::error ret = decode_codes<E>(bs, out);

  stats.bytes_in += bs.num_read;
  return ret;
}

lzwutil::error LZW_decoder::decode(vio &src, std::vector<uint8_t> &out)
{
  if(!initialized)
    return lzwutil::NOT_INITIALIZED;

  if(finished)
    return lzwutil::SUCCESS;

  try
  {
    if(order == Endian::BIG)
      return decode_stream<Endian::BIG>(src, out);

    return decode_stream<Endian::LITTLE>(src, out);
  }
  catch(std::exception &e)
  {
    /* The stream position is lost; the decoder must be init()ed again. */
    format::warning("LZW decode alloc failed: %s", e.what());
    initialized = false;
    return lzwutil::ALLOC_ERROR;
  }
}
