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

#ifndef LZWUTIL_VIO_HPP
#define LZWUTIL_VIO_HPP

#include <stdio.h>
#include <stdint.h>

/**
 * Sequential byte source/sink. The decoder only ever calls read();
 * decode_stream() also uses write(), tell() and length().
 */
class vio
{
protected:
  int eof_value = 0;
  int err_value = 0;

public:
  virtual ~vio() noexcept {}

  virtual size_t read(void *dest, size_t num) noexcept = 0;
  virtual size_t write(const void *src, size_t num) noexcept = 0;
  virtual int64_t tell() noexcept = 0;
  virtual int64_t length() noexcept = 0;

  inline int eof() const noexcept
  {
    return eof_value;
  }

  inline int error() noexcept
  {
    int v = err_value;
    err_value = 0;
    return v;
  }
};


class vio_file : public vio
{
  FILE *f;
  int64_t saved_length;
  bool owned;

public:
  vio_file(const char *filename, const char *mode);
  /* Wrap an already open stream (stdin/stdout); it is not closed. */
  explicit vio_file(FILE *fp) noexcept;
  ~vio_file() noexcept;

  vio_file(const vio_file &) = delete;
  vio_file &operator=(const vio_file &) = delete;

  size_t read(void *dest, size_t num) noexcept override;
  size_t write(const void *src, size_t num) noexcept override;
  int64_t tell() noexcept override;
  int64_t length() noexcept override;
};

class vio_buffer : public vio
{
  const uint8_t *src_buffer;
  uint8_t *dest_buffer;
  size_t pos;
  size_t len;

public:
  vio_buffer(void *d, size_t d_len) noexcept;
  vio_buffer(const void *s, size_t s_len) noexcept;
  ~vio_buffer() noexcept {}

  size_t read(void *dest, size_t num) noexcept override;
  size_t write(const void *src, size_t num) noexcept override;
  int64_t tell() noexcept override;
  int64_t length() noexcept override;
};

#endif /* LZWUTIL_VIO_HPP */
