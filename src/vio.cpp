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

#include "vio.hpp"

#include <string.h>
#include <sys/stat.h>

/* Only read-only files get a cached length. */
static bool is_read_only(const char *mode)
{
  return mode[0] == 'r' && !strchr(mode, '+');
}

vio_file::vio_file(const char *filename, const char *mode)
{
  f = fopen(filename, mode);
  if(!f)
    throw "failed to open file";

  owned = true;
  saved_length = -1;
  if(is_read_only(mode))
  {
    setvbuf(f, NULL, _IOFBF, 8192);
    saved_length = length();
  }
}

vio_file::vio_file(FILE *fp) noexcept
{
  f = fp;
  owned = false;
  saved_length = -1;
}

vio_file::~vio_file() noexcept
{
  if(owned)
    fclose(f);
  else
    fflush(f);
}

size_t vio_file::read(void *dest, size_t num) noexcept
{
  size_t n = fread(dest, 1, num, f);
  if(n < num)
  {
    eof_value = feof(f);
    err_value = ferror(f);
  }
  return n;
}

size_t vio_file::write(const void *src, size_t num) noexcept
{
  size_t n = fwrite(src, 1, num, f);
  if(n < num)
  {
    eof_value = feof(f);
    err_value = ferror(f);
  }
  return n;
}

int64_t vio_file::tell() noexcept
{
  return ftell(f);
}

int64_t vio_file::length() noexcept
{
  /* Read-only--the length should not change. */
  if(saved_length >= 0)
    return saved_length;

  struct stat st;
  int fd = fileno(f);

  if(fd >= 0 && fstat(fd, &st) == 0 && S_ISREG(st.st_mode))
    return st.st_size;

  /* Pipes and terminals have no length. */
  return -1;
}


vio_buffer::vio_buffer(void *dest, size_t dest_len) noexcept
{
  src_buffer = reinterpret_cast<const uint8_t *>(dest);
  dest_buffer = reinterpret_cast<uint8_t *>(dest);
  pos = 0;
  len = dest_len;
}

vio_buffer::vio_buffer(const void *src, size_t src_len) noexcept
{
  src_buffer = reinterpret_cast<const uint8_t *>(src);
  dest_buffer = nullptr;
  pos = 0;
  len = src_len;
}

size_t vio_buffer::read(void *dest, size_t num) noexcept
{
  if(num > len - pos)
  {
    num = len - pos;
    eof_value = 1;
  }

  if(num)
    memcpy(dest, src_buffer + pos, num);

  pos += num;
  return num;
}

size_t vio_buffer::write(const void *src, size_t num) noexcept
{
  if(!dest_buffer)
  {
    err_value = 1;
    return 0;
  }
  if(num > len - pos)
  {
    num = len - pos;
    eof_value = 1;
  }

  if(num)
    memcpy(dest_buffer + pos, src, num);

  pos += num;
  return num;
}

int64_t vio_buffer::tell() noexcept
{
  return static_cast<int64_t>(pos);
}

int64_t vio_buffer::length() noexcept
{
  return static_cast<int64_t>(len);
}
