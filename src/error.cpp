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

#include "error.hpp"

namespace lzwutil
{
const char *strerror(lzwutil::error err)
{
  switch(err)
  {
    case SUCCESS:           return "no error";
    case ALLOC_ERROR:       return "alloc error";
    case READ_ERROR:        return "read error";
    case WRITE_ERROR:       return "write error";
    case INVALID:           return "invalid argument";

    /* Decoder */
    case INVALID_CODE_SIZE: return "root code size must be 2 to 11 bits";
    case BAD_CODE:          return "code not derivable from dictionary (corrupt stream)";
    case NOT_INITIALIZED:   return "decoder used before init";
  }
  return "unknown error";
}
} /* namespace lzwutil */
