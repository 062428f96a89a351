/*
  heifsamples: sample applications for libheif.

  MIT License

  Copyright (c) 2024 heifsamples authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#ifndef HEIFSAMPLES_PREMULTIPLIED_ALPHA_H
#define HEIFSAMPLES_PREMULTIPLIED_ALPHA_H

#include <cstdint>

namespace heifsamples {

  // Alpha 0 gives 0, alpha 255 returns the color unchanged.
  uint8_t premultiply_color(uint8_t color, uint8_t alpha);

  uint8_t unpremultiply_color(uint8_t color, uint8_t alpha);

  // max_value is the largest sample value of the image bit depth, i.e. (1 << bit_depth) - 1.
  uint16_t unpremultiply_color(uint16_t color, uint16_t alpha, uint16_t max_value);
}

#endif
