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

#include "heifsamples/raster_image.h"

#include <stdexcept>

namespace heifsamples {

  RasterImage::RasterImage(int width, int height, PixelLayout layout, int bit_depth)
      : m_width(width), m_height(height), m_layout(layout)
  {
    if (width < 0 || height < 0) {
      throw std::invalid_argument("negative image size");
    }

    if (layout.sample_bits != 8 && layout.sample_bits != 16) {
      throw std::logic_error("raster images only support 8 or 16 bit samples");
    }

    if (bit_depth == 0) {
      bit_depth = layout.sample_bits;
    }

    if (bit_depth > layout.sample_bits || (layout.sample_bits == 16 && bit_depth <= 8) ||
        (layout.sample_bits == 8 && bit_depth != 8)) {
      throw std::logic_error("bit depth does not match the sample size");
    }

    m_bit_depth = bit_depth;
    m_pixels.resize(get_row_bytes() * height);
  }


  uint16_t RasterImage::get_sample(int x, int y, int c) const
  {
    int idx = x * m_layout.channels() + c;
    if (m_layout.sample_bits == 8) {
      return row(y)[idx];
    }
    else {
      return row16(y)[idx];
    }
  }


  void RasterImage::set_sample(int x, int y, int c, uint16_t value)
  {
    int idx = x * m_layout.channels() + c;
    if (m_layout.sample_bits == 8) {
      row(y)[idx] = static_cast<uint8_t>(value);
    }
    else {
      row16(y)[idx] = value;
    }
  }
}
