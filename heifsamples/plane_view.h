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

#ifndef HEIFSAMPLES_PLANE_VIEW_H
#define HEIFSAMPLES_PLANE_VIEW_H

#include <cstddef>
#include <cstdint>

namespace heifsamples {

  // A non-owning view on one pixel plane of a heifsamples::Image.
  //
  // Samples are 8 or 16 bit (16-bit in host byte order) with 1, 3 or 4 interleaved
  // channels in the order R,G,B[,A]. Row y starts at data + y * stride. The bytes between
  // the end of the pixel data of a row and the next row are padding.
  //
  // The view borrows the plane memory from the image it was obtained from. It is only
  // valid as long as that image object exists and must not be stored beyond that.
  template <typename T>
  struct BasicPlaneView
  {
    T* data = nullptr;
    size_t stride = 0;
    int width = 0;
    int height = 0;
    int bits_per_sample = 8;
    int channels = 1;

    T* row(int y) const { return data + y * stride; }

    int bytes_per_pixel() const { return channels * (bits_per_sample > 8 ? 2 : 1); }

    size_t row_bytes() const { return static_cast<size_t>(width) * bytes_per_pixel(); }
  };

  using PlaneView = BasicPlaneView<uint8_t>;

  using ConstPlaneView = BasicPlaneView<const uint8_t>;

  inline ConstPlaneView as_const(const PlaneView& plane)
  {
    ConstPlaneView view;
    view.data = plane.data;
    view.stride = plane.stride;
    view.width = plane.width;
    view.height = plane.height;
    view.bits_per_sample = plane.bits_per_sample;
    view.channels = plane.channels;
    return view;
  }
}

#endif
