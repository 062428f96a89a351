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

#ifndef HEIFSAMPLES_PIXEL_CONVERSION_H
#define HEIFSAMPLES_PIXEL_CONVERSION_H

#include "heifsamples/plane_view.h"
#include "heifsamples/raster_image.h"

namespace heifsamples {

  struct ImageAnalysis
  {
    bool is_grayscale = true;
    bool has_transparency = false;
  };


  // Scans an 8-bit raster image for colored pixels (R, G and B not all equal) and,
  // when it has an alpha channel, for pixels that are not fully opaque.
  // Throws std::logic_error for 16-bit images.
  ImageAnalysis analyze_image(const RasterImage& image);


  // Copies an interleaved RGB or RGBA plane into a new raster image.
  // A bit depth of 8 requires 8-bit samples, larger bit depths (up to 16) require 16-bit samples.
  // When 'premultiplied_alpha' is set, the color channels of RGBA planes are un-premultiplied.
  // Throws std::logic_error for any other plane layout.
  RasterImage convert_plane_to_raster(const ConstPlaneView& plane, bool premultiplied_alpha, int bit_depth);


  // Writes an 8-bit raster image into an interleaved 8-bit RGB or RGBA plane.
  // An RGB plane takes the color channels of RGBA images and ignores their alpha.
  void copy_raster_to_interleaved_plane(const RasterImage& image, const PlaneView& plane,
                                        bool premultiply_alpha);

  // Writes the red channel of an 8-bit raster image into a monochrome plane and, if 'alpha_plane'
  // is not null, the alpha channel into the alpha plane.
  void copy_raster_to_monochrome_planes(const RasterImage& image, const PlaneView& gray_plane,
                                        const PlaneView* alpha_plane, bool premultiply_alpha);
}

#endif
