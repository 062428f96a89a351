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

#ifndef HEIFSAMPLES_PNG_IO_H
#define HEIFSAMPLES_PNG_IO_H

#include <string>

#include "heifsamples/raster_image.h"

namespace heifsamples {

  // Loads a PNG file as RGB or RGBA. Palette and grayscale images are expanded to RGB,
  // tRNS chunks to an alpha channel. With an output bit depth of 8, 16-bit files are reduced to 8 bits.
  // Throws heifsamples::Error when the file cannot be read.
  RasterImage load_png(const std::string& filename, int output_bit_depth);

  // Whether the PNG file has an alpha channel or a tRNS chunk.
  bool png_may_have_transparency(const std::string& filename);

  // Writes an 8 or 16 bit PNG with the ICC profile, EXIF and XMP metadata of the image.
  // 16-bit images with a bit depth below 16 are scaled to the full 16-bit range.
  void save_png(const std::string& filename, const RasterImage& image, int compression_level = -1);
}

#endif
