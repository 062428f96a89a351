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

#include "heifsamples/pixel_conversion.h"
#include "heifsamples/premultiplied_alpha.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace heifsamples {

  ImageAnalysis analyze_image(const RasterImage& image)
  {
    if (image.get_sample_bits() != 8) {
      throw std::logic_error("encoding from a 16-bit image is not supported");
    }

    ImageAnalysis analysis;

    const bool has_alpha = image.has_alpha();
    const int channels = image.get_layout().channels();

    for (int y = 0; y < image.get_height(); y++) {
      const uint8_t* p = image.row(y);

      for (int x = 0; x < image.get_width(); x++, p += channels) {
        if (p[0] != p[1] || p[1] != p[2]) {
          analysis.is_grayscale = false;
        }

        if (has_alpha && p[3] < 255) {
          analysis.has_transparency = true;
        }
      }

      // neither flag can change back
      if (!analysis.is_grayscale && (analysis.has_transparency || !has_alpha)) {
        break;
      }
    }

    return analysis;
  }


  static void check_interleaved_layout(const ConstPlaneView& plane, int bit_depth)
  {
    if (plane.channels != 3 && plane.channels != 4) {
      throw std::logic_error("unsupported plane layout: " + std::to_string(plane.channels) + " channels");
    }

    if (bit_depth == 8) {
      if (plane.bits_per_sample != 8) {
        throw std::logic_error("unsupported plane layout: 8-bit image with " +
                               std::to_string(plane.bits_per_sample) + "-bit samples");
      }
    }
    else if (bit_depth > 8 && bit_depth <= 16) {
      if (plane.bits_per_sample != 16) {
        throw std::logic_error("unsupported plane layout: " + std::to_string(bit_depth) + "-bit image with " +
                               std::to_string(plane.bits_per_sample) + "-bit samples");
      }
    }
    else {
      throw std::logic_error("unsupported bit depth: " + std::to_string(bit_depth));
    }

    if (plane.stride < plane.row_bytes()) {
      throw std::logic_error("plane stride is smaller than a row of pixels");
    }
  }


  RasterImage convert_plane_to_raster(const ConstPlaneView& plane, bool premultiplied_alpha, int bit_depth)
  {
    check_interleaved_layout(plane, bit_depth);

    PixelLayout layout;
    layout.sample_bits = (bit_depth == 8 ? 8 : 16);
    layout.has_alpha = (plane.channels == 4);

    RasterImage image(plane.width, plane.height, layout, bit_depth);

    const bool unpremultiply = layout.has_alpha && premultiplied_alpha;
    const int width = plane.width;

    if (layout.sample_bits == 8) {
      for (int y = 0; y < plane.height; y++) {
        const uint8_t* src = plane.row(y);
        uint8_t* dst = image.row(y);

        if (!unpremultiply) {
          memcpy(dst, src, image.get_row_bytes());
          continue;
        }

        for (int x = 0; x < width; x++) {
          uint8_t a = src[3];

          dst[0] = unpremultiply_color(src[0], a);
          dst[1] = unpremultiply_color(src[1], a);
          dst[2] = unpremultiply_color(src[2], a);
          dst[3] = a;

          src += 4;
          dst += 4;
        }
      }
    }
    else {
      const uint16_t max_value = static_cast<uint16_t>((1 << bit_depth) - 1);

      for (int y = 0; y < plane.height; y++) {
        const uint16_t* src = reinterpret_cast<const uint16_t*>(plane.row(y));
        uint16_t* dst = image.row16(y);

        if (!unpremultiply) {
          memcpy(dst, src, image.get_row_bytes());
          continue;
        }

        for (int x = 0; x < width; x++) {
          uint16_t a = src[3];

          dst[0] = unpremultiply_color(src[0], a, max_value);
          dst[1] = unpremultiply_color(src[1], a, max_value);
          dst[2] = unpremultiply_color(src[2], a, max_value);
          dst[3] = a;

          src += 4;
          dst += 4;
        }
      }
    }

    return image;
  }


  static void check_target_plane(const RasterImage& image, const PlaneView& plane, int channels)
  {
    if (image.get_sample_bits() != 8) {
      throw std::logic_error("encoding from a 16-bit image is not supported");
    }

    if (plane.channels != channels || plane.bits_per_sample != 8) {
      throw std::logic_error("unsupported plane layout: " + std::to_string(plane.channels) + " channels with " +
                             std::to_string(plane.bits_per_sample) + "-bit samples");
    }

    if (plane.width < image.get_width() || plane.height < image.get_height()) {
      throw std::logic_error("plane is smaller than the image");
    }

    if (plane.stride < plane.row_bytes()) {
      throw std::logic_error("plane stride is smaller than a row of pixels");
    }
  }


  void copy_raster_to_interleaved_plane(const RasterImage& image, const PlaneView& plane,
                                        bool premultiply_alpha)
  {
    if (plane.channels == 4 && !image.has_alpha()) {
      throw std::logic_error("cannot write an RGBA plane from an image without alpha");
    }

    check_target_plane(image, plane, plane.channels == 4 ? 4 : 3);

    const int src_channels = image.get_layout().channels();
    const int dst_channels = plane.channels;

    for (int y = 0; y < image.get_height(); y++) {
      const uint8_t* src = image.row(y);
      uint8_t* dst = plane.row(y);

      if (src_channels == dst_channels && !premultiply_alpha) {
        memcpy(dst, src, image.get_row_bytes());
        continue;
      }

      for (int x = 0; x < image.get_width(); x++) {
        if (dst_channels == 4) {
          uint8_t a = src[3];

          if (premultiply_alpha) {
            dst[0] = premultiply_color(src[0], a);
            dst[1] = premultiply_color(src[1], a);
            dst[2] = premultiply_color(src[2], a);
          }
          else {
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
          }

          dst[3] = a;
        }
        else {
          dst[0] = src[0];
          dst[1] = src[1];
          dst[2] = src[2];
        }

        src += src_channels;
        dst += dst_channels;
      }
    }
  }


  void copy_raster_to_monochrome_planes(const RasterImage& image, const PlaneView& gray_plane,
                                        const PlaneView* alpha_plane, bool premultiply_alpha)
  {
    check_target_plane(image, gray_plane, 1);

    if (alpha_plane) {
      if (!image.has_alpha()) {
        throw std::logic_error("cannot write an alpha plane from an image without alpha");
      }

      check_target_plane(image, *alpha_plane, 1);
    }

    const int src_channels = image.get_layout().channels();
    const bool premultiply = premultiply_alpha && alpha_plane != nullptr;

    for (int y = 0; y < image.get_height(); y++) {
      const uint8_t* src = image.row(y);
      uint8_t* gray = gray_plane.row(y);
      uint8_t* alpha = alpha_plane ? alpha_plane->row(y) : nullptr;

      for (int x = 0; x < image.get_width(); x++) {
        if (alpha) {
          uint8_t a = src[3];
          gray[x] = premultiply ? premultiply_color(src[0], a) : src[0];
          alpha[x] = a;
        }
        else {
          gray[x] = src[0];
        }

        src += src_channels;
      }
    }
  }
}
