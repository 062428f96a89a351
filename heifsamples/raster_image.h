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

#ifndef HEIFSAMPLES_RASTER_IMAGE_H
#define HEIFSAMPLES_RASTER_IMAGE_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace heifsamples {

  constexpr bool host_is_little_endian() { return std::endian::native == std::endian::little; }


  struct NclxParameters
  {
    uint16_t color_primaries = 1;
    uint16_t transfer_characteristics = 13;
    uint16_t matrix_coefficients = 6;
    bool full_range = true;
  };


  struct RasterMetadata
  {
    std::vector<uint8_t> icc_profile;
    std::optional<NclxParameters> nclx;

    // TIFF structure, starting with the byte order mark ("II" / "MM").
    std::vector<uint8_t> exif;

    std::vector<uint8_t> xmp;
  };


  // The sample layout of a RasterImage. 8 and 16 bit samples, RGB or RGBA.
  struct PixelLayout
  {
    int sample_bits = 8;
    bool has_alpha = false;

    int channels() const { return has_alpha ? 4 : 3; }

    int bytes_per_pixel() const { return channels() * (sample_bits / 8); }

    bool operator==(const PixelLayout& other) const
    {
      return sample_bits == other.sample_bits && has_alpha == other.has_alpha;
    }
  };


  // A tightly packed RGB(A) image as it is exchanged with the raster file readers and writers.
  // 16 bit samples are stored in host byte order. The bit depth gives the range of the
  // sample values (e.g. 10 for values 0..1023 in 16 bit samples).
  class RasterImage
  {
  public:
    RasterImage() = default;

    RasterImage(int width, int height, PixelLayout layout, int bit_depth = 0);

    int get_width() const { return m_width; }

    int get_height() const { return m_height; }

    const PixelLayout& get_layout() const { return m_layout; }

    bool has_alpha() const { return m_layout.has_alpha; }

    int get_sample_bits() const { return m_layout.sample_bits; }

    int get_bit_depth() const { return m_bit_depth; }

    int get_max_value() const { return (1 << m_bit_depth) - 1; }

    size_t get_row_bytes() const { return static_cast<size_t>(m_width) * m_layout.bytes_per_pixel(); }

    bool empty() const { return m_pixels.empty(); }

    uint8_t* row(int y) { return m_pixels.data() + y * get_row_bytes(); }

    const uint8_t* row(int y) const { return m_pixels.data() + y * get_row_bytes(); }

    uint16_t* row16(int y) { return reinterpret_cast<uint16_t*>(row(y)); }

    const uint16_t* row16(int y) const { return reinterpret_cast<const uint16_t*>(row(y)); }

    // Sample value of channel c (0=R, 1=G, 2=B, 3=A) at (x,y), independent of the sample size.
    uint16_t get_sample(int x, int y, int c) const;

    void set_sample(int x, int y, int c, uint16_t value);

    RasterMetadata& metadata() { return m_metadata; }

    const RasterMetadata& metadata() const { return m_metadata; }

  private:
    int m_width = 0;
    int m_height = 0;
    PixelLayout m_layout;
    int m_bit_depth = 8;
    std::vector<uint8_t> m_pixels;
    RasterMetadata m_metadata;
  };
}

#endif
