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

#include "test_utils.h"

#include <cstdlib>

fs::path get_tests_output_dir()
{
  if (const char* env_p = std::getenv("HEIFSAMPLES_TEST_OUTPUT_DIR")) {
    return fs::path(env_p);
  }

  static const fs::path output_dir = fs::current_path() / "heifsamples_test_output";

  if (!fs::exists(output_dir)) {
    fs::create_directories(output_dir);
  }

  return output_dir;
}


std::string get_tests_output_file_path(const char* filename)
{
  fs::path dir = get_tests_output_dir();
  dir /= filename;
  return dir.string();
}


heifsamples::RasterImage create_filled_raster(int width, int height, bool has_alpha,
                                              uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
  heifsamples::PixelLayout layout;
  layout.has_alpha = has_alpha;

  heifsamples::RasterImage image(width, height, layout);

  for (int y = 0; y < height; y++) {
    for (int x = 0; x < width; x++) {
      image.set_sample(x, y, 0, r);
      image.set_sample(x, y, 1, g);
      image.set_sample(x, y, 2, b);
      if (has_alpha) {
        image.set_sample(x, y, 3, a);
      }
    }
  }

  return image;
}


static void append16(std::vector<uint8_t>& data, uint16_t v, bool little_endian)
{
  if (little_endian) {
    data.push_back(static_cast<uint8_t>(v & 0xFF));
    data.push_back(static_cast<uint8_t>(v >> 8));
  }
  else {
    data.push_back(static_cast<uint8_t>(v >> 8));
    data.push_back(static_cast<uint8_t>(v & 0xFF));
  }
}


static void append32(std::vector<uint8_t>& data, uint32_t v, bool little_endian)
{
  if (little_endian) {
    append16(data, static_cast<uint16_t>(v & 0xFFFF), true);
    append16(data, static_cast<uint16_t>(v >> 16), true);
  }
  else {
    append16(data, static_cast<uint16_t>(v >> 16), false);
    append16(data, static_cast<uint16_t>(v & 0xFFFF), false);
  }
}


std::vector<uint8_t> create_exif_with_orientation(bool little_endian, uint16_t orientation)
{
  std::vector<uint8_t> exif;

  // TIFF header
  exif.push_back(little_endian ? 'I' : 'M');
  exif.push_back(little_endian ? 'I' : 'M');
  append16(exif, 42, little_endian);
  append32(exif, 8, little_endian);

  // IFD0 with two entries
  append16(exif, 2, little_endian);

  // ImageWidth, SHORT, 1 value
  append16(exif, 0x0100, little_endian);
  append16(exif, 3, little_endian);
  append32(exif, 1, little_endian);
  append16(exif, 640, little_endian);
  append16(exif, 0, little_endian);

  // Orientation, SHORT, 1 value
  append16(exif, 0x0112, little_endian);
  append16(exif, 3, little_endian);
  append32(exif, 1, little_endian);
  append16(exif, orientation, little_endian);
  append16(exif, 0, little_endian);

  // no next IFD
  append32(exif, 0, little_endian);

  return exif;
}
