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

#include <catch2/catch.hpp>

#include "heifsamples/pixel_conversion.h"
#include "test_utils.h"

#include <stdexcept>
#include <vector>

using namespace heifsamples;


static const uint8_t PADDING = 0xEE;


// plane memory with padding bytes at the end of each row
struct TestPlane
{
  std::vector<uint8_t> memory;
  PlaneView view;

  TestPlane(int width, int height, int channels, int bits_per_sample, size_t stride)
  {
    memory.assign(stride * height, PADDING);
    view.data = memory.data();
    view.stride = stride;
    view.width = width;
    view.height = height;
    view.channels = channels;
    view.bits_per_sample = bits_per_sample;
  }

  bool padding_is_untouched() const
  {
    for (int y = 0; y < view.height; y++) {
      for (size_t i = view.row_bytes(); i < view.stride; i++) {
        if (memory[y * view.stride + i] != PADDING) {
          return false;
        }
      }
    }

    return true;
  }
};


TEST_CASE("analyze image")
{
  SECTION("gray and opaque") {
    RasterImage image = create_filled_raster(4, 3, true, 80, 80, 80, 255);
    ImageAnalysis analysis = analyze_image(image);
    REQUIRE(analysis.is_grayscale);
    REQUIRE(!analysis.has_transparency);
  }

  SECTION("one colored pixel") {
    RasterImage image = create_filled_raster(4, 3, false, 80, 80, 80);
    image.set_sample(3, 2, 1, 81);
    ImageAnalysis analysis = analyze_image(image);
    REQUIRE(!analysis.is_grayscale);
    REQUIRE(!analysis.has_transparency);
  }

  SECTION("one transparent pixel") {
    RasterImage image = create_filled_raster(4, 3, true, 10, 20, 30, 255);
    image.set_sample(0, 2, 3, 254);
    ImageAnalysis analysis = analyze_image(image);
    REQUIRE(!analysis.is_grayscale);
    REQUIRE(analysis.has_transparency);
  }

  SECTION("16-bit images are rejected") {
    PixelLayout layout;
    layout.sample_bits = 16;
    RasterImage image(2, 2, layout, 10);
    REQUIRE_THROWS_AS(analyze_image(image), std::logic_error);
  }
}


TEST_CASE("convert 8-bit RGB plane with row padding")
{
  TestPlane plane(3, 2, 3, 8, 16);
  for (int y = 0; y < 2; y++) {
    for (int i = 0; i < 9; i++) {
      plane.view.row(y)[i] = static_cast<uint8_t>(y * 10 + i);
    }
  }

  RasterImage image = convert_plane_to_raster(as_const(plane.view), false, 8);

  REQUIRE(image.get_width() == 3);
  REQUIRE(image.get_height() == 2);
  REQUIRE(image.get_sample_bits() == 8);
  REQUIRE(!image.has_alpha());
  REQUIRE(image.get_row_bytes() == 9);

  for (int y = 0; y < 2; y++) {
    for (int i = 0; i < 9; i++) {
      REQUIRE(image.row(y)[i] == y * 10 + i);
    }
  }
}


TEST_CASE("convert premultiplied RGBA plane")
{
  TestPlane plane(1, 1, 4, 8, 8);
  uint8_t* p = plane.view.row(0);
  p[0] = 100;
  p[1] = 50;
  p[2] = 0;
  p[3] = 128;

  SECTION("premultiplied") {
    RasterImage image = convert_plane_to_raster(as_const(plane.view), true, 8);
    REQUIRE(image.has_alpha());
    REQUIRE(image.get_sample(0, 0, 0) == 199);
    REQUIRE(image.get_sample(0, 0, 1) == 100);
    REQUIRE(image.get_sample(0, 0, 2) == 0);
    REQUIRE(image.get_sample(0, 0, 3) == 128);
  }

  SECTION("straight alpha") {
    RasterImage image = convert_plane_to_raster(as_const(plane.view), false, 8);
    REQUIRE(image.get_sample(0, 0, 0) == 100);
    REQUIRE(image.get_sample(0, 0, 1) == 50);
    REQUIRE(image.get_sample(0, 0, 3) == 128);
  }
}


TEST_CASE("convert 10-bit plane")
{
  TestPlane plane(2, 1, 3, 16, 16);
  uint16_t* p = reinterpret_cast<uint16_t*>(plane.view.row(0));
  const uint16_t values[6] = {0, 1, 511, 512, 1022, 1023};
  for (int i = 0; i < 6; i++) {
    p[i] = values[i];
  }

  RasterImage image = convert_plane_to_raster(as_const(plane.view), false, 10);

  REQUIRE(image.get_sample_bits() == 16);
  REQUIRE(image.get_bit_depth() == 10);
  REQUIRE(image.get_max_value() == 1023);

  // the samples are not scaled
  for (int i = 0; i < 6; i++) {
    REQUIRE(image.get_sample(i / 3, 0, i % 3) == values[i]);
  }
}


TEST_CASE("convert premultiplied 10-bit RGBA plane")
{
  // two rows of two pixels, 16 bytes of pixel data and 8 bytes padding per row
  TestPlane plane(2, 2, 4, 16, 24);
  const uint16_t values[8] = {300, 100, 1023, 1023,
                              256, 0, 512, 512};

  for (int y = 0; y < 2; y++) {
    uint16_t* p = reinterpret_cast<uint16_t*>(plane.view.row(y));
    for (int i = 0; i < 8; i++) {
      p[i] = values[i];
    }
  }

  RasterImage image = convert_plane_to_raster(as_const(plane.view), true, 10);

  REQUIRE(image.has_alpha());
  REQUIRE(image.get_bit_depth() == 10);

  for (int y = 0; y < 2; y++) {
    // alpha 1023 passes the colors through
    REQUIRE(image.get_sample(0, y, 0) == 300);
    REQUIRE(image.get_sample(0, y, 1) == 100);
    REQUIRE(image.get_sample(0, y, 2) == 1023);
    REQUIRE(image.get_sample(0, y, 3) == 1023);

    REQUIRE(image.get_sample(1, y, 0) == 512);
    REQUIRE(image.get_sample(1, y, 1) == 0);
    REQUIRE(image.get_sample(1, y, 2) == 1023);
    REQUIRE(image.get_sample(1, y, 3) == 512);
  }
}


TEST_CASE("unsupported plane layouts")
{
  SECTION("monochrome plane") {
    TestPlane plane(2, 2, 1, 8, 2);
    REQUIRE_THROWS_AS(convert_plane_to_raster(as_const(plane.view), false, 8), std::logic_error);
  }

  SECTION("8-bit image with 16-bit samples") {
    TestPlane plane(2, 2, 3, 16, 12);
    REQUIRE_THROWS_AS(convert_plane_to_raster(as_const(plane.view), false, 8), std::logic_error);
  }

  SECTION("10-bit image with 8-bit samples") {
    TestPlane plane(2, 2, 3, 8, 6);
    REQUIRE_THROWS_AS(convert_plane_to_raster(as_const(plane.view), false, 10), std::logic_error);
  }

  SECTION("bit depth out of range") {
    TestPlane plane(2, 2, 3, 8, 6);
    REQUIRE_THROWS_AS(convert_plane_to_raster(as_const(plane.view), false, 7), std::logic_error);
  }
}


TEST_CASE("copy raster to interleaved plane")
{
  RasterImage image = create_filled_raster(3, 2, true, 200, 100, 50, 128);

  SECTION("RGBA with premultiplication") {
    TestPlane plane(3, 2, 4, 8, 20);
    copy_raster_to_interleaved_plane(image, plane.view, true);

    const uint8_t* p = plane.view.row(1) + 2 * 4;
    REQUIRE(p[0] == 100);
    REQUIRE(p[1] == 50);
    REQUIRE(p[2] == 25);
    REQUIRE(p[3] == 128);
    REQUIRE(plane.padding_is_untouched());
  }

  SECTION("RGB plane drops alpha") {
    TestPlane plane(3, 2, 3, 8, 12);
    copy_raster_to_interleaved_plane(image, plane.view, false);

    const uint8_t* p = plane.view.row(0);
    REQUIRE(p[0] == 200);
    REQUIRE(p[1] == 100);
    REQUIRE(p[2] == 50);
    REQUIRE(p[3] == 200);
    REQUIRE(plane.padding_is_untouched());
  }

  SECTION("RGBA plane needs alpha in the image") {
    RasterImage rgb = create_filled_raster(3, 2, false, 1, 2, 3);
    TestPlane plane(3, 2, 4, 8, 12);
    REQUIRE_THROWS_AS(copy_raster_to_interleaved_plane(rgb, plane.view, false), std::logic_error);
  }

  SECTION("plane too small") {
    TestPlane plane(2, 2, 4, 8, 8);
    REQUIRE_THROWS_AS(copy_raster_to_interleaved_plane(image, plane.view, false), std::logic_error);
  }
}


TEST_CASE("copy raster to monochrome planes")
{
  RasterImage image = create_filled_raster(2, 2, true, 90, 90, 90, 51);

  TestPlane gray(2, 2, 1, 8, 4);
  TestPlane alpha(2, 2, 1, 8, 4);

  SECTION("with alpha") {
    copy_raster_to_monochrome_planes(image, gray.view, &alpha.view, false);
    REQUIRE(gray.view.row(1)[1] == 90);
    REQUIRE(alpha.view.row(1)[1] == 51);
  }

  SECTION("with premultiplied alpha") {
    copy_raster_to_monochrome_planes(image, gray.view, &alpha.view, true);
    REQUIRE(gray.view.row(0)[0] == 18);
    REQUIRE(alpha.view.row(0)[0] == 51);
  }

  SECTION("without alpha plane") {
    copy_raster_to_monochrome_planes(image, gray.view, nullptr, true);
    REQUIRE(gray.view.row(0)[1] == 90);
  }

  REQUIRE(gray.padding_is_untouched());
  REQUIRE(alpha.padding_is_untouched());
}


TEST_CASE("RGB raster survives the plane round trip")
{
  RasterImage image = create_filled_raster(5, 3, false, 0, 0, 0);
  for (int y = 0; y < 3; y++) {
    for (int x = 0; x < 5; x++) {
      image.set_sample(x, y, 0, static_cast<uint16_t>(x * 50));
      image.set_sample(x, y, 1, static_cast<uint16_t>(y * 80));
      image.set_sample(x, y, 2, static_cast<uint16_t>(x + y));
    }
  }

  TestPlane plane(5, 3, 3, 8, 32);
  copy_raster_to_interleaved_plane(image, plane.view, false);
  REQUIRE(plane.padding_is_untouched());

  RasterImage result = convert_plane_to_raster(as_const(plane.view), false, 8);

  for (int y = 0; y < 3; y++) {
    for (int x = 0; x < 5; x++) {
      for (int c = 0; c < 3; c++) {
        REQUIRE(result.get_sample(x, y, c) == image.get_sample(x, y, c));
      }
    }
  }
}
