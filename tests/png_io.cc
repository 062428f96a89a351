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

#include "heifsamples/heif_binding.h"
#include "heifsamples/png_io.h"
#include "heifsamples/raster_io.h"
#include "test_utils.h"

#include <string>

using namespace heifsamples;


TEST_CASE("PNG with alpha and metadata")
{
  std::string filename = get_tests_output_file_path("rgba_metadata.png");

  RasterImage image = create_filled_raster(5, 4, true, 10, 20, 30, 40);
  image.set_sample(4, 3, 0, 250);

  const std::string xmp_text = "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"></x:xmpmeta>";
  image.metadata().xmp.assign(xmp_text.begin(), xmp_text.end());
  image.metadata().exif = create_exif_with_orientation(true, 1);

  save_png(filename, image);

  REQUIRE(png_may_have_transparency(filename));

  RasterImage loaded = load_png(filename, 8);
  REQUIRE(loaded.get_width() == 5);
  REQUIRE(loaded.get_height() == 4);
  REQUIRE(loaded.has_alpha());
  REQUIRE(loaded.get_sample_bits() == 8);
  REQUIRE(loaded.get_sample(0, 0, 1) == 20);
  REQUIRE(loaded.get_sample(0, 0, 3) == 40);
  REQUIRE(loaded.get_sample(4, 3, 0) == 250);

  REQUIRE(loaded.metadata().xmp == image.metadata().xmp);
  REQUIRE(loaded.metadata().exif == image.metadata().exif);
}


TEST_CASE("PNG without alpha")
{
  std::string filename = get_tests_output_file_path("rgb.png");

  RasterImage image = create_filled_raster(3, 3, false, 1, 2, 3);
  save_png(filename, image, 9);

  REQUIRE(!png_may_have_transparency(filename));

  RasterImage loaded = load_png(filename, 8);
  REQUIRE(!loaded.has_alpha());
  REQUIRE(loaded.get_sample(2, 2, 2) == 3);
  REQUIRE(loaded.metadata().xmp.empty());
  REQUIRE(loaded.metadata().exif.empty());
}


TEST_CASE("10-bit image is written as 16-bit PNG")
{
  std::string filename = get_tests_output_file_path("rgb_10bit.png");

  PixelLayout layout;
  layout.sample_bits = 16;

  RasterImage image(2, 1, layout, 10);
  image.set_sample(0, 0, 0, 1023);
  image.set_sample(0, 0, 1, 512);
  image.set_sample(0, 0, 2, 0);
  image.set_sample(1, 0, 0, 1);
  image.set_sample(1, 0, 1, 1);
  image.set_sample(1, 0, 2, 1);

  save_png(filename, image);

  RasterImage loaded = load_png(filename, 16);
  REQUIRE(loaded.get_sample_bits() == 16);
  REQUIRE(loaded.get_sample(0, 0, 0) == 65535);
  REQUIRE(loaded.get_sample(0, 0, 1) == 32800);
  REQUIRE(loaded.get_sample(0, 0, 2) == 0);
  REQUIRE(loaded.get_sample(1, 0, 0) == 64);

  RasterImage loaded8 = load_png(filename, 8);
  REQUIRE(loaded8.get_sample_bits() == 8);
  REQUIRE(loaded8.get_sample(0, 0, 0) == 255);
}


TEST_CASE("load raster image by file suffix")
{
  std::string filename = get_tests_output_file_path("upper_case_suffix.PNG");
  save_png(filename, create_filled_raster(2, 2, false, 7, 7, 7));

  RasterImage loaded = load_raster_image(filename);
  REQUIRE(loaded.get_sample(1, 1, 0) == 7);
  REQUIRE(!image_may_have_transparency(filename));

  REQUIRE(!image_may_have_transparency("photo.jpeg"));
  REQUIRE(image_may_have_transparency("image.bmp"));

  REQUIRE_THROWS_AS(load_raster_image("image.bmp"), heifsamples::Error);
  REQUIRE_THROWS_AS(load_raster_image("no_suffix"), heifsamples::Error);

  try {
    load_raster_image("image.tga");
    FAIL("no exception for unsupported file type");
  }
  catch (const heifsamples::Error& err) {
    REQUIRE(err.get_code() == heif_error_Invalid_input);
    REQUIRE(err.get_subcode() == heif_suberror_Unspecified);
    REQUIRE(err.get_message() == "Unsupported input file format: image.tga");
  }
}


TEST_CASE("missing PNG file")
{
  std::string filename = get_tests_output_file_path("does_not_exist.png");

  REQUIRE_THROWS_AS(load_png(filename, 8), heifsamples::Error);
  REQUIRE_THROWS_AS(png_may_have_transparency(filename), heifsamples::Error);
}
