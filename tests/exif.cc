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

#include "heifsamples/exif.h"
#include "test_utils.h"

using namespace heifsamples;


TEST_CASE("read orientation")
{
  for (bool little_endian : {true, false}) {
    INFO("little endian: " << little_endian);

    std::vector<uint8_t> exif = create_exif_with_orientation(little_endian, 6);
    REQUIRE(read_exif_orientation_tag(exif.data(), static_cast<uint32_t>(exif.size())) == 6);
  }
}


TEST_CASE("remove orientation")
{
  for (bool little_endian : {true, false}) {
    INFO("little endian: " << little_endian);

    std::vector<uint8_t> exif = create_exif_with_orientation(little_endian, 8);
    const size_t original_size = exif.size();

    REQUIRE(remove_exif_orientation_tag(exif));
    REQUIRE(exif.size() == original_size);
    REQUIRE(read_exif_orientation_tag(exif.data(), static_cast<uint32_t>(exif.size())) == 1);

    // the IFD now has only the ImageWidth entry
    if (little_endian) {
      REQUIRE(exif[8] == 1);
      REQUIRE(exif[10] == 0x00);
      REQUIRE(exif[11] == 0x01);
    }
    else {
      REQUIRE(exif[9] == 1);
      REQUIRE(exif[10] == 0x01);
      REQUIRE(exif[11] == 0x00);
    }

    // nothing left to remove
    REQUIRE(!remove_exif_orientation_tag(exif));
  }
}


TEST_CASE("invalid EXIF data")
{
  std::vector<uint8_t> truncated = create_exif_with_orientation(true, 3);
  truncated.resize(20);
  REQUIRE(read_exif_orientation_tag(truncated.data(), static_cast<uint32_t>(truncated.size())) == 1);
  REQUIRE(!remove_exif_orientation_tag(truncated));

  std::vector<uint8_t> no_tiff_header{'E', 'x', 'i', 'f', 0, 0, 0, 0, 0, 0};
  REQUIRE(read_exif_orientation_tag(no_tiff_header.data(), static_cast<uint32_t>(no_tiff_header.size())) == 1);

  std::vector<uint8_t> empty;
  REQUIRE(read_exif_orientation_tag(empty.data(), 0) == 1);
  REQUIRE(!remove_exif_orientation_tag(empty));
}


TEST_CASE("strip HEIF EXIF offset")
{
  std::vector<uint8_t> exif = create_exif_with_orientation(false, 1);

  SECTION("zero offset") {
    std::vector<uint8_t> block{0, 0, 0, 0};
    block.insert(block.end(), exif.begin(), exif.end());
    REQUIRE(strip_heif_exif_offset(block) == exif);
  }

  SECTION("offset over the 'Exif' prefix") {
    std::vector<uint8_t> block{0, 0, 0, 6, 'E', 'x', 'i', 'f', 0, 0};
    block.insert(block.end(), exif.begin(), exif.end());
    REQUIRE(strip_heif_exif_offset(block) == exif);
  }

  SECTION("offset outside of the block") {
    std::vector<uint8_t> block{0, 0, 1, 0, 'M', 'M'};
    REQUIRE(strip_heif_exif_offset(block).empty());
  }

  SECTION("block without data") {
    std::vector<uint8_t> block{0, 0, 0, 0};
    REQUIRE(strip_heif_exif_offset(block).empty());
  }
}
