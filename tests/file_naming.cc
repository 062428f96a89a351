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

#include "heifsamples/file_naming.h"

using namespace heifsamples;


TEST_CASE("add suffix to filename")
{
  REQUIRE(add_suffix_to_filename("image.png", "-depth") == "image-depth.png");
  REQUIRE(add_suffix_to_filename("out/image.png", "-thumb-1") == "out/image-thumb-1.png");
  REQUIRE(add_suffix_to_filename("photo.v2.png", "-0") == "photo.v2-0.png");
  REQUIRE(add_suffix_to_filename("output", "-1") == "output-1");
}


TEST_CASE("sanitize filename")
{
  REQUIRE(sanitize_filename("urn:mpeg:hevc:2015:auxid:1") == "urn_mpeg_hevc_2015_auxid_1");
  REQUIRE(sanitize_filename("a/b\\c") == "a_b_c");
  REQUIRE(sanitize_filename("<x>|\"?*") == "_x_____");
  REQUIRE(sanitize_filename(std::string("tab\there")) == "tab_here");
  REQUIRE(sanitize_filename("urn-com-apple-photo-2020-aux-hdrgainmap") == "urn-com-apple-photo-2020-aux-hdrgainmap");
}
