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

#include "heifsamples/premultiplied_alpha.h"

#include <cstdlib>

using namespace heifsamples;


TEST_CASE("premultiply 8-bit color")
{
  REQUIRE(premultiply_color(200, 0) == 0);
  REQUIRE(premultiply_color(200, 255) == 200);
  REQUIRE(premultiply_color(200, 128) == 100);
  REQUIRE(premultiply_color(255, 128) == 128);
  REQUIRE(premultiply_color(0, 77) == 0);
}


TEST_CASE("unpremultiply 8-bit color")
{
  REQUIRE(unpremultiply_color(uint8_t(100), uint8_t(0)) == 0);
  REQUIRE(unpremultiply_color(uint8_t(100), uint8_t(255)) == 100);
  REQUIRE(unpremultiply_color(uint8_t(100), uint8_t(128)) == 199);

  // color values larger than alpha are invalid and saturate
  REQUIRE(unpremultiply_color(uint8_t(200), uint8_t(100)) == 255);
}


TEST_CASE("unpremultiply high bit depth color")
{
  const uint16_t max_10bit = 1023;

  REQUIRE(unpremultiply_color(uint16_t(300), uint16_t(0), max_10bit) == 0);
  REQUIRE(unpremultiply_color(uint16_t(300), max_10bit, max_10bit) == 300);
  REQUIRE(unpremultiply_color(uint16_t(512), uint16_t(512), max_10bit) == 1023);
  REQUIRE(unpremultiply_color(uint16_t(256), uint16_t(512), max_10bit) == 512);
  REQUIRE(unpremultiply_color(uint16_t(1000), uint16_t(10), max_10bit) == 1023);
}


TEST_CASE("premultiply and unpremultiply are close to inverse")
{
  for (int alpha = 64; alpha <= 255; alpha += 17) {
    for (int color = 0; color <= 255; color += 15) {
      uint8_t p = premultiply_color(uint8_t(color), uint8_t(alpha));
      uint8_t u = unpremultiply_color(p, uint8_t(alpha));

      INFO("color=" << color << " alpha=" << alpha);
      REQUIRE(std::abs(int(u) - color) <= 2);
    }
  }
}


TEST_CASE("premultiplied colors survive unpremultiplication")
{
  for (int alpha = 1; alpha <= 255; alpha++) {
    for (int color = 0; color <= alpha; color++) {
      uint8_t u = unpremultiply_color(uint8_t(color), uint8_t(alpha));
      uint8_t p = premultiply_color(u, uint8_t(alpha));

      INFO("color=" << color << " alpha=" << alpha);
      REQUIRE(std::abs(int(p) - color) <= 1);
    }
  }
}
