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

#include "heifsamples/premultiplied_alpha.h"

#include <algorithm>
#include <cmath>

namespace heifsamples {

  static float premultiply_color(float color, float alpha, float max_value)
  {
    return color * alpha / max_value;
  }


  static float unpremultiply_color(float color, float alpha, float max_value)
  {
    return std::min(color * max_value / alpha, max_value);
  }


  uint8_t premultiply_color(uint8_t color, uint8_t alpha)
  {
    if (alpha == 0) {
      return 0;
    }
    else if (alpha == 255) {
      return color;
    }

    constexpr float max_value = 255.0f;

    const float value = premultiply_color(static_cast<float>(color), static_cast<float>(alpha), max_value);

    return static_cast<uint8_t>(std::min(std::round(value), max_value));
  }


  uint8_t unpremultiply_color(uint8_t color, uint8_t alpha)
  {
    if (alpha == 0) {
      return 0;
    }
    else if (alpha == 255) {
      return color;
    }

    constexpr float max_value = 255.0f;

    const float value = unpremultiply_color(static_cast<float>(color), static_cast<float>(alpha), max_value);

    return static_cast<uint8_t>(std::min(std::round(value), max_value));
  }


  uint16_t unpremultiply_color(uint16_t color, uint16_t alpha, uint16_t max_value)
  {
    if (alpha == 0) {
      return 0;
    }
    else if (alpha == max_value) {
      return color;
    }

    const float max_value_float = static_cast<float>(max_value);

    const float value = unpremultiply_color(static_cast<float>(color), static_cast<float>(alpha), max_value_float);

    return static_cast<uint16_t>(std::min(std::round(value), max_value_float));
  }
}
