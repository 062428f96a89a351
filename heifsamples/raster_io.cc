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

#include "heifsamples/raster_io.h"
#include "heifsamples/heif_binding.h"
#include "heifsamples/png_io.h"

#if HAVE_LIBJPEG
#include "heifsamples/jpeg_io.h"
#endif

#include <algorithm>
#include <cctype>

namespace heifsamples {

  enum class RasterFileType
  {
    unknown,
    png,
    jpeg
  };


  static RasterFileType get_file_type(const std::string& filename)
  {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos) {
      return RasterFileType::unknown;
    }

    std::string suffix = filename.substr(dot_pos + 1);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (suffix == "png") {
      return RasterFileType::png;
    }
    else if (suffix == "jpg" || suffix == "jpeg") {
      return RasterFileType::jpeg;
    }

    return RasterFileType::unknown;
  }


  RasterImage load_raster_image(const std::string& filename)
  {
    switch (get_file_type(filename)) {
      case RasterFileType::png:
        return load_png(filename, 8);

      case RasterFileType::jpeg:
#if HAVE_LIBJPEG
        return load_jpeg(filename);
#else
        throw Error(heif_error_Unsupported_feature, heif_suberror_Unspecified,
                    "JPEG support has not been compiled in.");
#endif

      default:
        throw Error(heif_error_Invalid_input, heif_suberror_Unspecified,
                    "Unsupported input file format: " + filename);
    }
  }


  bool image_may_have_transparency(const std::string& filename)
  {
    switch (get_file_type(filename)) {
      case RasterFileType::png:
        return png_may_have_transparency(filename);
      case RasterFileType::jpeg:
        return false;
      default:
        return true;
    }
  }
}
