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

#include "common.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <vector>

namespace heif_examples {

  void show_version(const char* tool_name)
  {
    std::cout << tool_name << " v" << HEIFSAMPLES_VERSION
              << " libheif v" << heif_get_version() << '\n';
  }


  bool check_for_valid_input_HEIF_file(const std::string& input_filename)
  {
    std::ifstream istr(input_filename, std::ios_base::binary);
    if (!istr) {
      std::cerr << "Input file does not exist.\n";
      return false;
    }

    // the 'ftyp' box has to be within the first bytes
    std::vector<uint8_t> header(512);
    istr.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(istr.gcount()));

    switch (heif_check_filetype(header.data(), static_cast<int>(header.size()))) {
      case heif_filetype_no:
        std::cerr << "Input file is not an HEIF/AVIF file\n";
        return false;
      case heif_filetype_yes_unsupported:
        std::cerr << "Input file is an unsupported HEIF/AVIF file type\n";
        return false;
      default:
        return true;
    }
  }
}
