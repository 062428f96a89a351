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

#ifndef HEIFSAMPLES_EXAMPLES_COMMON_H
#define HEIFSAMPLES_EXAMPLES_COMMON_H

#include <libheif/heif.h>

#include <string>

namespace heif_examples {

  // Initializes libheif for the lifetime of the object and frees all its resources at the end.
  class LibHeifInitializer
  {
  public:
    LibHeifInitializer() { heif_init(nullptr); }

    ~LibHeifInitializer() { heif_deinit(); }
  };


  void show_version(const char* tool_name);

  // Prints a message to stderr and returns false if the file does not start with a HEIF 'ftyp' box.
  bool check_for_valid_input_HEIF_file(const std::string& input_filename);
}

#endif
