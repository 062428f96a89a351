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

#ifndef HEIFSAMPLES_EXIF_H
#define HEIFSAMPLES_EXIF_H

#include <cstdint>
#include <vector>

namespace heifsamples {

  // All functions work on the TIFF structure of EXIF data (starting with "II" or "MM").

  // Returns 1 (normal orientation) if there is no orientation tag.
  int read_exif_orientation_tag(const uint8_t* exif, uint32_t size);

  // Removes every orientation entry from the IFD tables. The size of the data does not change.
  // Returns whether an entry was removed.
  bool remove_exif_orientation_tag(std::vector<uint8_t>& exif);

  // HEIF 'Exif' items start with a 32-bit offset to the TIFF header. Returns the data after that
  // offset, or an empty vector if the offset points outside of the block.
  std::vector<uint8_t> strip_heif_exif_offset(const std::vector<uint8_t>& exif_block);
}

#endif
