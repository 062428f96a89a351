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

#include "heifsamples/exif.h"

#include <cstring>

#define EXIF_TYPE_SHORT 3
#define DEFAULT_EXIF_ORIENTATION 1
#define EXIF_TAG_ORIENTATION ((uint16_t)0x0112)
#define EXIF_TAG_EXIF_IFD_POINTER ((uint16_t)0x8769)
#define EXIF_IFD_ENTRY_SIZE 12

namespace heifsamples {

  // Offsets and counts of the IFD tables are treated as unsigned.

  static uint32_t read32(const uint8_t* data, uint32_t pos, bool littleEndian)
  {
    const uint8_t* p = data + pos;

    if (littleEndian) {
      return (p[3] << 24) | (p[2] << 16) | (p[1] << 8) | p[0];
    }
    else {
      return (p[0] << 24) | (p[1] << 16) | (p[2] << 8) | p[3];
    }
  }


  static uint16_t read16(const uint8_t* data, uint32_t pos, bool littleEndian)
  {
    const uint8_t* p = data + pos;

    if (littleEndian) {
      return static_cast<uint16_t>((p[1] << 8) | p[0]);
    }
    else {
      return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }
  }


  static void write16(uint8_t* data, uint32_t pos, uint16_t value, bool littleEndian)
  {
    uint8_t* p = data + pos;

    if (littleEndian) {
      p[0] = (uint8_t) (value & 0xFF);
      p[1] = (uint8_t) (value >> 8);
    }
    else {
      p[0] = (uint8_t) (value >> 8);
      p[1] = (uint8_t) (value & 0xFF);
    }
  }


  struct ExifTagPosition
  {
    uint32_t ifd_offset = 0;
    uint16_t entry_count = 0;
    uint16_t entry_index = 0;

    uint32_t entry_offset() const { return ifd_offset + 2 + entry_index * EXIF_IFD_ENTRY_SIZE; }
  };


  // Returns false if the query_tag was not found.
  static bool find_exif_tag_in_ifd(const uint8_t* exif, uint32_t size,
                                   uint32_t ifd_offset,
                                   uint16_t query_tag,
                                   bool littleEndian,
                                   int recursion_depth,
                                   ExifTagPosition* out_position)
  {
    const int MAX_IFD_TABLE_RECURSION_DEPTH = 5;

    if (recursion_depth > MAX_IFD_TABLE_RECURSION_DEPTH) {
      return false;
    }

    uint32_t offset = ifd_offset;

    // can we read at least the entry count and the pointer to the next IFD?
    if (offset == 0) {
      return false;
    }

    if (size < 6 || size - 2 - 4 < offset) {
      return false;
    }

    uint16_t cnt = read16(exif, offset, littleEndian);

    uint32_t IFD_table_size = 2U + cnt * EXIF_IFD_ENTRY_SIZE + 4U;
    if (IFD_table_size > size || size - IFD_table_size < offset) {
      return false;
    }

    for (uint16_t i = 0; i < cnt; i++) {
      uint32_t entry = offset + 2 + i * EXIF_IFD_ENTRY_SIZE;
      uint16_t tag = read16(exif, entry, littleEndian);
      if (tag == query_tag) {
        out_position->ifd_offset = offset;
        out_position->entry_count = cnt;
        out_position->entry_index = i;
        return true;
      }

      if (tag == EXIF_TAG_EXIF_IFD_POINTER) {
        uint32_t exifIFD_offset = read32(exif, entry + 8, littleEndian);
        if (find_exif_tag_in_ifd(exif, size, exifIFD_offset, query_tag, littleEndian,
                                 recursion_depth + 1, out_position)) {
          return true;
        }
      }
    }

    // continue with next IFD table

    uint32_t next_ifd_offset = read32(exif, offset + 2 + cnt * EXIF_IFD_ENTRY_SIZE, littleEndian);

    return find_exif_tag_in_ifd(exif, size, next_ifd_offset, query_tag, littleEndian,
                                recursion_depth + 1, out_position);
  }


  static bool find_exif_tag(const uint8_t* exif, uint32_t size, uint16_t query_tag,
                            bool* out_littleEndian, ExifTagPosition* out_position)
  {
    // TIFF header: byte order mark, magic number, offset of the first IFD

    if (size < 8) {
      return false;
    }

    if ((exif[0] != 'I' && exif[0] != 'M') ||
        (exif[1] != 'I' && exif[1] != 'M')) {
      return false;
    }

    bool littleEndian = (exif[0] == 'I');
    *out_littleEndian = littleEndian;

    uint32_t offset = read32(exif, 4, littleEndian);

    return find_exif_tag_in_ifd(exif, size, offset, query_tag, littleEndian, 1, out_position);
  }


  int read_exif_orientation_tag(const uint8_t* exif, uint32_t size)
  {
    bool little_endian;
    ExifTagPosition position;
    if (!find_exif_tag(exif, size, EXIF_TAG_ORIENTATION, &little_endian, &position)) {
      return DEFAULT_EXIF_ORIENTATION;
    }

    uint32_t pos = position.entry_offset();
    uint16_t type = read16(exif, pos + 2, little_endian);
    uint32_t count = read32(exif, pos + 4, little_endian);

    if (type == EXIF_TYPE_SHORT && count == 1) {
      return read16(exif, pos + 8, little_endian);
    }

    return DEFAULT_EXIF_ORIENTATION;
  }


  bool remove_exif_orientation_tag(std::vector<uint8_t>& exif)
  {
    // each iteration removes one entry, an IFD chain cannot hold more entries than this
    const int MAX_REMOVED_ENTRIES = 16;

    uint8_t* data = exif.data();
    uint32_t size = static_cast<uint32_t>(exif.size());
    bool removed = false;

    for (int n = 0; n < MAX_REMOVED_ENTRIES; n++) {
      bool little_endian;
      ExifTagPosition position;
      if (!find_exif_tag(data, size, EXIF_TAG_ORIENTATION, &little_endian, &position)) {
        break;
      }

      // Move the following entries and the next-IFD pointer over the removed entry
      // and clear the bytes that become unused at the end of the table.

      uint32_t entry = position.entry_offset();
      uint32_t table_end = position.ifd_offset + 2 + position.entry_count * EXIF_IFD_ENTRY_SIZE + 4;

      memmove(data + entry, data + entry + EXIF_IFD_ENTRY_SIZE, table_end - entry - EXIF_IFD_ENTRY_SIZE);
      memset(data + table_end - EXIF_IFD_ENTRY_SIZE, 0, EXIF_IFD_ENTRY_SIZE);

      write16(data, position.ifd_offset, static_cast<uint16_t>(position.entry_count - 1), little_endian);

      removed = true;
    }

    return removed;
  }


  std::vector<uint8_t> strip_heif_exif_offset(const std::vector<uint8_t>& exif_block)
  {
    if (exif_block.size() <= 4) {
      return {};
    }

    uint32_t skip = (exif_block[0] << 24) | (exif_block[1] << 16) | (exif_block[2] << 8) | exif_block[3];
    if (skip >= exif_block.size() - 4) {
      return {};
    }

    skip += 4;

    return std::vector<uint8_t>(exif_block.begin() + skip, exif_block.end());
  }
}
