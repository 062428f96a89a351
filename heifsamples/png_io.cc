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

#include "heifsamples/png_io.h"
#include "heifsamples/heif_binding.h"

#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>
#include <new>
#include <vector>

extern "C" {
#include <png.h>
}

namespace heifsamples {

  namespace {
    struct PngReader
    {
      png_structp png = nullptr;
      png_infop info = nullptr;

      ~PngReader() { png_destroy_read_struct(&png, info ? &info : nullptr, nullptr); }
    };

    struct PngWriter
    {
      png_structp png = nullptr;
      png_infop info = nullptr;

      ~PngWriter() { png_destroy_write_struct(&png, info ? &info : nullptr); }
    };

    using FilePtr = std::unique_ptr<FILE, decltype(&fclose)>;
  }


  static const char* XMP_KEY = "XML:com.adobe.xmp";


  static void read_png_metadata(png_structp png_ptr, png_infop info_ptr, RasterMetadata& metadata)
  {
    // --- ICC profile

    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_iCCP)) {
      png_charp name;
      int compression_type;
#if (PNG_LIBPNG_VER < 10500)
      png_charp png_profile_data;
#else
      png_bytep png_profile_data;
#endif
      png_uint_32 profile_length = 0;

      if (png_get_iCCP(png_ptr, info_ptr, &name, &compression_type, &png_profile_data, &profile_length) == PNG_INFO_iCCP &&
          profile_length > 0) {
        const uint8_t* p = reinterpret_cast<const uint8_t*>(png_profile_data);
        metadata.icc_profile.assign(p, p + profile_length);
      }
    }

#ifdef PNG_cICP_SUPPORTED
    png_byte colour_primaries, transfer_function, matrix_coefficients, video_full_range_flag;
    if (png_get_cICP(png_ptr, info_ptr, &colour_primaries, &transfer_function,
                     &matrix_coefficients, &video_full_range_flag)) {
      NclxParameters nclx;
      nclx.color_primaries = colour_primaries;
      nclx.transfer_characteristics = transfer_function;
      nclx.matrix_coefficients = matrix_coefficients;
      nclx.full_range = (video_full_range_flag != 0);
      metadata.nclx = nclx;
    }
#endif

    // --- EXIF

#ifdef PNG_eXIf_SUPPORTED
    png_bytep exifPtr = nullptr;
    png_uint_32 exifSize = 0;
    if (png_get_eXIf_1(png_ptr, info_ptr, &exifSize, &exifPtr) == PNG_INFO_eXIf) {
      metadata.exif.assign(exifPtr, exifPtr + exifSize);
    }
#endif

    // --- XMP

#ifdef PNG_iTXt_SUPPORTED
    png_textp textPtr = nullptr;
    const png_uint_32 nTextChunks = png_get_text(png_ptr, info_ptr, &textPtr, nullptr);
    for (png_uint_32 i = 0; i < nTextChunks; i++, textPtr++) {
      png_size_t textLength = textPtr->text_length;
      if ((textPtr->compression == PNG_ITXT_COMPRESSION_NONE) || (textPtr->compression == PNG_ITXT_COMPRESSION_zTXt)) {
        textLength = textPtr->itxt_length;
      }

      if (strcmp(textPtr->key, XMP_KEY) == 0 && textLength > 0) {
        const uint8_t* p = reinterpret_cast<const uint8_t*>(textPtr->text);
        metadata.xmp.assign(p, p + textLength);
      }
    }
#endif
  }


  RasterImage load_png(const std::string& filename, int output_bit_depth)
  {
    FilePtr fh(fopen(filename.c_str(), "rb"), &fclose);
    if (!fh) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Cannot open PNG file");
    }

    PngReader reader;
    reader.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!reader.png) {
      throw std::bad_alloc();
    }

    reader.info = png_create_info_struct(reader.png);
    if (!reader.info) {
      throw std::bad_alloc();
    }

    RasterImage image;
    std::vector<png_bytep> row_pointers;

    if (setjmp(png_jmpbuf(reader.png))) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Error while reading PNG file");
    }

    png_init_io(reader.png, fh.get());

    png_read_info(reader.png, reader.info);

    png_uint_32 width, height;
    int bit_depth, color_type, interlace_type;
    png_get_IHDR(reader.png, reader.info, &width, &height, &bit_depth, &color_type,
                 &interlace_type, nullptr, nullptr);

    // --- expand everything to 8 or 16 bit RGB(A)

    if (color_type == PNG_COLOR_TYPE_PALETTE) {
      png_set_palette_to_rgb(reader.png);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
      png_set_expand_gray_1_2_4_to_8(reader.png);
    }

    if (png_get_valid(reader.png, reader.info, PNG_INFO_tRNS)) {
      png_set_tRNS_to_alpha(reader.png);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
      png_set_gray_to_rgb(reader.png);
    }

    if (bit_depth == 16) {
      if (output_bit_depth == 8) {
        png_set_strip_16(reader.png);
      }
      else if (host_is_little_endian()) {
        png_set_swap(reader.png);
      }
    }

    png_set_interlace_handling(reader.png);

    png_read_update_info(reader.png, reader.info);

    int channels = png_get_channels(reader.png, reader.info);
    int sample_bits = png_get_bit_depth(reader.png, reader.info);

    if ((channels != 3 && channels != 4) || (sample_bits != 8 && sample_bits != 16)) {
      throw Error(heif_error_Unsupported_feature, heif_suberror_Unsupported_data_version,
                  "Unsupported PNG pixel format");
    }

    PixelLayout layout;
    layout.sample_bits = sample_bits;
    layout.has_alpha = (channels == 4);

    image = RasterImage(static_cast<int>(width), static_cast<int>(height), layout);

    row_pointers.resize(height);
    for (png_uint_32 y = 0; y < height; y++) {
      row_pointers[y] = image.row(static_cast<int>(y));
    }

    png_read_image(reader.png, row_pointers.data());

    // read the rest of the file to get the chunks behind the image data
    png_read_end(reader.png, reader.info);

    read_png_metadata(reader.png, reader.info, image.metadata());

    return image;
  }


  bool png_may_have_transparency(const std::string& filename)
  {
    FilePtr fh(fopen(filename.c_str(), "rb"), &fclose);
    if (!fh) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Cannot open PNG file");
    }

    PngReader reader;
    reader.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!reader.png) {
      throw std::bad_alloc();
    }

    reader.info = png_create_info_struct(reader.png);
    if (!reader.info) {
      throw std::bad_alloc();
    }

    if (setjmp(png_jmpbuf(reader.png))) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Error while reading PNG file");
    }

    png_init_io(reader.png, fh.get());
    png_read_info(reader.png, reader.info);

    int color_type = png_get_color_type(reader.png, reader.info);

    return (color_type & PNG_COLOR_MASK_ALPHA) != 0 ||
           png_get_valid(reader.png, reader.info, PNG_INFO_tRNS) != 0;
  }


  static void write_png_metadata(png_structp png_ptr, png_infop info_ptr, const RasterMetadata& metadata,
                                 std::vector<uint8_t>& xmp_buffer)
  {
    // --- write ICC profile

    if (!metadata.icc_profile.empty()) {
      char profile_name[] = "unknown";
      png_set_iCCP(png_ptr, info_ptr, profile_name, PNG_COMPRESSION_TYPE_BASE,
#if PNG_LIBPNG_VER < 10500
                   (png_charp) metadata.icc_profile.data(),
#else
                   (png_const_bytep) metadata.icc_profile.data(),
#endif
                   (png_uint_32) metadata.icc_profile.size());
    }

#ifdef PNG_cICP_SUPPORTED
    if (metadata.nclx) {
      png_set_cICP(png_ptr, info_ptr,
                   (png_byte) metadata.nclx->color_primaries,
                   (png_byte) metadata.nclx->transfer_characteristics,
                   (png_byte) metadata.nclx->matrix_coefficients,
                   (png_byte) (metadata.nclx->full_range ? 1 : 0));
    }
#endif

    // --- write EXIF metadata

#ifdef PNG_eXIf_SUPPORTED
    if (!metadata.exif.empty()) {
      png_set_eXIf_1(png_ptr, info_ptr, (png_uint_32) metadata.exif.size(),
                     const_cast<png_bytep>(metadata.exif.data()));
    }
#endif

    // --- write XMP metadata

#ifdef PNG_iTXt_SUPPORTED
    if (!metadata.xmp.empty()) {
      xmp_buffer = metadata.xmp;

      // make sure that the XMP string is always null terminated
      if (xmp_buffer.back() != 0) {
        xmp_buffer.push_back(0);
      }

      png_text xmp_text{}; // the remaining fields have to be NULL
      xmp_text.compression = PNG_ITXT_COMPRESSION_NONE;
      xmp_text.key = const_cast<char*>(XMP_KEY);
      xmp_text.text = reinterpret_cast<char*>(xmp_buffer.data());
      xmp_text.text_length = 0; // must be 0 for iTXt
      xmp_text.itxt_length = strlen(xmp_text.text);
      png_set_text(png_ptr, info_ptr, &xmp_text, 1);
    }
#endif
  }


  void save_png(const std::string& filename, const RasterImage& image, int compression_level)
  {
    PngWriter writer;
    writer.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!writer.png) {
      throw std::bad_alloc();
    }

    writer.info = png_create_info_struct(writer.png);
    if (!writer.info) {
      throw std::bad_alloc();
    }

    if (compression_level != -1) {
      png_set_compression_level(writer.png, compression_level);
    }

    FilePtr fp(fopen(filename.c_str(), "wb"), &fclose);
    if (!fp) {
      throw Error(heif_error_Encoding_error, heif_suberror_Cannot_write_output_data,
                  "Can't open " + filename + ": " + strerror(errno));
    }

    std::vector<uint8_t> xmp_buffer;
    std::vector<uint16_t> scaled_row;

    if (setjmp(png_jmpbuf(writer.png))) {
      throw Error(heif_error_Encoding_error, heif_suberror_Cannot_write_output_data,
                  "Error while writing PNG file");
    }

    png_init_io(writer.png, fp.get());

    const int width = image.get_width();
    const int height = image.get_height();
    const int sample_bits = image.get_sample_bits();

    png_set_IHDR(writer.png, writer.info, width, height, sample_bits,
                 image.has_alpha() ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    write_png_metadata(writer.png, writer.info, image.metadata(), xmp_buffer);

    png_write_info(writer.png, writer.info);

    if (sample_bits == 16 && host_is_little_endian()) {
      png_set_swap(writer.png);
    }

    // shift image data to the full 16 bit range
    const int shift = (sample_bits == 16 ? 16 - image.get_bit_depth() : 0);
    const int input_bits = image.get_bit_depth();

    if (shift > 0) {
      scaled_row.resize(static_cast<size_t>(width) * image.get_layout().channels());
    }

    for (int y = 0; y < height; y++) {
      if (shift > 0) {
        const uint16_t* src = image.row16(y);
        for (size_t i = 0; i < scaled_row.size(); i++) {
          int v = src[i];
          scaled_row[i] = static_cast<uint16_t>((v << shift) | (v >> (input_bits - shift)));
        }

        png_write_row(writer.png, reinterpret_cast<png_const_bytep>(scaled_row.data()));
      }
      else {
        png_write_row(writer.png, image.row(y));
      }
    }

    png_write_end(writer.png, nullptr);

    if (fclose(fp.release()) != 0) {
      throw Error(heif_error_Encoding_error, heif_suberror_Cannot_write_output_data,
                  "Error while writing " + filename);
    }
  }
}
