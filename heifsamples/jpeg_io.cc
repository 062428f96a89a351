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

#include "heifsamples/jpeg_io.h"
#include "heifsamples/heif_binding.h"

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

extern "C" {
// Prevent duplicate definition for libjpeg-turbo v2.0
// Note: these 'undef's are only a workaround for a libjpeg-turbo-v2.0 bug and
// should be removed again later. Bug has been fixed in libjpeg-turbo-v2.0.1.
#include <jconfig.h>
#if defined(LIBJPEG_TURBO_VERSION_NUMBER) && LIBJPEG_TURBO_VERSION_NUMBER == 2000000
#undef HAVE_STDDEF_H
#undef HAVE_STDLIB_H
#endif
#include <jpeglib.h>
}

#define JPEG_EXIF_MARKER  (JPEG_APP0+1)  /* JPEG marker code for EXIF */
#define JPEG_EXIF_MARKER_LEN 6 // "Exif/0/0"
#define JPEG_XMP_MARKER  (JPEG_APP0+1)  /* JPEG marker code for XMP */
#define JPEG_XMP_MARKER_ID "http://ns.adobe.com/xap/1.0/"
#define JPEG_ICC_MARKER  (JPEG_APP0+2)  /* JPEG marker code for ICC */
#define JPEG_ICC_OVERHEAD_LEN  14        /* size of non-profile data in APP2 */

namespace heifsamples {

  namespace {
    struct JpegErrorManager
    {
      jpeg_error_mgr pub;
      jmp_buf setjmp_buffer;
      char message[JMSG_LENGTH_MAX];
    };

    using FilePtr = std::unique_ptr<FILE, decltype(&fclose)>;
  }


  static void on_jpeg_error_exit(j_common_ptr cinfo)
  {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
  }


  static bool JPEGMarkerIsIcc(jpeg_saved_marker_ptr marker)
  {
    static const char ICC_MARKER_ID[] = "ICC_PROFILE";

    return marker->marker == JPEG_ICC_MARKER &&
           marker->data_length >= JPEG_ICC_OVERHEAD_LEN &&
           memcmp(marker->data, ICC_MARKER_ID, sizeof(ICC_MARKER_ID)) == 0;
  }


  // The profile may be split over several APP2 markers, each carrying its sequence number.
  static bool ReadICCProfileFromJPEG(j_decompress_ptr cinfo, std::vector<uint8_t>& iccData)
  {
    const int MAX_SEQ_NO = 255;
    bool marker_present[MAX_SEQ_NO + 1] = {};
    unsigned int data_length[MAX_SEQ_NO + 1] = {};
    unsigned int data_offset[MAX_SEQ_NO + 1] = {};
    int num_markers = 0;

    for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr; marker = marker->next) {
      if (JPEGMarkerIsIcc(marker)) {
        if (num_markers == 0) {
          num_markers = GETJOCTET(marker->data[13]);
        }
        else if (num_markers != GETJOCTET(marker->data[13])) {
          return false; // inconsistent num_markers fields
        }

        int seq_no = GETJOCTET(marker->data[12]);
        if (seq_no <= 0 || seq_no > num_markers || marker_present[seq_no]) {
          return false;
        }

        marker_present[seq_no] = true;
        data_length[seq_no] = marker->data_length - JPEG_ICC_OVERHEAD_LEN;
      }
    }

    if (num_markers == 0) {
      return false;
    }

    unsigned int total_length = 0;
    for (int seq_no = 1; seq_no <= num_markers; seq_no++) {
      if (!marker_present[seq_no]) {
        return false; // missing sequence number
      }
      data_offset[seq_no] = total_length;
      total_length += data_length[seq_no];
    }

    if (total_length == 0) {
      return false;
    }

    iccData.resize(total_length);

    for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr; marker = marker->next) {
      if (JPEGMarkerIsIcc(marker)) {
        int seq_no = GETJOCTET(marker->data[12]);
        memcpy(iccData.data() + data_offset[seq_no], marker->data + JPEG_ICC_OVERHEAD_LEN, data_length[seq_no]);
      }
    }

    return true;
  }


  static bool JPEGMarkerIsXMP(jpeg_saved_marker_ptr marker)
  {
    return marker->marker == JPEG_XMP_MARKER &&
           marker->data_length >= strlen(JPEG_XMP_MARKER_ID) + 1 &&
           strncmp((const char*) (marker->data), JPEG_XMP_MARKER_ID, strlen(JPEG_XMP_MARKER_ID)) == 0;
  }


  static bool ReadXMPFromJPEG(j_decompress_ptr cinfo, std::vector<uint8_t>& xmpData)
  {
    for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr; marker = marker->next) {
      if (JPEGMarkerIsXMP(marker)) {
        const uint8_t* begin = marker->data + strlen(JPEG_XMP_MARKER_ID) + 1;
        const uint8_t* end = marker->data + marker->data_length;
        xmpData.assign(begin, end);
        return true;
      }
    }

    return false;
  }


  static bool JPEGMarkerIsEXIF(jpeg_saved_marker_ptr marker)
  {
    return marker->marker == JPEG_EXIF_MARKER &&
           marker->data_length >= JPEG_EXIF_MARKER_LEN &&
           GETJOCTET(marker->data[0]) == 'E' &&
           GETJOCTET(marker->data[1]) == 'x' &&
           GETJOCTET(marker->data[2]) == 'i' &&
           GETJOCTET(marker->data[3]) == 'f' &&
           GETJOCTET(marker->data[4]) == 0 &&
           GETJOCTET(marker->data[5]) == 0;
  }


  static bool ReadEXIFFromJPEG(j_decompress_ptr cinfo, std::vector<uint8_t>& exifData)
  {
    for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr; marker = marker->next) {
      if (JPEGMarkerIsEXIF(marker)) {
        exifData.assign(marker->data + JPEG_EXIF_MARKER_LEN, marker->data + marker->data_length);
        return true;
      }
    }

    return false;
  }


  RasterImage load_jpeg(const std::string& filename)
  {
    FilePtr infile(fopen(filename.c_str(), "rb"), &fclose);
    if (!infile) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Cannot open JPEG file");
    }

    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    RasterImage image;
    RasterMetadata metadata;

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = on_jpeg_error_exit;

    if (setjmp(jerr.setjmp_buffer)) {
      jpeg_destroy_decompress(&cinfo);
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified,
                  std::string("Error while reading JPEG file: ") + jerr.message);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, infile.get());

    jpeg_save_markers(&cinfo, JPEG_ICC_MARKER, 0xFFFF);
    jpeg_save_markers(&cinfo, JPEG_XMP_MARKER, 0xFFFF);
    jpeg_save_markers(&cinfo, JPEG_EXIF_MARKER, 0xFFFF);

    jpeg_read_header(&cinfo, TRUE);

    ReadICCProfileFromJPEG(&cinfo, metadata.icc_profile);
    ReadXMPFromJPEG(&cinfo, metadata.xmp);
    ReadEXIFFromJPEG(&cinfo, metadata.exif);

    if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
      jpeg_destroy_decompress(&cinfo);
      throw Error(heif_error_Unsupported_feature, heif_suberror_Unsupported_color_conversion,
                  "CMYK JPEG images are not supported");
    }

    const bool grayscale = (cinfo.jpeg_color_space == JCS_GRAYSCALE);
    cinfo.out_color_space = grayscale ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_start_decompress(&cinfo);

    image = RasterImage(static_cast<int>(cinfo.output_width), static_cast<int>(cinfo.output_height), PixelLayout{});
    image.metadata() = std::move(metadata);

    JSAMPARRAY buffer = (*cinfo.mem->alloc_sarray)
        ((j_common_ptr) &cinfo, JPOOL_IMAGE, cinfo.output_width * cinfo.output_components, 1);

    while (cinfo.output_scanline < cinfo.output_height) {
      (void) jpeg_read_scanlines(&cinfo, buffer, 1);

      uint8_t* dst = image.row(static_cast<int>(cinfo.output_scanline - 1));

      if (grayscale) {
        for (JDIMENSION x = 0; x < cinfo.output_width; x++) {
          uint8_t v = buffer[0][x];
          dst[3 * x + 0] = v;
          dst[3 * x + 1] = v;
          dst[3 * x + 2] = v;
        }
      }
      else {
        memcpy(dst, buffer[0], cinfo.output_width * 3);
      }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    return image;
  }
}
