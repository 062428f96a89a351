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

#ifndef HEIFSAMPLES_IMAGE_CONVERSION_H
#define HEIFSAMPLES_IMAGE_CONVERSION_H

#include <optional>
#include <string>
#include <vector>

#include "heifsamples/heif_binding.h"
#include "heifsamples/raster_image.h"

namespace heifsamples {

  // ------------------------- decoding -------------------------

  // Interleaved RGB(A) chroma for decoding an image with the given luma bit depth.
  // Images with more than 8 bits are decoded to 16-bit samples in host byte order,
  // unless 'convert_hdr_to_8bit' is set.
  heif_chroma get_decoding_chroma(bool has_alpha, int bit_depth, bool convert_hdr_to_8bit);

  // Decodes the image into an RGB(A) raster. Premultiplied alpha is undone.
  // The warnings that libheif reported while decoding are appended to 'warnings'.
  RasterImage decode_to_raster(const ImageHandle& handle, bool convert_hdr_to_8bit,
                               std::vector<std::string>& warnings);

  // Color description of the RGB output of a decoded image: the primaries and transfer
  // characteristics of the image, identity matrix, full range.
  NclxParameters get_rgb_output_nclx(const heif_color_profile_nclx& nclx);

  // TIFF data of a HEIF 'Exif' block without the orientation tag.
  // Empty if the block has no valid TIFF offset.
  std::vector<uint8_t> get_output_exif(const std::vector<uint8_t>& exif_block);

  // Fills the raster metadata with the color profiles, EXIF and XMP data of the image.
  // The EXIF orientation tag is removed since the pixels are already rotated by libheif.
  void copy_metadata_to_raster(const ImageHandle& handle, RasterMetadata& metadata);


  // ------------------------- encoding -------------------------

  // Creates an 8-bit heif image with the smallest plane layout that holds the raster:
  // monochrome (with an alpha plane when transparent), RGB, or RGBA.
  Image create_heif_image(const RasterImage& raster, bool premultiply_alpha);

  void apply_color_profile(Image& image, const RasterMetadata& metadata,
                           bool lossless, bool write_two_profiles);

  // Returns the orientation stored in the EXIF data and removes the tag from it.
  // Nothing is changed if there is no valid orientation tag.
  std::optional<heif_orientation> take_exif_orientation(std::vector<uint8_t>& exif);
}

#endif
