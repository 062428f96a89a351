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

#include "heifsamples/image_conversion.h"
#include "heifsamples/exif.h"
#include "heifsamples/pixel_conversion.h"

namespace heifsamples {

  heif_chroma get_decoding_chroma(bool has_alpha, int bit_depth, bool convert_hdr_to_8bit)
  {
    if (bit_depth == 8 || convert_hdr_to_8bit) {
      return has_alpha ? heif_chroma_interleaved_RGBA : heif_chroma_interleaved_RGB;
    }

    if (host_is_little_endian()) {
      return has_alpha ? heif_chroma_interleaved_RRGGBBAA_LE : heif_chroma_interleaved_RRGGBB_LE;
    }
    else {
      return has_alpha ? heif_chroma_interleaved_RRGGBBAA_BE : heif_chroma_interleaved_RRGGBB_BE;
    }
  }


  static bool is_8bit_chroma(heif_chroma chroma)
  {
    return chroma == heif_chroma_interleaved_RGB || chroma == heif_chroma_interleaved_RGBA;
  }


  RasterImage decode_to_raster(const ImageHandle& handle, bool convert_hdr_to_8bit,
                               std::vector<std::string>& warnings)
  {
    const bool has_alpha = handle.has_alpha_channel();
    const int luma_bits = handle.get_luma_bits_per_pixel();
    if (luma_bits < 0) {
      throw Error(heif_error_Invalid_input, heif_suberror_Unspecified, "Input image has undefined bit-depth");
    }

    heif_chroma chroma = get_decoding_chroma(has_alpha, luma_bits, convert_hdr_to_8bit);

    DecodingOptions options = alloc_decoding_options();
    options->convert_hdr_to_8bit = convert_hdr_to_8bit;

    Image image = handle.decode_image(heif_colorspace_RGB, chroma, options.get());

    for (const auto& warning : image.get_decoding_warnings()) {
      warnings.push_back(warning);
    }

    int bit_depth = 8;
    if (!is_8bit_chroma(chroma)) {
      bit_depth = image.get_bits_per_pixel_range(heif_channel_interleaved);
      if (bit_depth <= 8) {
        bit_depth = luma_bits;
      }
    }

    const Image& decoded = image;
    return convert_plane_to_raster(decoded.get_plane(heif_channel_interleaved),
                                   handle.is_premultiplied_alpha(),
                                   bit_depth);
  }


  NclxParameters get_rgb_output_nclx(const heif_color_profile_nclx& nclx)
  {
    NclxParameters parameters;
    parameters.color_primaries = static_cast<uint16_t>(nclx.color_primaries);
    parameters.transfer_characteristics = static_cast<uint16_t>(nclx.transfer_characteristics);

    // the decoded pixels are full range RGB
    parameters.matrix_coefficients = heif_matrix_coefficients_RGB_GBR;
    parameters.full_range = true;
    return parameters;
  }


  std::vector<uint8_t> get_output_exif(const std::vector<uint8_t>& exif_block)
  {
    std::vector<uint8_t> exif = strip_heif_exif_offset(exif_block);
    if (!exif.empty()) {
      remove_exif_orientation_tag(exif);
    }

    return exif;
  }


  void copy_metadata_to_raster(const ImageHandle& handle, RasterMetadata& metadata)
  {
    heif_color_profile_type profile_type = handle.get_color_profile_type();
    if (profile_type == heif_color_profile_type_prof || profile_type == heif_color_profile_type_rICC) {
      metadata.icc_profile = handle.get_raw_color_profile();
    }

    NclxProfile nclx = handle.get_nclx_color_profile();
    if (nclx) {
      metadata.nclx = get_rgb_output_nclx(*nclx);
    }

    std::vector<uint8_t> exif_block = handle.get_first_metadata_of_type("Exif");
    if (!exif_block.empty()) {
      metadata.exif = get_output_exif(exif_block);
    }

    metadata.xmp = handle.get_first_metadata_of_type("mime", "application/rdf+xml");
  }


  Image create_heif_image(const RasterImage& raster, bool premultiply_alpha)
  {
    ImageAnalysis analysis = analyze_image(raster);

    const int width = raster.get_width();
    const int height = raster.get_height();

    Image image;

    if (analysis.is_grayscale) {
      image = Image::create(width, height, heif_colorspace_monochrome, heif_chroma_monochrome);
      image.add_plane(heif_channel_Y, width, height, 8);

      if (analysis.has_transparency) {
        image.add_plane(heif_channel_Alpha, width, height, 8);

        PlaneView alpha_plane = image.get_plane(heif_channel_Alpha);
        copy_raster_to_monochrome_planes(raster, image.get_plane(heif_channel_Y), &alpha_plane, premultiply_alpha);
      }
      else {
        copy_raster_to_monochrome_planes(raster, image.get_plane(heif_channel_Y), nullptr, false);
      }
    }
    else {
      heif_chroma chroma = analysis.has_transparency ? heif_chroma_interleaved_RGBA : heif_chroma_interleaved_RGB;

      image = Image::create(width, height, heif_colorspace_RGB, chroma);
      image.add_plane(heif_channel_interleaved, width, height, 8);

      copy_raster_to_interleaved_plane(raster, image.get_plane(heif_channel_interleaved),
                                       premultiply_alpha && analysis.has_transparency);
    }

    image.set_premultiplied_alpha(premultiply_alpha && analysis.has_transparency);

    return image;
  }


  static void set_nclx(Image& image, const NclxParameters& parameters)
  {
    NclxProfile nclx = alloc_nclx_color_profile();
    nclx->color_primaries = static_cast<heif_color_primaries>(parameters.color_primaries);
    nclx->transfer_characteristics = static_cast<heif_transfer_characteristics>(parameters.transfer_characteristics);
    nclx->matrix_coefficients = static_cast<heif_matrix_coefficients>(parameters.matrix_coefficients);
    nclx->full_range_flag = parameters.full_range;

    image.set_nclx_color_profile(*nclx);
  }


  void apply_color_profile(Image& image, const RasterMetadata& metadata,
                           bool lossless, bool write_two_profiles)
  {
    // BT.709 primaries, sRGB transfer, full range
    NclxParameters srgb;
    srgb.color_primaries = heif_color_primaries_ITU_R_BT_709_5;
    srgb.transfer_characteristics = heif_transfer_characteristic_IEC_61966_2_1;
    srgb.full_range = true;

    // The identity matrix stores RGB in the YCbCr planes without conversion.
    if (lossless) {
      srgb.matrix_coefficients = heif_matrix_coefficients_RGB_GBR;
    }
    else {
      srgb.matrix_coefficients = heif_matrix_coefficients_ITU_R_BT_601_6;
    }

    const bool have_icc = !metadata.icc_profile.empty();

    if (write_two_profiles && have_icc) {
      image.set_raw_color_profile(metadata.icc_profile);
      set_nclx(image, srgb);
    }
    else if (lossless) {
      set_nclx(image, srgb);
    }
    else if (have_icc) {
      image.set_raw_color_profile(metadata.icc_profile);
    }
    else if (metadata.nclx) {
      NclxParameters parameters = *metadata.nclx;

      // RGB input files (PNG cICP) always signal the identity matrix
      if (parameters.matrix_coefficients == heif_matrix_coefficients_RGB_GBR) {
        parameters.matrix_coefficients = heif_matrix_coefficients_ITU_R_BT_601_6;
      }

      set_nclx(image, parameters);
    }
    else {
      set_nclx(image, srgb);
    }
  }


  std::optional<heif_orientation> take_exif_orientation(std::vector<uint8_t>& exif)
  {
    if (exif.empty()) {
      return std::nullopt;
    }

    int orientation = read_exif_orientation_tag(exif.data(), static_cast<uint32_t>(exif.size()));
    if (orientation < 1 || orientation > 8) {
      return std::nullopt;
    }

    // read_exif_orientation_tag() also returns 1 when there is no tag
    if (!remove_exif_orientation_tag(exif)) {
      return std::nullopt;
    }

    return static_cast<heif_orientation>(orientation);
  }
}
