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

#include "heifsamples/heif_binding.h"

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
#include <libheif/heif_properties.h>
#endif

#include <cstring>
#include <new>

namespace heifsamples {

  Error::Error(const heif_error& err)
      : std::runtime_error(err.message ? err.message : ""),
        m_code(err.code), m_subcode(err.subcode)
  {
  }


  Error::Error(heif_error_code code, heif_suberror_code subcode, const std::string& message)
      : std::runtime_error(message), m_code(code), m_subcode(subcode)
  {
  }


  void Error::throw_if_error(const heif_error& err)
  {
    if (err.code == heif_error_Ok) {
      return;
    }

    if (err.code == heif_error_Memory_allocation_error && err.subcode == heif_suberror_Unspecified) {
      throw std::bad_alloc();
    }

    throw Error(err);
  }


  EncodingOptions alloc_encoding_options()
  {
    EncodingOptions options(heif_encoding_options_alloc());
    if (!options) {
      throw std::bad_alloc();
    }
    return options;
  }


  DecodingOptions alloc_decoding_options()
  {
    DecodingOptions options(heif_decoding_options_alloc());
    if (!options) {
      throw std::bad_alloc();
    }
    return options;
  }


  NclxProfile alloc_nclx_color_profile()
  {
    NclxProfile nclx(heif_nclx_color_profile_alloc());
    if (!nclx) {
      throw std::bad_alloc();
    }
    return nclx;
  }


  // ------------------------- Image -------------------------

  static int get_number_of_interleaved_channels(heif_chroma chroma, heif_channel channel)
  {
    if (channel != heif_channel_interleaved) {
      return 1;
    }

    switch (chroma) {
      case heif_chroma_interleaved_RGB:
      case heif_chroma_interleaved_RRGGBB_BE:
      case heif_chroma_interleaved_RRGGBB_LE:
        return 3;
      case heif_chroma_interleaved_RGBA:
      case heif_chroma_interleaved_RRGGBBAA_BE:
      case heif_chroma_interleaved_RRGGBBAA_LE:
        return 4;
      default:
        return 1;
    }
  }


  template <typename T>
  static void describe_plane(const heif_image* image, heif_channel channel, BasicPlaneView<T>& plane)
  {
    plane.width = heif_image_get_width(image, channel);
    plane.height = heif_image_get_height(image, channel);
    plane.channels = get_number_of_interleaved_channels(heif_image_get_chroma_format(image), channel);
    plane.bits_per_sample = heif_image_get_bits_per_pixel(image, channel) / plane.channels;
  }


  Image::Image(heif_image* image)
  {
    m_image = std::shared_ptr<heif_image>(image,
                                          [](heif_image* img) { heif_image_release(img); });
  }


  Image Image::create(int width, int height,
                      heif_colorspace colorspace,
                      heif_chroma chroma)
  {
    heif_image* image = nullptr;
    Error::throw_if_error(heif_image_create(width, height, colorspace, chroma, &image));
    return Image(image);
  }


  void Image::add_plane(heif_channel channel, int width, int height, int bit_depth)
  {
    Error::throw_if_error(heif_image_add_plane(m_image.get(), channel, width, height, bit_depth));
  }


  heif_colorspace Image::get_colorspace() const
  {
    return heif_image_get_colorspace(m_image.get());
  }


  heif_chroma Image::get_chroma_format() const
  {
    return heif_image_get_chroma_format(m_image.get());
  }


  int Image::get_bits_per_pixel(heif_channel channel) const
  {
    return heif_image_get_bits_per_pixel(m_image.get(), channel);
  }


  int Image::get_bits_per_pixel_range(heif_channel channel) const
  {
    return heif_image_get_bits_per_pixel_range(m_image.get(), channel);
  }


  bool Image::has_channel(heif_channel channel) const
  {
    return heif_image_has_channel(m_image.get(), channel) != 0;
  }


  PlaneView Image::get_plane(heif_channel channel)
  {
    PlaneView plane;

#if LIBHEIF_HAVE_VERSION(1, 20, 0)
    size_t stride = 0;
    plane.data = heif_image_get_plane2(m_image.get(), channel, &stride);
#else
    int stride = 0;
    plane.data = heif_image_get_plane(m_image.get(), channel, &stride);
#endif

    if (plane.data == nullptr) {
      throw Error(heif_error_Usage_error, heif_suberror_Nonexisting_image_channel_referenced,
                  "Image has no plane for the requested channel");
    }

    plane.stride = static_cast<size_t>(stride);
    describe_plane(m_image.get(), channel, plane);
    return plane;
  }


  ConstPlaneView Image::get_plane(heif_channel channel) const
  {
    ConstPlaneView plane;

#if LIBHEIF_HAVE_VERSION(1, 20, 0)
    size_t stride = 0;
    plane.data = heif_image_get_plane_readonly2(m_image.get(), channel, &stride);
#else
    int stride = 0;
    plane.data = heif_image_get_plane_readonly(m_image.get(), channel, &stride);
#endif

    if (plane.data == nullptr) {
      throw Error(heif_error_Usage_error, heif_suberror_Nonexisting_image_channel_referenced,
                  "Image has no plane for the requested channel");
    }

    plane.stride = static_cast<size_t>(stride);
    describe_plane(m_image.get(), channel, plane);
    return plane;
  }


  void Image::set_premultiplied_alpha(bool premultiplied)
  {
    heif_image_set_premultiplied_alpha(m_image.get(), premultiplied);
  }


  bool Image::is_premultiplied_alpha() const
  {
    return heif_image_is_premultiplied_alpha(m_image.get()) != 0;
  }


  void Image::set_raw_color_profile(const std::vector<uint8_t>& icc_profile)
  {
    Error::throw_if_error(heif_image_set_raw_color_profile(m_image.get(), "prof",
                                                           icc_profile.data(), icc_profile.size()));
  }


  void Image::set_nclx_color_profile(const heif_color_profile_nclx& nclx)
  {
    Error::throw_if_error(heif_image_set_nclx_color_profile(m_image.get(), &nclx));
  }


  std::vector<std::string> Image::get_decoding_warnings() const
  {
    std::vector<std::string> warnings;

    for (int i = 0;; i++) {
      heif_error warning;
      int n = heif_image_get_decoding_warnings(m_image.get(), i, &warning, 1);
      if (n == 0) {
        break;
      }

      warnings.emplace_back(warning.message ? warning.message : "");
    }

    return warnings;
  }


  void Image::get_pixel_aspect_ratio(uint32_t* aspect_h, uint32_t* aspect_v) const
  {
    heif_image_get_pixel_aspect_ratio(m_image.get(), aspect_h, aspect_v);
  }


  std::optional<heif_content_light_level> Image::get_content_light_level() const
  {
    if (!heif_image_has_content_light_level(m_image.get())) {
      return std::nullopt;
    }

    heif_content_light_level clli{};
    heif_image_get_content_light_level(m_image.get(), &clli);
    return clli;
  }


  std::optional<heif_decoded_mastering_display_colour_volume> Image::get_mastering_display_colour_volume() const
  {
    if (!heif_image_has_mastering_display_colour_volume(m_image.get())) {
      return std::nullopt;
    }

    heif_mastering_display_colour_volume mdcv{};
    heif_image_get_mastering_display_colour_volume(m_image.get(), &mdcv);

    heif_decoded_mastering_display_colour_volume decoded{};
    Error::throw_if_error(heif_mastering_display_colour_volume_decode(&mdcv, &decoded));
    return decoded;
  }


  // ------------------------- ImageHandle -------------------------

  ImageHandle::ImageHandle(heif_image_handle* handle)
  {
    m_image_handle = std::shared_ptr<heif_image_handle>(handle,
                                                        [](heif_image_handle* h) { heif_image_handle_release(h); });
  }


  heif_item_id ImageHandle::get_item_id() const
  {
    return heif_image_handle_get_item_id(m_image_handle.get());
  }


  bool ImageHandle::is_primary_image() const
  {
    return heif_image_handle_is_primary_image(m_image_handle.get()) != 0;
  }


  int ImageHandle::get_width() const
  {
    return heif_image_handle_get_width(m_image_handle.get());
  }


  int ImageHandle::get_height() const
  {
    return heif_image_handle_get_height(m_image_handle.get());
  }


  bool ImageHandle::has_alpha_channel() const
  {
    return heif_image_handle_has_alpha_channel(m_image_handle.get()) != 0;
  }


  bool ImageHandle::is_premultiplied_alpha() const
  {
    return heif_image_handle_is_premultiplied_alpha(m_image_handle.get()) != 0;
  }


  int ImageHandle::get_luma_bits_per_pixel() const
  {
    return heif_image_handle_get_luma_bits_per_pixel(m_image_handle.get());
  }


  bool ImageHandle::has_depth_image() const
  {
    return heif_image_handle_has_depth_image(m_image_handle.get()) != 0;
  }


  std::vector<heif_item_id> ImageHandle::get_list_of_depth_image_IDs() const
  {
    int num = heif_image_handle_get_number_of_depth_images(m_image_handle.get());
    std::vector<heif_item_id> IDs(num);
    num = heif_image_handle_get_list_of_depth_image_IDs(m_image_handle.get(), IDs.data(), num);
    IDs.resize(num);
    return IDs;
  }


  ImageHandle ImageHandle::get_depth_image_handle(heif_item_id depth_image_id) const
  {
    heif_image_handle* depth_handle = nullptr;
    Error::throw_if_error(heif_image_handle_get_depth_image_handle(m_image_handle.get(), depth_image_id, &depth_handle));
    return ImageHandle(depth_handle);
  }


  std::optional<DepthRepresentationInfo> ImageHandle::get_depth_representation_info(heif_item_id depth_image_id) const
  {
    const heif_depth_representation_info* info = nullptr;
    if (!heif_image_handle_get_depth_image_representation_info(m_image_handle.get(), depth_image_id, &info) ||
        info == nullptr) {
      return std::nullopt;
    }

    DepthRepresentationInfo result;
    if (info->has_z_near) {
      result.z_near = info->z_near;
    }
    if (info->has_z_far) {
      result.z_far = info->z_far;
    }
    if (info->has_d_min) {
      result.d_min = info->d_min;
    }
    if (info->has_d_max) {
      result.d_max = info->d_max;
    }
    result.type = info->depth_representation_type;
    result.disparity_reference_view = info->disparity_reference_view;

    heif_depth_representation_info_free(info);

    return result;
  }


  std::vector<heif_item_id> ImageHandle::get_list_of_thumbnail_IDs() const
  {
    int num = heif_image_handle_get_number_of_thumbnails(m_image_handle.get());
    std::vector<heif_item_id> IDs(num);
    num = heif_image_handle_get_list_of_thumbnail_IDs(m_image_handle.get(), IDs.data(), num);
    IDs.resize(num);
    return IDs;
  }


  ImageHandle ImageHandle::get_thumbnail(heif_item_id thumbnail_id) const
  {
    heif_image_handle* thumbnail_handle = nullptr;
    Error::throw_if_error(heif_image_handle_get_thumbnail(m_image_handle.get(), thumbnail_id, &thumbnail_handle));
    return ImageHandle(thumbnail_handle);
  }


  std::vector<heif_item_id> ImageHandle::get_list_of_auxiliary_image_IDs(int aux_filter) const
  {
    int num = heif_image_handle_get_number_of_auxiliary_images(m_image_handle.get(), aux_filter);
    std::vector<heif_item_id> IDs(num);
    num = heif_image_handle_get_list_of_auxiliary_image_IDs(m_image_handle.get(), aux_filter, IDs.data(), num);
    IDs.resize(num);
    return IDs;
  }


  ImageHandle ImageHandle::get_auxiliary_image_handle(heif_item_id auxiliary_id) const
  {
    heif_image_handle* aux_handle = nullptr;
    Error::throw_if_error(heif_image_handle_get_auxiliary_image_handle(m_image_handle.get(), auxiliary_id, &aux_handle));
    return ImageHandle(aux_handle);
  }


  std::string ImageHandle::get_auxiliary_type() const
  {
    const char* aux_type = nullptr;
    Error::throw_if_error(heif_image_handle_get_auxiliary_type(m_image_handle.get(), &aux_type));

    std::string type = aux_type ? aux_type : "";
    heif_image_handle_release_auxiliary_type(m_image_handle.get(), &aux_type);
    return type;
  }


  std::vector<heif_item_id> ImageHandle::get_list_of_metadata_block_IDs(const char* type_filter) const
  {
    int num = heif_image_handle_get_number_of_metadata_blocks(m_image_handle.get(), type_filter);
    std::vector<heif_item_id> IDs(num);
    num = heif_image_handle_get_list_of_metadata_block_IDs(m_image_handle.get(), type_filter, IDs.data(), num);
    IDs.resize(num);
    return IDs;
  }


  MetadataBlockInfo ImageHandle::get_metadata_block_info(heif_item_id metadata_id) const
  {
    MetadataBlockInfo info;
    info.id = metadata_id;

    const char* item_type = heif_image_handle_get_metadata_type(m_image_handle.get(), metadata_id);
    const char* content_type = heif_image_handle_get_metadata_content_type(m_image_handle.get(), metadata_id);
    info.item_type = item_type ? item_type : "";
    info.content_type = content_type ? content_type : "";
    info.size = heif_image_handle_get_metadata_size(m_image_handle.get(), metadata_id);
    return info;
  }


  std::vector<uint8_t> ImageHandle::get_metadata(heif_item_id metadata_id) const
  {
    std::vector<uint8_t> data(heif_image_handle_get_metadata_size(m_image_handle.get(), metadata_id));
    if (!data.empty()) {
      Error::throw_if_error(heif_image_handle_get_metadata(m_image_handle.get(), metadata_id, data.data()));
    }
    return data;
  }


  std::vector<uint8_t> ImageHandle::get_first_metadata_of_type(const char* item_type, const char* content_type) const
  {
    for (heif_item_id id : get_list_of_metadata_block_IDs(item_type)) {
      if (content_type != nullptr) {
        const char* type = heif_image_handle_get_metadata_content_type(m_image_handle.get(), id);
        if (type == nullptr || strcmp(type, content_type) != 0) {
          continue;
        }
      }

      return get_metadata(id);
    }

    return {};
  }


  heif_color_profile_type ImageHandle::get_color_profile_type() const
  {
    return heif_image_handle_get_color_profile_type(m_image_handle.get());
  }


  std::vector<uint8_t> ImageHandle::get_raw_color_profile() const
  {
    std::vector<uint8_t> profile(heif_image_handle_get_raw_color_profile_size(m_image_handle.get()));
    if (!profile.empty()) {
      Error::throw_if_error(heif_image_handle_get_raw_color_profile(m_image_handle.get(), profile.data()));
    }
    return profile;
  }


  NclxProfile ImageHandle::get_nclx_color_profile() const
  {
    heif_color_profile_nclx* nclx = nullptr;
    heif_error err = heif_image_handle_get_nclx_color_profile(m_image_handle.get(), &nclx);
    if (err.code != heif_error_Ok) {
      return NclxProfile();
    }
    return NclxProfile(nclx);
  }


  Image ImageHandle::decode_image(heif_colorspace colorspace, heif_chroma chroma,
                                  const heif_decoding_options* options) const
  {
    heif_image* image = nullptr;
    Error::throw_if_error(heif_decode_image(m_image_handle.get(), &image, colorspace, chroma, options));
    return Image(image);
  }


  // ------------------------- encoders -------------------------

  std::vector<EncoderDescriptor> EncoderDescriptor::get_encoder_descriptors(heif_compression_format format_filter,
                                                                            const char* name_filter)
  {
    const int MAX_ENCODERS = 20;
    const heif_encoder_descriptor* descriptors[MAX_ENCODERS];
    int n = heif_get_encoder_descriptors(format_filter, name_filter, descriptors, MAX_ENCODERS);

    std::vector<EncoderDescriptor> result;
    for (int i = 0; i < n; i++) {
      result.push_back(EncoderDescriptor(descriptors[i]));
    }
    return result;
  }


  std::string EncoderDescriptor::get_name() const
  {
    return heif_encoder_descriptor_get_name(m_descriptor);
  }


  std::string EncoderDescriptor::get_id_name() const
  {
    const char* id = heif_encoder_descriptor_get_id_name(m_descriptor);
    return id ? id : "";
  }


  heif_compression_format EncoderDescriptor::get_compression_format() const
  {
    return heif_encoder_descriptor_get_compression_format(m_descriptor);
  }


  bool EncoderDescriptor::supports_lossless_compression() const
  {
    return heif_encoder_descriptor_supports_lossless_compression(m_descriptor) != 0;
  }


  Encoder::Encoder(heif_encoder* encoder)
  {
    m_encoder = std::shared_ptr<heif_encoder>(encoder,
                                              [](heif_encoder* e) { heif_encoder_release(e); });
  }


  std::string Encoder::get_name() const
  {
    return heif_encoder_get_name(m_encoder.get());
  }


  void Encoder::set_lossy_quality(int quality)
  {
    Error::throw_if_error(heif_encoder_set_lossy_quality(m_encoder.get(), quality));
  }


  void Encoder::set_lossless(bool enable_lossless)
  {
    Error::throw_if_error(heif_encoder_set_lossless(m_encoder.get(), enable_lossless));
  }


  void Encoder::set_logging_level(int level)
  {
    Error::throw_if_error(heif_encoder_set_logging_level(m_encoder.get(), level));
  }


  bool Encoder::has_parameter(const std::string& name) const
  {
    const heif_encoder_parameter* const* params = heif_encoder_list_parameters(m_encoder.get());
    for (int i = 0; params[i]; i++) {
      if (name == heif_encoder_parameter_get_name(params[i])) {
        return true;
      }
    }

    return false;
  }


  void Encoder::set_parameter(const std::string& name, const std::string& value)
  {
    Error::throw_if_error(heif_encoder_set_parameter(m_encoder.get(), name.c_str(), value.c_str()));
  }


  // ------------------------- Context -------------------------

  Context::Context()
  {
    heif_context* ctx = heif_context_alloc();
    if (ctx == nullptr) {
      throw std::bad_alloc();
    }

    m_context = std::shared_ptr<heif_context>(ctx,
                                              [](heif_context* c) { heif_context_free(c); });
  }


  void Context::read_from_file(const std::string& filename)
  {
    Error::throw_if_error(heif_context_read_from_file(m_context.get(), filename.c_str(), nullptr));
  }


  void Context::write_to_file(const std::string& filename) const
  {
    Error::throw_if_error(heif_context_write_to_file(m_context.get(), filename.c_str()));
  }


  std::vector<heif_item_id> Context::get_list_of_top_level_image_IDs() const
  {
    int num = heif_context_get_number_of_top_level_images(m_context.get());
    std::vector<heif_item_id> IDs(num);
    num = heif_context_get_list_of_top_level_image_IDs(m_context.get(), IDs.data(), num);
    IDs.resize(num);
    return IDs;
  }


  ImageHandle Context::get_primary_image_handle() const
  {
    heif_image_handle* handle = nullptr;
    Error::throw_if_error(heif_context_get_primary_image_handle(m_context.get(), &handle));
    return ImageHandle(handle);
  }


  ImageHandle Context::get_image_handle(heif_item_id id) const
  {
    heif_image_handle* handle = nullptr;
    Error::throw_if_error(heif_context_get_image_handle(m_context.get(), id, &handle));
    return ImageHandle(handle);
  }


  Encoder Context::get_encoder(const EncoderDescriptor& descriptor)
  {
    heif_encoder* encoder = nullptr;
    Error::throw_if_error(heif_context_get_encoder(m_context.get(), descriptor.get_raw_descriptor(), &encoder));
    return Encoder(encoder);
  }


  ImageHandle Context::encode_image(const Image& image, Encoder& encoder,
                                    const heif_encoding_options* options)
  {
    heif_image_handle* handle = nullptr;
    Error::throw_if_error(heif_context_encode_image(m_context.get(),
                                                    image.get_raw_image(),
                                                    encoder.get_raw_encoder(),
                                                    options,
                                                    &handle));
    return ImageHandle(handle);
  }


  ImageHandle Context::encode_thumbnail(const Image& image, const ImageHandle& master_image,
                                        Encoder& encoder, const heif_encoding_options* options,
                                        int bbox_size)
  {
    heif_image_handle* thumbnail_handle = nullptr;
    Error::throw_if_error(heif_context_encode_thumbnail(m_context.get(),
                                                        image.get_raw_image(),
                                                        master_image.get_raw_image_handle(),
                                                        encoder.get_raw_encoder(),
                                                        options,
                                                        bbox_size,
                                                        &thumbnail_handle));
    if (thumbnail_handle == nullptr) {
      return ImageHandle();
    }
    return ImageHandle(thumbnail_handle);
  }


  void Context::set_primary_image(const ImageHandle& handle)
  {
    Error::throw_if_error(heif_context_set_primary_image(m_context.get(), handle.get_raw_image_handle()));
  }


  void Context::add_exif_metadata(const ImageHandle& handle, const std::vector<uint8_t>& exif)
  {
    Error::throw_if_error(heif_context_add_exif_metadata(m_context.get(), handle.get_raw_image_handle(),
                                                         exif.data(), static_cast<int>(exif.size())));
  }


  void Context::add_XMP_metadata(const ImageHandle& handle, const std::vector<uint8_t>& xmp)
  {
    Error::throw_if_error(heif_context_add_XMP_metadata(m_context.get(), handle.get_raw_image_handle(),
                                                        xmp.data(), static_cast<int>(xmp.size())));
  }


#if LIBHEIF_HAVE_VERSION(1, 16, 0)
  void Context::add_user_description(const ImageHandle& handle, const std::string& description)
  {
    heif_property_user_description udes{};
    udes.version = 1;
    udes.lang = "";
    udes.name = "";
    udes.description = description.c_str();
    udes.tags = "";

    Error::throw_if_error(heif_item_add_property_user_description(m_context.get(), handle.get_item_id(),
                                                                  &udes, nullptr));
  }
#endif


  bool have_encoder_for_format(heif_compression_format format)
  {
    return heif_have_encoder_for_format(format) != 0;
  }
}
