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

#ifndef HEIFSAMPLES_HEIF_BINDING_H
#define HEIFSAMPLES_HEIF_BINDING_H

#include <libheif/heif.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "heifsamples/plane_view.h"

namespace heifsamples {

  // A libheif error. Memory allocation errors are reported as std::bad_alloc instead.
  class Error : public std::runtime_error
  {
  public:
    explicit Error(const heif_error& err);

    Error(heif_error_code code, heif_suberror_code subcode, const std::string& message);

    std::string get_message() const { return what(); }

    heif_error_code get_code() const { return m_code; }

    heif_suberror_code get_subcode() const { return m_subcode; }

    static void throw_if_error(const heif_error& err);

  private:
    heif_error_code m_code;
    heif_suberror_code m_subcode;
  };


  namespace detail {
    struct encoding_options_deleter { void operator()(heif_encoding_options* o) const { heif_encoding_options_free(o); } };

    struct decoding_options_deleter { void operator()(heif_decoding_options* o) const { heif_decoding_options_free(o); } };

    struct nclx_profile_deleter { void operator()(heif_color_profile_nclx* p) const { heif_nclx_color_profile_free(p); } };
  }

  using EncodingOptions = std::unique_ptr<heif_encoding_options, detail::encoding_options_deleter>;

  using DecodingOptions = std::unique_ptr<heif_decoding_options, detail::decoding_options_deleter>;

  using NclxProfile = std::unique_ptr<heif_color_profile_nclx, detail::nclx_profile_deleter>;

  EncodingOptions alloc_encoding_options();

  DecodingOptions alloc_decoding_options();

  NclxProfile alloc_nclx_color_profile();


  struct DepthRepresentationInfo
  {
    std::optional<double> z_near;
    std::optional<double> z_far;
    std::optional<double> d_min;
    std::optional<double> d_max;
    heif_depth_representation_type type = heif_depth_representation_type_uniform_inverse_Z;
    uint32_t disparity_reference_view = 0;
  };


  struct MetadataBlockInfo
  {
    heif_item_id id = 0;
    std::string item_type;
    std::string content_type;
    size_t size = 0;
  };


  class Image
  {
  public:
    Image() = default;

    explicit Image(heif_image* image);

    static Image create(int width, int height,
                        heif_colorspace colorspace,
                        heif_chroma chroma);

    bool empty() const { return !m_image; }

    void add_plane(heif_channel channel, int width, int height, int bit_depth);

    heif_colorspace get_colorspace() const;

    heif_chroma get_chroma_format() const;

    int get_bits_per_pixel(heif_channel channel) const;

    int get_bits_per_pixel_range(heif_channel channel) const;

    bool has_channel(heif_channel channel) const;

    // The returned view borrows the plane memory of this image. It must not outlive the image.
    PlaneView get_plane(heif_channel channel);

    ConstPlaneView get_plane(heif_channel channel) const;

    void set_premultiplied_alpha(bool premultiplied);

    bool is_premultiplied_alpha() const;

    void set_raw_color_profile(const std::vector<uint8_t>& icc_profile);

    void set_nclx_color_profile(const heif_color_profile_nclx& nclx);

    // Returns the warnings that were collected while decoding this image.
    std::vector<std::string> get_decoding_warnings() const;

    void get_pixel_aspect_ratio(uint32_t* aspect_h, uint32_t* aspect_v) const;

    std::optional<heif_content_light_level> get_content_light_level() const;

    std::optional<heif_decoded_mastering_display_colour_volume> get_mastering_display_colour_volume() const;

    heif_image* get_raw_image() const { return m_image.get(); }

  private:
    std::shared_ptr<heif_image> m_image;
  };


  class ImageHandle
  {
  public:
    ImageHandle() = default;

    explicit ImageHandle(heif_image_handle* handle);

    bool empty() const { return !m_image_handle; }

    heif_item_id get_item_id() const;

    bool is_primary_image() const;

    int get_width() const;

    int get_height() const;

    bool has_alpha_channel() const;

    bool is_premultiplied_alpha() const;

    int get_luma_bits_per_pixel() const;

    // ------------------------- depth images -------------------------

    bool has_depth_image() const;

    std::vector<heif_item_id> get_list_of_depth_image_IDs() const;

    ImageHandle get_depth_image_handle(heif_item_id depth_image_id) const;

    std::optional<DepthRepresentationInfo> get_depth_representation_info(heif_item_id depth_image_id) const;

    // ------------------------- thumbnails -------------------------

    std::vector<heif_item_id> get_list_of_thumbnail_IDs() const;

    ImageHandle get_thumbnail(heif_item_id thumbnail_id) const;

    // ------------------------- auxiliary images -------------------------

    // aux_filter is a combination of the LIBHEIF_AUX_IMAGE_FILTER_* flags.
    std::vector<heif_item_id> get_list_of_auxiliary_image_IDs(int aux_filter) const;

    ImageHandle get_auxiliary_image_handle(heif_item_id auxiliary_id) const;

    std::string get_auxiliary_type() const;

    // ------------------------- metadata -------------------------

    std::vector<heif_item_id> get_list_of_metadata_block_IDs(const char* type_filter = nullptr) const;

    MetadataBlockInfo get_metadata_block_info(heif_item_id metadata_id) const;

    std::vector<uint8_t> get_metadata(heif_item_id metadata_id) const;

    // Content of the first metadata block of the given type, empty if there is none.
    std::vector<uint8_t> get_first_metadata_of_type(const char* item_type, const char* content_type = nullptr) const;

    // ------------------------- color profiles -------------------------

    heif_color_profile_type get_color_profile_type() const;

    std::vector<uint8_t> get_raw_color_profile() const;

    // Returns a null pointer if the image has no nclx profile.
    NclxProfile get_nclx_color_profile() const;

    Image decode_image(heif_colorspace colorspace, heif_chroma chroma,
                       const heif_decoding_options* options = nullptr) const;

    heif_image_handle* get_raw_image_handle() const { return m_image_handle.get(); }

  private:
    std::shared_ptr<heif_image_handle> m_image_handle;
  };


  class EncoderDescriptor
  {
  public:
    static std::vector<EncoderDescriptor> get_encoder_descriptors(heif_compression_format format_filter,
                                                                  const char* name_filter = nullptr);

    std::string get_name() const;

    std::string get_id_name() const;

    heif_compression_format get_compression_format() const;

    bool supports_lossless_compression() const;

    const heif_encoder_descriptor* get_raw_descriptor() const { return m_descriptor; }

  private:
    explicit EncoderDescriptor(const heif_encoder_descriptor* descriptor) : m_descriptor(descriptor) {}

    const heif_encoder_descriptor* m_descriptor = nullptr;
  };


  class Encoder
  {
  public:
    Encoder() = default;

    explicit Encoder(heif_encoder* encoder);

    std::string get_name() const;

    void set_lossy_quality(int quality);

    void set_lossless(bool enable_lossless);

    void set_logging_level(int level);

    bool has_parameter(const std::string& name) const;

    void set_parameter(const std::string& name, const std::string& value);

    heif_encoder* get_raw_encoder() const { return m_encoder.get(); }

  private:
    std::shared_ptr<heif_encoder> m_encoder;
  };


  class Context
  {
  public:
    Context();

    void read_from_file(const std::string& filename);

    void write_to_file(const std::string& filename) const;

    std::vector<heif_item_id> get_list_of_top_level_image_IDs() const;

    ImageHandle get_primary_image_handle() const;

    ImageHandle get_image_handle(heif_item_id id) const;

    Encoder get_encoder(const EncoderDescriptor& descriptor);

    ImageHandle encode_image(const Image& image, Encoder& encoder,
                             const heif_encoding_options* options = nullptr);

    // Returns an empty handle if the image is smaller than the bounding box.
    ImageHandle encode_thumbnail(const Image& image, const ImageHandle& master_image,
                                 Encoder& encoder, const heif_encoding_options* options,
                                 int bbox_size);

    void set_primary_image(const ImageHandle& handle);

    void add_exif_metadata(const ImageHandle& handle, const std::vector<uint8_t>& exif);

    void add_XMP_metadata(const ImageHandle& handle, const std::vector<uint8_t>& xmp);

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
    void add_user_description(const ImageHandle& handle, const std::string& description);
#endif

    heif_context* get_raw_context() const { return m_context.get(); }

  private:
    std::shared_ptr<heif_context> m_context;
  };


  bool have_encoder_for_format(heif_compression_format format);
}

#endif
