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

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <libheif/heif.h>

#include "heifsamples/heif_binding.h"
#include "heifsamples/image_conversion.h"
#include "heifsamples/raster_io.h"
#include "common.h"

using namespace heifsamples;


int quality = 50;
bool lossless = false;
int logging_level = 0;
int thumbnail_bbox_size = 0;
bool force_enc_av1f = false;
bool option_list_encoders = false;
bool option_show_parameters = false;
int master_alpha = 1;
int thumb_alpha = 1;
int two_colr_boxes = 0;
int premultiply_alpha = 0;
std::string encoder_id;
std::string chroma_downsampling;
std::string primary_item_description;

const int OPTION_VERBOSE = 1000;


static struct option long_options[] = {
    {(char* const) "help",                          no_argument,       0,               'h'},
    {(char* const) "version",                       no_argument,       0,               'v'},
    {(char* const) "avif",                          no_argument,       0,               'A'},
    {(char* const) "quality",                       required_argument, 0,               'q'},
    {(char* const) "lossless",                      no_argument,       0,               'L'},
    {(char* const) "thumbnail-bounding-box-size",   required_argument, 0,               't'},
    {(char* const) "encoder",                       required_argument, 0,               'e'},
    {(char* const) "list-encoders",                 no_argument,       0,               'E'},
    {(char* const) "encoder-parameter",             required_argument, 0,               'p'},
    {(char* const) "list-encoder-parameters",       no_argument,       0,               'P'},
    {(char* const) "no-alpha",                      no_argument,       &master_alpha,   0},
    {(char* const) "no-thumbnail-alpha",            no_argument,       &thumb_alpha,    0},
    {(char* const) "write-two-profiles",            no_argument,       &two_colr_boxes, 1},
    {(char* const) "premultiply",                   no_argument,       &premultiply_alpha, 1},
    {(char* const) "chroma-downsampling",           required_argument, 0,               'C'},
    {(char* const) "primary-item-description",      required_argument, 0,               'd'},
    {(char* const) "verbose",                       no_argument,       0,               OPTION_VERBOSE},
    {0, 0,                                                             0,               0}
};


static void show_help(const char* argv0)
{
  std::filesystem::path p(argv0);
  std::string filename = p.filename().string();

  std::cout << "Usage: " << filename << " [options] input.png|jpg output.heic|avif\n"
            << "\n"
            << "Options:\n"
            << "  -h, --help                            show help\n"
            << "  -v, --version                         show version\n"
            << "  -A, --avif                            encode as AVIF (default: HEVC)\n"
            << "  -q, --quality #                       lossy encoding quality (0-100, default: 50)\n"
            << "  -L, --lossless                        use lossless compression\n"
            << "  -t, --thumbnail-bounding-box-size #   generate a thumbnail with the given maximum size (default: off)\n"
            << "  -e, --encoder ID                      use the specified encoder (the IDs can be listed with -E)\n"
            << "  -E, --list-encoders                   list the available encoders for the compression format\n"
            << "  -p, --encoder-parameter NAME=VALUE    set an encoder parameter\n"
            << "  -P, --list-encoder-parameters         list the parameters of the selected encoder\n"
            << "      --no-alpha                        do not save the alpha channel\n"
            << "      --no-thumbnail-alpha              do not save the alpha channel of the thumbnail\n"
            << "      --write-two-profiles              write an ICC and an nclx profile when the image has an ICC profile\n"
            << "      --premultiply                     premultiply the color channels with the alpha channel\n"
            << "  -C, --chroma-downsampling ALGO        force chroma downsampling algorithm (nearest-neighbor / average / sharpyuv)\n"
            << "  -d, --primary-item-description TEXT   set a user description for the primary image\n"
            << "      --verbose                         enable encoder logging (more will increase logging level)\n";
}


static void show_list_of_encoders(const std::vector<EncoderDescriptor>& encoder_descriptors)
{
  for (size_t i = 0; i < encoder_descriptors.size(); i++) {
    std::cout << "- " << encoder_descriptors[i].get_id_name()
              << " = "
              << encoder_descriptors[i].get_name();

    if (i == 0) {
      std::cout << " [default]";
    }

    std::cout << "\n";
  }
}


static void list_encoder_parameters(const Encoder& encoder_object)
{
  heif_encoder* encoder = encoder_object.get_raw_encoder();

  std::cout << "Parameters for encoder `" << encoder_object.get_name() << "`:\n";

  const heif_encoder_parameter* const* params = heif_encoder_list_parameters(encoder);
  for (int i = 0; params[i]; i++) {
    const char* name = heif_encoder_parameter_get_name(params[i]);

    switch (heif_encoder_parameter_get_type(params[i])) {
      case heif_encoder_parameter_type_integer: {
        std::cout << "  " << name << " (integer)";

        if (heif_encoder_has_default(encoder, name)) {
          int value;
          heif_error error = heif_encoder_get_parameter_integer(encoder, name, &value);
          if (error.code == heif_error_Ok) {
            std::cout << ", default=" << value;
          }
        }

        int have_minimum = 0, have_maximum = 0, minimum = 0, maximum = 0, num_valid_values = 0;
        const int* valid_values = nullptr;
        heif_error error = heif_encoder_parameter_integer_valid_values(encoder, name,
                                                                       &have_minimum, &have_maximum,
                                                                       &minimum, &maximum,
                                                                       &num_valid_values,
                                                                       &valid_values);
        if (error.code == heif_error_Ok) {
          if (have_minimum && have_maximum) {
            std::cout << ", [" << minimum << ";" << maximum << "]";
          }
          else if (have_minimum) {
            std::cout << ", [" << minimum << ";]";
          }
          else if (have_maximum) {
            std::cout << ", [;" << maximum << "]";
          }

          if (num_valid_values > 0) {
            std::cout << ", {";

            for (int p = 0; p < num_valid_values; p++) {
              if (p > 0) {
                std::cout << ", ";
              }

              std::cout << valid_values[p];
            }

            std::cout << "}";
          }
        }

        std::cout << "\n";
      }
        break;

      case heif_encoder_parameter_type_boolean: {
        std::cout << "  " << name << " (boolean)";

        if (heif_encoder_has_default(encoder, name)) {
          int value;
          heif_error error = heif_encoder_get_parameter_boolean(encoder, name, &value);
          if (error.code == heif_error_Ok) {
            std::cout << ", default=" << (value ? "true" : "false");
          }
        }

        std::cout << "\n";
      }
        break;

      case heif_encoder_parameter_type_string: {
        std::cout << "  " << name << " (string)";

        if (heif_encoder_has_default(encoder, name)) {
          const int value_size = 50;
          char value[value_size];
          heif_error error = heif_encoder_get_parameter_string(encoder, name, value, value_size);
          if (error.code == heif_error_Ok) {
            std::cout << ", default=" << value;
          }
        }

        const char* const* valid_options = nullptr;
        heif_error error = heif_encoder_parameter_string_valid_values(encoder, name, &valid_options);

        if (error.code == heif_error_Ok && valid_options) {
          std::cout << ", { ";
          for (int k = 0; valid_options[k]; k++) {
            if (k > 0) { std::cout << ","; }
            std::cout << valid_options[k];
          }
          std::cout << " }";
        }

        std::cout << "\n";
      }
        break;
    }
  }
}


// Splits the 'name=value' arguments of -p. Returns false if one of them has no '='.
static bool parse_params(const std::vector<std::string>& raw_params,
                         std::vector<std::pair<std::string, std::string>>& params)
{
  for (const std::string& p : raw_params) {
    auto pos = p.find_first_of('=');
    if (pos == std::string::npos || pos == 0 || pos == p.size() - 1) {
      std::cout << "Encoder parameter must be in the format 'name=value': " << p << "\n";
      return false;
    }

    params.emplace_back(p.substr(0, pos), p.substr(pos + 1));
  }

  return true;
}


// Returns the canonical algorithm name, or an empty string for unknown names.
static std::string normalize_chroma_downsampling(std::string name)
{
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (name == "nn") { // abbreviation
    return "nearest-neighbor";
  }
  else if (name == "sharp-yuv") {
    return "sharpyuv";
  }
  else if (name == "nearest-neighbor" || name == "average" || name == "sharpyuv") {
    return name;
  }

  return {};
}


static int encode_file(Context& context, Encoder& encoder,
                       const std::vector<std::pair<std::string, std::string>>& params,
                       const std::string& input_filename,
                       const std::string& output_filename)
{
  // --- load the input image and convert it into a heif image

  RasterImage raster = load_raster_image(input_filename);
  RasterMetadata& metadata = raster.metadata();

  bool premultiply = premultiply_alpha && image_may_have_transparency(input_filename);

  Image image = create_heif_image(raster, premultiply);
  apply_color_profile(image, metadata, lossless, two_colr_boxes);

  // --- configure the encoder

  for (const auto& param : params) {
    encoder.set_parameter(param.first, param.second);
  }

  encoder.set_lossy_quality(quality);
  encoder.set_logging_level(logging_level);

  if (lossless) {
    encoder.set_lossless(true);

    // lossless compression needs unsubsampled chroma
    if (encoder.has_parameter("chroma")) {
      encoder.set_parameter("chroma", "444");
    }
  }

  EncodingOptions options = alloc_encoding_options();
  options->save_alpha_channel = (uint8_t) master_alpha;
  options->save_two_colr_boxes_when_ICC_and_nclx_available = (uint8_t) two_colr_boxes;

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
  if (chroma_downsampling == "average") {
    options->color_conversion_options.preferred_chroma_downsampling_algorithm = heif_chroma_downsampling_average;
    options->color_conversion_options.only_use_preferred_chroma_algorithm = true;
  }
  else if (chroma_downsampling == "sharpyuv") {
    options->color_conversion_options.preferred_chroma_downsampling_algorithm = heif_chroma_downsampling_sharp_yuv;
    options->color_conversion_options.only_use_preferred_chroma_algorithm = true;
  }
  else if (chroma_downsampling == "nearest-neighbor") {
    options->color_conversion_options.preferred_chroma_downsampling_algorithm = heif_chroma_downsampling_nearest_neighbor;
    options->color_conversion_options.only_use_preferred_chroma_algorithm = true;
  }
#endif

  std::optional<heif_orientation> orientation = take_exif_orientation(metadata.exif);
  if (orientation) {
    options->image_orientation = *orientation;
  }

  // --- encode

  ImageHandle handle = context.encode_image(image, encoder, options.get());
  context.set_primary_image(handle);

  if (!metadata.exif.empty()) {
    context.add_exif_metadata(handle, metadata.exif);
  }

  if (!metadata.xmp.empty()) {
    context.add_XMP_metadata(handle, metadata.xmp);
  }

  if (thumbnail_bbox_size > 0) {
    if (std::max(raster.get_width(), raster.get_height()) > thumbnail_bbox_size) {
      options->save_alpha_channel = master_alpha && thumb_alpha;

      context.encode_thumbnail(image, handle, encoder, options.get(), thumbnail_bbox_size);
    }
    else {
      std::cerr << "Warning: the image is not larger than the thumbnail bounding box, no thumbnail is written.\n";
    }
  }

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
  if (!primary_item_description.empty()) {
    context.add_user_description(handle, primary_item_description);
  }
#endif

  context.write_to_file(output_filename);

  std::cout << "Written to " << output_filename << "\n";

  return 0;
}


int main(int argc, char** argv)
{
  heif_examples::LibHeifInitializer initializer;

  std::vector<std::string> raw_params;

  while (true) {
    int option_index = 0;
    int c = getopt_long(argc, argv, "hvAq:Lt:e:Ep:PC:d:", long_options, &option_index);
    if (c == -1)
      break;

    switch (c) {
      case 'h':
        show_help(argv[0]);
        return 0;
      case 'v':
        heif_examples::show_version("heif-enc");
        return 0;
      case 'A':
        force_enc_av1f = true;
        break;
      case 'q':
        quality = atoi(optarg);
        break;
      case 'L':
        lossless = true;
        break;
      case 't':
        thumbnail_bbox_size = atoi(optarg);
        break;
      case 'e':
        encoder_id = optarg;
        break;
      case 'E':
        option_list_encoders = true;
        break;
      case 'p':
        raw_params.push_back(optarg);
        break;
      case 'P':
        option_show_parameters = true;
        break;
      case 'C':
        chroma_downsampling = optarg;
        break;
      case 'd':
        primary_item_description = optarg;
        break;
      case OPTION_VERBOSE:
        logging_level++;
        break;
      case '?':
        std::cerr << "\n";
        show_help(argv[0]);
        return 0;
    }
  }

  try {
    heif_compression_format compression_format = force_enc_av1f ? heif_compression_AV1 : heif_compression_HEVC;

    if (!have_encoder_for_format(compression_format)) {
      std::cout << "No " << (force_enc_av1f ? "AV1" : "HEVC") << " encoder available.\n";
      return 0;
    }

    // --- select the encoder

    std::vector<EncoderDescriptor> encoder_descriptors = EncoderDescriptor::get_encoder_descriptors(compression_format);
    if (encoder_descriptors.empty()) {
      std::cout << "No " << (force_enc_av1f ? "AV1" : "HEVC") << " encoder available.\n";
      return 0;
    }

    if (option_list_encoders) {
      show_list_of_encoders(encoder_descriptors);
      return 0;
    }

    const EncoderDescriptor* active_descriptor = &encoder_descriptors[0];

    if (!encoder_id.empty()) {
      active_descriptor = nullptr;

      for (const auto& descriptor : encoder_descriptors) {
        if (descriptor.get_id_name() == encoder_id) {
          active_descriptor = &descriptor;
          break;
        }
      }

      if (active_descriptor == nullptr) {
        std::cout << "Invalid encoder ID, please choose one from the list below:\n";
        show_list_of_encoders(encoder_descriptors);
        return 0;
      }
    }

    Context context;
    Encoder encoder = context.get_encoder(*active_descriptor);

    if (option_show_parameters) {
      list_encoder_parameters(encoder);
      return 0;
    }

    // --- check the remaining arguments

    if (argc - optind != 2) {
      show_help(argv[0]);
      return 0;
    }

    if (quality < 0 || quality > 100) {
      std::cout << "The quality parameter must be between 0 and 100.\n";
      return 0;
    }

    std::vector<std::pair<std::string, std::string>> params;
    if (!parse_params(raw_params, params)) {
      return 0;
    }

    if (!chroma_downsampling.empty()) {
      chroma_downsampling = normalize_chroma_downsampling(chroma_downsampling);
      if (chroma_downsampling.empty()) {
        std::cout << "Invalid chroma downsampling value, it must be one of: nearest-neighbor, average or sharpyuv.\n";
        return 0;
      }
    }

    // --- drop the features that are not available

    if (lossless && !active_descriptor->supports_lossless_compression()) {
      lossless = false;
      std::cerr << "Warning: the " << active_descriptor->get_id_name()
                << " encoder does not support lossless compression, using lossy compression.\n";
    }

#if !LIBHEIF_HAVE_VERSION(1, 16, 0)
    if (!primary_item_description.empty()) {
      primary_item_description.clear();
      std::cerr << "Warning: libheif " << heif_get_version() << " cannot set a primary item description.\n";
    }

    if (!chroma_downsampling.empty()) {
      chroma_downsampling.clear();
      std::cerr << "Warning: the chroma downsampling option will be ignored, it requires libheif 1.16.0 or later.\n";
    }
#endif

    std::string input_filename(argv[optind]);
    std::string output_filename(argv[optind + 1]);

    return encode_file(context, encoder, params, input_filename, output_filename);
  }
  catch (const heifsamples::Error& err) {
    std::cout << err.get_message() << "\n";
  }
  catch (const std::exception& ex) {
    std::cout << ex.what() << "\n";
  }

  return 0;
}
