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

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <libheif/heif.h>

#include "heifsamples/file_naming.h"
#include "heifsamples/heif_binding.h"
#include "heifsamples/image_conversion.h"
#include "heifsamples/png_io.h"
#include "common.h"

using namespace heifsamples;


static void show_help(const char* argv0)
{
  std::filesystem::path p(argv0);
  std::string filename = p.filename().string();

  std::cout << "Usage: " << filename << " [options] input.heic output.png\n"
            << "\n"
               "Options:\n"
               "  -h, --help                 show help\n"
               "  -v, --version              show version\n"
               "  -p, --primary              only write the primary image (default: all top-level images)\n"
               "  -d, --depth                also write the depth images\n"
               "  -t, --thumb                also write the thumbnail images\n"
               "  -x, --vendor-auxiliary     also write the vendor-specific auxiliary images\n"
               "      --no-hdr               convert HDR images to 8 bits per channel\n";
}


int option_primary = 0;
int option_depth = 0;
int option_thumbnails = 0;
int option_vendor_aux = 0;
int option_no_hdr = 0;

static struct option long_options[] = {
    {(char* const) "primary",          no_argument, &option_primary,    1},
    {(char* const) "depth",            no_argument, &option_depth,      1},
    {(char* const) "thumb",            no_argument, &option_thumbnails, 1},
    {(char* const) "vendor-auxiliary", no_argument, &option_vendor_aux, 1},
    {(char* const) "no-hdr",           no_argument, &option_no_hdr,     1},
    {(char* const) "help",             no_argument, 0,                  'h'},
    {(char* const) "version",          no_argument, 0,                  'v'},
    {nullptr, no_argument, nullptr, 0}
};


static std::string numbered_suffix(const std::string& suffix, size_t index, size_t count)
{
  if (count == 1) {
    return suffix;
  }

  std::ostringstream s;
  s << suffix << "-" << index;
  return s.str();
}


static void write_output_image(const ImageHandle& handle, const std::string& output_filename)
{
  std::vector<std::string> warnings;
  RasterImage image = decode_to_raster(handle, option_no_hdr, warnings);

  for (const auto& warning : warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }

  copy_metadata_to_raster(handle, image.metadata());

  save_png(output_filename, image);

  std::cout << "Written to " << output_filename << "\n";
}


static void process_image_handle(const ImageHandle& handle, const std::string& output_filename)
{
  write_output_image(handle, output_filename);

  if (option_depth && handle.has_depth_image()) {
    std::vector<heif_item_id> depth_IDs = handle.get_list_of_depth_image_IDs();

    for (size_t i = 0; i < depth_IDs.size(); i++) {
      ImageHandle depth_handle = handle.get_depth_image_handle(depth_IDs[i]);

      std::string suffix = numbered_suffix("-depth", i, depth_IDs.size());
      write_output_image(depth_handle, add_suffix_to_filename(output_filename, suffix));
    }
  }

  if (option_thumbnails) {
    std::vector<heif_item_id> thumbnail_IDs = handle.get_list_of_thumbnail_IDs();

    for (size_t i = 0; i < thumbnail_IDs.size(); i++) {
      ImageHandle thumbnail_handle = handle.get_thumbnail(thumbnail_IDs[i]);

      std::string suffix = numbered_suffix("-thumb", i, thumbnail_IDs.size());
      write_output_image(thumbnail_handle, add_suffix_to_filename(output_filename, suffix));
    }
  }

  if (option_vendor_aux) {
    std::vector<heif_item_id> aux_IDs = handle.get_list_of_auxiliary_image_IDs(LIBHEIF_AUX_IMAGE_FILTER_OMIT_ALPHA |
                                                                               LIBHEIF_AUX_IMAGE_FILTER_OMIT_DEPTH);

    for (size_t i = 0; i < aux_IDs.size(); i++) {
      ImageHandle aux_handle = handle.get_auxiliary_image_handle(aux_IDs[i]);

      std::string suffix = numbered_suffix("-" + sanitize_filename(aux_handle.get_auxiliary_type()), i, aux_IDs.size());
      write_output_image(aux_handle, add_suffix_to_filename(output_filename, suffix));
    }
  }
}


int main(int argc, char** argv)
{
  heif_examples::LibHeifInitializer initializer;

  while (true) {
    int option_index = 0;
    int c = getopt_long(argc, argv, "hvpdtx", long_options, &option_index);
    if (c == -1) {
      break;
    }

    switch (c) {
      case 'p':
        option_primary = 1;
        break;
      case 'd':
        option_depth = 1;
        break;
      case 't':
        option_thumbnails = 1;
        break;
      case 'x':
        option_vendor_aux = 1;
        break;
      case '?':
        std::cerr << "\n";
        [[fallthrough]];
      case 'h':
        show_help(argv[0]);
        return 0;
      case 'v':
        heif_examples::show_version("heif-dec");
        return 0;
    }
  }

  if (argc - optind != 2) {
    show_help(argv[0]);
    return 0;
  }

  std::string input_filename(argv[optind]);
  std::string output_filename(argv[optind + 1]);

  if (!heif_examples::check_for_valid_input_HEIF_file(input_filename)) {
    return 0;
  }

  try {
    Context context;
    context.read_from_file(input_filename);

    if (option_primary) {
      process_image_handle(context.get_primary_image_handle(), output_filename);
    }
    else {
      std::vector<heif_item_id> image_IDs = context.get_list_of_top_level_image_IDs();

      for (size_t i = 0; i < image_IDs.size(); i++) {
        std::string filename = output_filename;
        if (image_IDs.size() > 1) {
          filename = add_suffix_to_filename(output_filename, "-" + std::to_string(i));
        }

        process_image_handle(context.get_image_handle(image_IDs[i]), filename);
      }
    }
  }
  catch (const heifsamples::Error& err) {
    std::cout << err.get_message() << "\n";
  }
  catch (const std::exception& ex) {
    std::cout << ex.what() << "\n";
  }

  return 0;
}
