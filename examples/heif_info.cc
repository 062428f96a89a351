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

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <libheif/heif.h>

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
#include <libheif/heif_properties.h>
#include <libheif/heif_regions.h>
#endif

#include "heifsamples/heif_binding.h"
#include "common.h"

using namespace heifsamples;


static struct option long_options[] = {
    {(char* const) "help",    no_argument, 0, 'h'},
    {(char* const) "version", no_argument, 0, 'v'},
    {0, 0,                                 0, 0}
};


static void show_help(const char* argv0)
{
  std::filesystem::path p(argv0);
  std::string filename = p.filename().string();

  std::cout << "Usage: " << filename << " [options] <HEIF-image>\n"
            << "\n"
               "options:\n"
               "  -h, --help           show help\n"
               "  -v, --version        show version\n";
}


static void show_thumbnails(const ImageHandle& handle)
{
  std::vector<heif_item_id> thumbnail_IDs = handle.get_list_of_thumbnail_IDs();

  if (thumbnail_IDs.empty()) {
    printf("  thumbnails: none\n");
    return;
  }

  printf("  thumbnails:\n");
  for (heif_item_id id : thumbnail_IDs) {
    ImageHandle thumbnail = handle.get_thumbnail(id);
    printf("    thumbnail: %dx%d %d-bit\n",
           thumbnail.get_width(), thumbnail.get_height(), thumbnail.get_luma_bits_per_pixel());
  }
}


static const char* get_color_profile_description(const ImageHandle& handle)
{
  heif_color_profile_type type = handle.get_color_profile_type();
  bool has_icc = (type == heif_color_profile_type_prof || type == heif_color_profile_type_rICC);
  bool has_nclx = (handle.get_nclx_color_profile() != nullptr);

  if (has_icc) {
    return has_nclx ? "icc, nclx" : "icc";
  }
  else if (has_nclx) {
    return "nclx";
  }

  return "none";
}


static const char* get_depth_representation_name(heif_depth_representation_type type)
{
  switch (type) {
    case heif_depth_representation_type_uniform_inverse_Z:
      return "inverse Z";
    case heif_depth_representation_type_uniform_disparity:
      return "uniform disparity";
    case heif_depth_representation_type_uniform_Z:
      return "uniform Z";
    case heif_depth_representation_type_nonuniform_disparity:
      return "non-uniform disparity";
    default:
      return "unknown";
  }
}


static void print_optional(const char* label, const std::optional<double>& value)
{
  if (value) {
    printf("    %s: %f\n", label, *value);
  }
  else {
    printf("    %s: undefined\n", label);
  }
}


static void show_depth_images(const ImageHandle& handle)
{
  if (!handle.has_depth_image()) {
    printf("  depth image: no\n");
    return;
  }

  printf("  depth image: yes\n");

  for (heif_item_id depth_id : handle.get_list_of_depth_image_IDs()) {
    ImageHandle depth_handle = handle.get_depth_image_handle(depth_id);
    printf("    depth: %dx%d\n", depth_handle.get_width(), depth_handle.get_height());

    std::optional<DepthRepresentationInfo> info = handle.get_depth_representation_info(depth_id);
    if (!info) {
      continue;
    }

    print_optional("z-near", info->z_near);
    print_optional("z-far", info->z_far);
    print_optional("d-min", info->d_min);
    print_optional("d-max", info->d_max);
    printf("    representation: %s\n", get_depth_representation_name(info->type));

    if (info->d_min || info->d_max) {
      printf("    disparity reference view: %u\n", info->disparity_reference_view);
    }
  }
}


static void show_metadata(const ImageHandle& handle)
{
  std::vector<heif_item_id> metadata_IDs = handle.get_list_of_metadata_block_IDs();

  if (metadata_IDs.empty()) {
    printf("  metadata: none\n");
    return;
  }

  printf("  metadata:\n");
  for (heif_item_id id : metadata_IDs) {
    MetadataBlockInfo info = handle.get_metadata_block_info(id);

    std::string name;
    if (info.item_type == "Exif") {
      name = info.item_type;
    }
    else if (info.item_type == "mime" && info.content_type == "application/rdf+xml") {
      name = "XMP";
    }
    else {
      name = info.item_type + "/" + info.content_type;
    }

    printf("    %s: %zu bytes\n", name.c_str(), info.size);
  }
}


#if LIBHEIF_HAVE_VERSION(1, 16, 0)

#define MAX_PROPERTIES 50

static void show_transformations(const Context& context, const ImageHandle& handle)
{
  heif_context* ctx = context.get_raw_context();
  heif_item_id id = handle.get_item_id();

  heif_property_id transforms[MAX_PROPERTIES];
  int nTransforms = heif_item_get_transformation_properties(ctx, id, transforms, MAX_PROPERTIES);

  if (nTransforms == 0) {
    printf("  transformations: none\n");
    return;
  }

  printf("  transformations:\n");

  int image_width = heif_image_handle_get_ispe_width(handle.get_raw_image_handle());
  int image_height = heif_image_handle_get_ispe_height(handle.get_raw_image_handle());

  for (int k = 0; k < nTransforms; k++) {
    switch (heif_item_get_property_type(ctx, id, transforms[k])) {
      case heif_item_property_type_transform_mirror:
        printf("    mirror: %s\n",
               heif_item_get_property_transform_mirror(ctx, id, transforms[k]) == heif_transform_mirror_direction_horizontal ? "horizontal" : "vertical");
        break;
      case heif_item_property_type_transform_rotation: {
        int angle = heif_item_get_property_transform_rotation_ccw(ctx, id, transforms[k]);
        printf("    rotation (ccw): %d\n", angle);
        if (angle == 90 || angle == 270) {
          std::swap(image_width, image_height);
        }
        break;
      }
      case heif_item_property_type_transform_crop: {
        int left, top, right, bottom;
        heif_item_get_property_transform_crop_borders(ctx, id, transforms[k], image_width, image_height,
                                                      &left, &top, &right, &bottom);
        printf("    crop: left=%d top=%d right=%d bottom=%d\n", left, top, right, bottom);
        break;
      }
      default:
        printf("    unknown transformation\n");
    }
  }
}


static void show_user_descriptions(heif_context* ctx, heif_item_id id, const char* indent)
{
  heif_property_id properties[MAX_PROPERTIES];
  int nDescr = heif_item_get_properties_of_type(ctx, id,
                                                heif_item_property_type_user_description,
                                                properties, MAX_PROPERTIES);

  for (int k = 0; k < nDescr; k++) {
    heif_property_user_description* udes;
    heif_error err = heif_item_get_property_user_description(ctx, id, properties[k], &udes);
    if (err.code) {
      std::cerr << "Error reading user description " << id << "/" << properties[k] << ": " << err.message << "\n";
      continue;
    }

    printf("%suser description:\n", indent);
    printf("%s  language: %s\n", indent, udes->lang);
    printf("%s  name: %s\n", indent, udes->name);
    printf("%s  description: %s\n", indent, udes->description);
    printf("%s  tags: %s\n", indent, udes->tags);

    heif_property_user_description_release(udes);
  }
}


static void show_region(const heif_region* region)
{
  heif_region_type type = heif_region_get_type(region);

  if (type == heif_region_type_point) {
    int32_t x, y;
    heif_region_get_point(region, &x, &y);
    printf("      point [x=%i, y=%i]\n", x, y);
  }
  else if (type == heif_region_type_rectangle) {
    int32_t x, y;
    uint32_t w, h;
    heif_region_get_rectangle(region, &x, &y, &w, &h);
    printf("      rectangle [x=%i, y=%i, w=%u, h=%u]\n", x, y, w, h);
  }
  else if (type == heif_region_type_ellipse) {
    int32_t x, y;
    uint32_t rx, ry;
    heif_region_get_ellipse(region, &x, &y, &rx, &ry);
    printf("      ellipse [x=%i, y=%i, r_x=%u, r_y=%u]\n", x, y, rx, ry);
  }
  else if (type == heif_region_type_polygon || type == heif_region_type_polyline) {
    bool polygon = (type == heif_region_type_polygon);

    int numPoints = polygon ? heif_region_get_polygon_num_points(region) : heif_region_get_polyline_num_points(region);
    std::vector<int32_t> pts(numPoints * 2);
    if (polygon) {
      heif_region_get_polygon_points(region, pts.data());
    }
    else {
      heif_region_get_polyline_points(region, pts.data());
    }

    printf("      %s [", polygon ? "polygon" : "polyline");
    for (int p = 0; p < numPoints; p++) {
      printf("(%d;%d)", pts[2 * p + 0], pts[2 * p + 1]);
    }
    printf("]\n");
  }
#if LIBHEIF_HAVE_VERSION(1, 17, 0)
  else if (type == heif_region_type_referenced_mask) {
    int32_t x, y;
    uint32_t w, h;
    heif_item_id referenced_item;
    heif_region_get_referenced_mask_ID(region, &x, &y, &w, &h, &referenced_item);
    printf("      referenced mask [x=%i, y=%i, w=%u, h=%u, item=%u]\n", x, y, w, h, referenced_item);
  }
  else if (type == heif_region_type_inline_mask) {
    int32_t x, y;
    uint32_t w, h;
    size_t data_len = heif_region_get_inline_mask_data_len(region);
    std::vector<uint8_t> mask_data(data_len);
    heif_region_get_inline_mask_data(region, &x, &y, &w, &h, mask_data.data());
    printf("      inline mask [x=%i, y=%i, w=%u, h=%u, data len=%zu]\n", x, y, w, h, mask_data.size());
  }
#endif
  else {
    printf("      unknown region type\n");
  }
}


static void show_regions(const Context& context, const ImageHandle& handle)
{
  heif_context* ctx = context.get_raw_context();

  printf("  region annotations:\n");

  int numRegionItems = heif_image_handle_get_number_of_region_items(handle.get_raw_image_handle());
  if (numRegionItems <= 0) {
    return;
  }

  std::vector<heif_item_id> region_items(numRegionItems);
  numRegionItems = heif_image_handle_get_list_of_region_item_ids(handle.get_raw_image_handle(),
                                                                 region_items.data(), numRegionItems);
  region_items.resize(numRegionItems);

  for (heif_item_id region_item_id : region_items) {
    heif_region_item* region_item;
    Error::throw_if_error(heif_context_get_region_item(ctx, region_item_id, &region_item));

    uint32_t reference_width, reference_height;
    heif_region_item_get_reference_size(region_item, &reference_width, &reference_height);
    int numRegions = heif_region_item_get_number_of_regions(region_item);
    printf("    id=%u reference_width=%u reference_height=%u %d regions\n",
           region_item_id, reference_width, reference_height, numRegions);

    std::vector<heif_region*> regions(numRegions);
    numRegions = heif_region_item_get_list_of_regions(region_item, regions.data(), numRegions);
    for (int j = 0; j < numRegions; j++) {
      show_region(regions[j]);
    }

    heif_region_release_many(regions.data(), numRegions);
    heif_region_item_release(region_item);

    show_user_descriptions(ctx, region_item_id, "    ");
  }
}


static void show_properties(const Context& context, const ImageHandle& handle)
{
  printf("  properties:\n");
  show_user_descriptions(context.get_raw_context(), handle.get_item_id(), "    ");
}

#endif


static void show_decoded_image_info(const ImageHandle& handle)
{
  Image image = handle.decode_image(heif_colorspace_undefined, heif_chroma_undefined);

  uint32_t aspect_h = 1, aspect_v = 1;
  image.get_pixel_aspect_ratio(&aspect_h, &aspect_v);
  if (aspect_h != aspect_v) {
    printf("  pixel aspect ratio: %u:%u\n", aspect_h, aspect_v);
  }

  std::optional<heif_content_light_level> clli = image.get_content_light_level();
  if (clli) {
    printf("  content light level (clli):\n");
    printf("    max content light level: %u\n", clli->max_content_light_level);
    printf("    max picture average light level: %u\n", clli->max_pic_average_light_level);
  }

  std::optional<heif_decoded_mastering_display_colour_volume> mdcv = image.get_mastering_display_colour_volume();
  if (mdcv) {
    std::cout << "  mastering display color volume:\n"
              << "    display primaries (x,y): "
              << "(" << mdcv->display_primaries_x[0] << ";" << mdcv->display_primaries_y[0] << "), "
              << "(" << mdcv->display_primaries_x[1] << ";" << mdcv->display_primaries_y[1] << "), "
              << "(" << mdcv->display_primaries_x[2] << ";" << mdcv->display_primaries_y[2] << ")\n";

    std::cout << "    white point (x,y): (" << mdcv->white_point_x << ";" << mdcv->white_point_y << ")\n";
    std::cout << "    max display mastering luminance: " << mdcv->max_display_mastering_luminance << "\n";
    std::cout << "    min display mastering luminance: " << mdcv->min_display_mastering_luminance << "\n";
  }
}


int main(int argc, char** argv)
{
  heif_examples::LibHeifInitializer initializer;

  while (true) {
    int option_index = 0;
    int c = getopt_long(argc, argv, "hv", long_options, &option_index);
    if (c == -1) {
      break;
    }

    switch (c) {
      case 'v':
        heif_examples::show_version("heif-info");
        return 0;
      case '?':
      case 'h':
        show_help(argv[0]);
        return 0;
    }
  }

  if (argc - optind != 1) {
    show_help(argv[0]);
    return 0;
  }

  const char* input_filename = argv[optind];

  try {
    Context context;
    context.read_from_file(input_filename);

    for (heif_item_id id : context.get_list_of_top_level_image_IDs()) {
      ImageHandle handle = context.get_image_handle(id);

      printf("image: %dx%d %d-bit (id=%u)%s\n",
             handle.get_width(), handle.get_height(), handle.get_luma_bits_per_pixel(),
             id, handle.is_primary_image() ? " primary" : "");

      show_thumbnails(handle);

      printf("  color profile: %s\n", get_color_profile_description(handle));

      if (handle.has_alpha_channel()) {
        printf("  alpha channel: %s\n", handle.is_premultiplied_alpha() ? "yes (premultiplied)" : "yes");
      }
      else {
        printf("  alpha channel: no\n");
      }

      show_depth_images(handle);
      show_metadata(handle);

#if LIBHEIF_HAVE_VERSION(1, 16, 0)
      show_transformations(context, handle);
      show_regions(context, handle);
      show_properties(context, handle);
#endif

      show_decoded_image_info(handle);
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
