/**
 * @file image_codec.hpp
 * @brief Still-image decode, resize, alpha composite and encode
 *
 * @details Thin layer over FFmpeg's image codecs and libswscale:
 *
 *          - decode_image: any probed image -> straight-alpha RGBA
 *
 *          - resize_image: RGBA -> RGBA at a new size (bicubic)
 *
 *          - alpha_composite: Porter-Duff "over" of one RGBA onto another
 *
 *          - encode_image: RGBA -> file bytes in a given format
 */

#ifndef SNAPMERGE_IMAGE_CODEC_HPP
#define SNAPMERGE_IMAGE_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <vector>

#include "types.hpp"

namespace snapmerge {

/// Bytes per RGBA pixel
constexpr int RGBA_CHANNELS = 4;

/**
 * @struct RgbaImage
 * @brief Tightly packed 8-bit RGBA raster (stride = width * 4).
 */
struct RgbaImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;

  RgbaImage() = default;
  RgbaImage(int w, int h)
      : width(w), height(h),
        pixels(static_cast<size_t>(w) * h * RGBA_CHANNELS, 0) {}

  uint8_t *at(int x, int y) {
    return pixels.data() + (static_cast<size_t>(y) * width + x) * RGBA_CHANNELS;
  }
  const uint8_t *at(int x, int y) const {
    return pixels.data() + (static_cast<size_t>(y) * width + x) * RGBA_CHANNELS;
  }
};

/**
 * @struct EncodedImage
 * @brief Encoded file bytes and the format actually used.
 */
struct EncodedImage {
  std::vector<uint8_t> bytes;
  ImageFormat format;
};

/**
 * @brief Decode the first frame of an image file to RGBA.
 * @note Images without alpha come back fully opaque.
 * @throws NotFoundError if the file does not exist
 * @throws CodecError if FFmpeg cannot open or decode it
 */
RgbaImage decode_image(const std::filesystem::path &path);

/**
 * @brief Resample an RGBA image to a new size.
 * @param source File the raster came from, named in error messages
 * @throws InvalidArgumentError for non-positive sizes
 * @throws CodecError if libswscale fails
 */
RgbaImage resize_image(const RgbaImage &src, int width, int height,
                       const std::filesystem::path &source = {});

/**
 * @brief Draw overlay on top of base in place ("over" blend).
 * @throws InvalidArgumentError if the sizes differ
 */
void alpha_composite(RgbaImage &base, const RgbaImage &overlay,
                     const std::filesystem::path &source = {});

/**
 * @brief Format the encoder will write for a requested format.
 * @note GIF and WEBP have no still encoder here and map to PNG.
 */
ImageFormat encodable_format(const ImageFormat &requested);

/**
 * @brief Encode a raster in the requested format.
 * @details PNG keeps the alpha channel when any pixel is translucent; every
 *          other format is written as opaque RGB with alpha dropped.
 * @param image Source raster
 * @param format Requested output format, see encodable_format()
 * @param source File the raster came from, named in error messages
 * @throws CodecError on encoder failure
 */
EncodedImage encode_image(const RgbaImage &image, const ImageFormat &format,
                          const std::filesystem::path &source = {});

} // namespace snapmerge

#endif // SNAPMERGE_IMAGE_CODEC_HPP
