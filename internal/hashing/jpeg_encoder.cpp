#include "internal/hashing/jpeg_encoder.hpp"

// jpeglib.h relies on FILE and size_t being declared first.
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <jpeglib.h>

namespace trajectory::hashing {
namespace {

struct ErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf   jump;
  char           message[JMSG_LENGTH_MAX];
};

void OnJpegError(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

struct Destination {
  unsigned char* buffer = nullptr;
  unsigned long  size   = 0;
};

std::vector<std::uint8_t> StripAlpha(const model::Image& image) {
  std::vector<std::uint8_t> rgb;
  rgb.reserve(static_cast<std::size_t>(image.width) * image.height * 3);
  for (std::size_t i = 0; i + 3 < image.pixels.size(); i += 4) {
    rgb.push_back(image.pixels[i]);
    rgb.push_back(image.pixels[i + 1]);
    rgb.push_back(image.pixels[i + 2]);
  }
  return rgb;
}

} // namespace

std::vector<std::uint8_t> EncodeJpeg(const model::Image& image, int quality) {
  if (image.width == 0 || image.height == 0) {
    throw std::runtime_error("cannot encode an empty image");
  }
  if (image.channels != 1 && image.channels != 3 && image.channels != 4) {
    throw std::runtime_error("unsupported channel count: " + std::to_string(image.channels));
  }
  const auto expected = static_cast<std::size_t>(image.width) * image.height * image.channels;
  if (image.pixels.size() != expected) {
    throw std::runtime_error("pixel buffer holds " + std::to_string(image.pixels.size()) + " bytes, expected " + std::to_string(expected));
  }

  std::vector<std::uint8_t> stripped;
  const std::uint8_t*       source     = image.pixels.data();
  int                       components = image.channels;
  if (image.channels == 4) {
    stripped   = StripAlpha(image);
    source     = stripped.data();
    components = 3;
  }
  const std::size_t stride = static_cast<std::size_t>(image.width) * components;

  jpeg_compress_struct cinfo{};
  ErrorManager         err{};
  Destination          out;

  cinfo.err             = jpeg_std_error(&err.pub);
  err.pub.error_exit    = OnJpegError;

  if (setjmp(err.jump)) {
    jpeg_destroy_compress(&cinfo);
    std::free(out.buffer);
    throw std::runtime_error(std::string("jpeg encode failed: ") + err.message);
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &out.buffer, &out.size);

  cinfo.image_width      = image.width;
  cinfo.image_height     = image.height;
  cinfo.input_components = components;
  cinfo.in_color_space   = components == 1 ? JCS_GRAYSCALE : JCS_RGB;

  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW row = const_cast<JSAMPROW>(source + static_cast<std::size_t>(cinfo.next_scanline) * stride);
    jpeg_write_scanlines(&cinfo, &row, 1);
  }

  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);

  std::vector<std::uint8_t> bytes(out.buffer, out.buffer + out.size);
  std::free(out.buffer);
  return bytes;
}

} // namespace trajectory::hashing
