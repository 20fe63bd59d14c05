/* File: raster_image.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/


#include "raster_image.hpp"

// clang-format off
#include "pdf_defs.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/Pl_Flate.hh>
// clang-format on

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <memory>
#include <string>
#include <vector>

#include "logger_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::pdf {

namespace {

constexpr int kRgbaChannels = 4;

struct Contribution {
  uint32_t src = 0;
  double weight = 0;
};

// for each destination index - the source pixels it covers and their share
std::vector<std::vector<Contribution>> AxisWeights(uint32_t src_len,
                                                   uint32_t dst_len) {
  std::vector<std::vector<Contribution>> res(dst_len);
  const double ratio =
    static_cast<double>(src_len) / static_cast<double>(dst_len);
  for (uint32_t dst = 0; dst < dst_len; ++dst) {
    const double start = dst * ratio;
    const double end = (dst + 1) * ratio;
    const auto first = static_cast<uint32_t>(std::floor(start));
    for (uint32_t src = first; src < src_len && src < end; ++src) {
      const double overlap =
        std::min(end, static_cast<double>(src) + 1) -
        std::max(start, static_cast<double>(src));
      if (overlap > 0) {
        res[dst].push_back(Contribution{src, overlap / ratio});
      }
    }
  }
  return res;
}

unsigned char ClampToByte(double val) noexcept {
  return static_cast<unsigned char>(std::clamp(std::lround(val), 0L, 255L));
}

struct JpegErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf jump_buf;
  char message[JMSG_LENGTH_MAX]; // NOLINT
};

void JpegErrorExit(j_common_ptr cinfo) {
  auto *err = reinterpret_cast<JpegErrorManager *>(cinfo->err); // NOLINT
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump_buf, 1); // NOLINT
}

} // namespace

RasterImage ToRgba(const RasterImage &src) {
  const std::string func_name = "[ToRgba] ";
  if (src.channels < 1 || src.channels > kRgbaChannels) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "unsupported number of channels " +
                      std::to_string(src.channels));
  }
  const uint64_t pixel_count = static_cast<uint64_t>(src.width) * src.height;
  if (pixel_count == 0 ||
      src.pixels.size() != pixel_count * static_cast<uint64_t>(src.channels)) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "pixel buffer does not match " +
                      std::to_string(src.width) + "x" +
                      std::to_string(src.height));
  }
  if (src.channels == kRgbaChannels) {
    return src;
  }
  RasterImage res{src.width, src.height, kRgbaChannels, {}};
  res.pixels.reserve(pixel_count * kRgbaChannels);
  const auto channels = static_cast<size_t>(src.channels);
  for (size_t i = 0; i < pixel_count; ++i) {
    const unsigned char *pix = src.pixels.data() + i * channels;
    switch (src.channels) {
    case 1:
      res.pixels.insert(res.pixels.end(), {pix[0], pix[0], pix[0], 0xFF});
      break;
    case 2:
      res.pixels.insert(res.pixels.end(), {pix[0], pix[0], pix[0], pix[1]});
      break;
    default:
      res.pixels.insert(res.pixels.end(), {pix[0], pix[1], pix[2], 0xFF});
      break;
    }
  }
  return res;
}

RasterImage ResampleAreaAverage(const RasterImage &rgba, uint32_t dst_width,
                                uint32_t dst_height) {
  const std::string func_name = "[ResampleAreaAverage] ";
  if (rgba.channels != kRgbaChannels || rgba.Empty() ||
      rgba.pixels.size() != static_cast<uint64_t>(rgba.width) * rgba.height *
                              kRgbaChannels) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "RGBA image expected");
  }
  if (dst_width == 0 || dst_height == 0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "empty destination size");
  }
  if (dst_width == rgba.width && dst_height == rgba.height) {
    return rgba;
  }
  const auto weights_x = AxisWeights(rgba.width, dst_width);
  const auto weights_y = AxisWeights(rgba.height, dst_height);
  RasterImage res{dst_width, dst_height, kRgbaChannels, {}};
  res.pixels.resize(static_cast<size_t>(dst_width) * dst_height *
                    kRgbaChannels);
  const size_t src_stride = static_cast<size_t>(rgba.width) * kRgbaChannels;
  for (uint32_t dst_y = 0; dst_y < dst_height; ++dst_y) {
    for (uint32_t dst_x = 0; dst_x < dst_width; ++dst_x) {
      double acc_alpha = 0;
      double acc_red = 0;
      double acc_green = 0;
      double acc_blue = 0;
      for (const auto &contrib_y : weights_y[dst_y]) {
        const unsigned char *row =
          rgba.pixels.data() + contrib_y.src * src_stride;
        for (const auto &contrib_x : weights_x[dst_x]) {
          const unsigned char *pix =
            row + static_cast<size_t>(contrib_x.src) * kRgbaChannels;
          // premultiplied by alpha
          const double weighted_alpha =
            contrib_y.weight * contrib_x.weight * pix[3];
          acc_alpha += weighted_alpha;
          acc_red += weighted_alpha * pix[0];
          acc_green += weighted_alpha * pix[1];
          acc_blue += weighted_alpha * pix[2];
        }
      }
      unsigned char *out =
        res.pixels.data() +
        (static_cast<size_t>(dst_y) * dst_width + dst_x) * kRgbaChannels;
      if (acc_alpha > 0) {
        out[0] = ClampToByte(acc_red / acc_alpha);
        out[1] = ClampToByte(acc_green / acc_alpha);
        out[2] = ClampToByte(acc_blue / acc_alpha);
      }
      out[3] = ClampToByte(acc_alpha);
    }
  }
  return res;
}

BytesVector ExtractRgb(const RasterImage &rgba) {
  BytesVector res;
  res.reserve(rgba.pixels.size() / kRgbaChannels * 3);
  for (size_t i = 0; i + kRgbaChannels <= rgba.pixels.size();
       i += kRgbaChannels) {
    res.insert(res.end(), rgba.pixels.cbegin() + static_cast<long>(i),
               rgba.pixels.cbegin() + static_cast<long>(i) + 3);
  }
  return res;
}

BytesVector ExtractAlpha(const RasterImage &rgba) {
  BytesVector res;
  res.reserve(rgba.pixels.size() / kRgbaChannels);
  for (size_t i = 3; i < rgba.pixels.size(); i += kRgbaChannels) {
    res.push_back(rgba.pixels[i]);
  }
  return res;
}

BytesVector FlateCompress(const BytesVector &data) {
  Pl_Buffer buf("flate result");
  Pl_Flate flate("flate compress", &buf, Pl_Flate::a_deflate);
  flate.write(data.data(), data.size());
  flate.finish();
  std::shared_ptr<Buffer> compressed = buf.getBufferSharedPointer();
  BytesVector res;
  if (compressed && compressed->getSize() > 0) {
    res.assign(compressed->getBuffer(),
               compressed->getBuffer() + compressed->getSize());
  }
  return res;
}

BytesVector JpegCompress(const BytesVector &samples, uint32_t width,
                         uint32_t height, int components, int quality) {
  const std::string func_name = "[JpegCompress] ";
  if ((components != 1 && components != 3) || width == 0 || height == 0 ||
      samples.size() != static_cast<uint64_t>(width) * height *
                          static_cast<uint64_t>(components)) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "samples do not match the image size");
  }
  jpeg_compress_struct cinfo{};
  JpegErrorManager jerr{};
  unsigned char *out_buf = nullptr;
  unsigned long out_size = 0; // NOLINT(google-runtime-int)
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = JpegErrorExit;
  if (setjmp(jerr.jump_buf) != 0) { // NOLINT
    jpeg_destroy_compress(&cinfo);
    std::free(out_buf); // NOLINT
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "libjpeg: " + jerr.message);
  }
  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &out_buf, &out_size);
  cinfo.image_width = width;
  cinfo.image_height = height;
  cinfo.input_components = components;
  cinfo.in_color_space = components == 3 ? JCS_RGB : JCS_GRAYSCALE;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, std::clamp(quality, 0, 100), TRUE);
  jpeg_start_compress(&cinfo, TRUE);
  const size_t stride = static_cast<size_t>(width) * components;
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW row = const_cast<unsigned char *>( // NOLINT
      samples.data() + cinfo.next_scanline * stride);
    jpeg_write_scanlines(&cinfo, &row, 1);
  }
  jpeg_finish_compress(&cinfo);
  BytesVector res(out_buf, out_buf + out_size);
  jpeg_destroy_compress(&cinfo);
  std::free(out_buf); // NOLINT
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{}{}x{} quality {} -> {} bytes", func_name, width, height,
                  quality, res.size());
  }
  return res;
}

} // namespace dtrsign::pdf
