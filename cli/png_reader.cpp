/* File: png_reader.cpp
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


#include "png_reader.hpp"

#include <png.h>

#include <cstring>
#include <string>

#include "logger_utils.hpp"
#include "pdf_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::cli {

namespace {

// larger pictures make no sense for a signature stamp
constexpr png_uint_32 kMaxPngSide = 10000;

}  // namespace

pdf::RasterImage DecodePng(const BytesVector& data) {
  const std::string func_name = "[DecodePng] ";
  if (data.empty()) {
    throw SignError(ErrorKind::kInvalidParameter, func_name + "empty image");
  }
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  if (png_image_begin_read_from_memory(&image, data.data(), data.size()) ==
      0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "not a PNG image: " + image.message);
  }
  if (image.width == 0 || image.height == 0 || image.width > kMaxPngSide ||
      image.height > kMaxPngSide) {
    png_image_free(&image);
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "unsupported image size " +
                      std::to_string(image.width) + "x" +
                      std::to_string(image.height));
  }
  image.format = PNG_FORMAT_RGBA;
  pdf::RasterImage res;
  res.width = image.width;
  res.height = image.height;
  res.channels = 4;
  res.pixels.resize(PNG_IMAGE_SIZE(image), 0);
  if (png_image_finish_read(&image, nullptr, res.pixels.data(), 0, nullptr) ==
      0) {
    const std::string msg = image.message;
    png_image_free(&image);
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "decode failed: " + msg);
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{}{}x{} pixels", func_name, res.width, res.height);
  }
  return res;
}

pdf::RasterImage ReadPngFile(const std::string& path) {
  auto data = pdf::FileToVector(path);
  if (!data) {
    throw SignError(ErrorKind::kInvalidParameter,
                    "[ReadPngFile] can not read " + path);
  }
  return DecodePng(data.value());
}

}  // namespace dtrsign::cli
