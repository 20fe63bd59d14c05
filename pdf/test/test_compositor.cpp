/* File: test_compositor.cpp
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


// clang-format off
#include "pdf_defs.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/Pl_Flate.hh>
// clang-format on

#include <catch2/catch.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include "common_defs.hpp"
#include "raster_image.hpp"
#include "sign_error.hpp"
#include "stamp_compositor.hpp"

using namespace dtrsign::pdf;
using dtrsign::BytesVector;
using dtrsign::ErrorKind;
using dtrsign::SignError;

namespace {

RasterImage MakeImage(uint32_t width, uint32_t height, int channels,
                      unsigned char value = 0x80) {
  return RasterImage{width, height, channels,
                     BytesVector(static_cast<size_t>(width) * height *
                                   static_cast<size_t>(channels),
                                 value)};
}

const std::vector<BBox> kLetterPage{BBox{{0, 0}, {612, 792}}};

StampSpec DefaultSpec() {
  StampSpec spec;
  spec.rect = BBox{{100, 100}, {300, 200}};
  return spec;
}

std::optional<ErrorKind> ComposeErrorKind(const RasterImage &image,
                                          const StampSpec &spec) {
  try {
    auto res = StampCompositor::Compose(image, spec, kLetterPage);
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

BytesVector Inflate(const BytesVector &data) {
  Pl_Buffer buf("inflate result");
  Pl_Flate flate("inflate", &buf, Pl_Flate::a_inflate);
  flate.write(data.data(), data.size());
  flate.finish();
  auto res = buf.getBufferSharedPointer();
  return BytesVector(res->getBuffer(), res->getBuffer() + res->getSize());
}

} // namespace

TEST_CASE("ToRgba") {
  SECTION("gray") {
    const RasterImage res = ToRgba(RasterImage{2, 1, 1, {0x10, 0x20}});
    REQUIRE(res.channels == 4);
    REQUIRE(res.pixels ==
            BytesVector{0x10, 0x10, 0x10, 0xFF, 0x20, 0x20, 0x20, 0xFF});
  }
  SECTION("gray alpha") {
    const RasterImage res = ToRgba(RasterImage{1, 1, 2, {0x10, 0x40}});
    REQUIRE(res.pixels == BytesVector{0x10, 0x10, 0x10, 0x40});
  }
  SECTION("rgb gets opaque alpha") {
    const RasterImage res = ToRgba(RasterImage{1, 1, 3, {1, 2, 3}});
    REQUIRE(res.pixels == BytesVector{1, 2, 3, 0xFF});
  }
  SECTION("rgba is kept") {
    const RasterImage src{1, 1, 4, {1, 2, 3, 4}};
    REQUIRE(ToRgba(src).pixels == src.pixels);
  }
  SECTION("invalid") {
    REQUIRE_THROWS_AS(ToRgba(RasterImage{2, 2, 3, BytesVector(11, 0)}),
                      SignError);
    REQUIRE_THROWS_AS(ToRgba(MakeImage(2, 2, 5)), SignError);
    REQUIRE_THROWS_AS(ToRgba(RasterImage{}), SignError);
  }
}

TEST_CASE("ResampleAreaAverage") {
  SECTION("solid colour stays solid") {
    RasterImage src = ToRgba(MakeImage(40, 20, 3, 0x33));
    const RasterImage res = ResampleAreaAverage(src, 13, 7);
    REQUIRE(res.width == 13);
    REQUIRE(res.height == 7);
    REQUIRE(res.pixels.size() == 13 * 7 * 4);
    for (size_t i = 0; i < res.pixels.size(); i += 4) {
      REQUIRE(res.pixels[i] == 0x33);
      REQUIRE(res.pixels[i + 3] == 0xFF);
    }
  }
  SECTION("transparent pixels do not darken") {
    // opaque red and transparent black
    const RasterImage src{2, 1, 4, {0xFF, 0, 0, 0xFF, 0, 0, 0, 0}};
    const RasterImage res = ResampleAreaAverage(src, 1, 1);
    REQUIRE(res.pixels == BytesVector{0xFF, 0, 0, 0x80});
  }
  SECTION("box average") {
    const RasterImage src{4, 1, 4, {0,    0, 0, 0xFF, 0x40, 0, 0, 0xFF,
                                    0x80, 0, 0, 0xFF, 0xC0, 0, 0, 0xFF}};
    const RasterImage res = ResampleAreaAverage(src, 2, 1);
    REQUIRE(res.pixels[0] == 0x20);
    REQUIRE(res.pixels[4] == 0xA0);
  }
  SECTION("upscale") {
    const RasterImage src{1, 1, 4, {1, 2, 3, 4}};
    const RasterImage res = ResampleAreaAverage(src, 3, 2);
    for (size_t i = 0; i < res.pixels.size(); i += 4) {
      REQUIRE(res.pixels[i + 3] == 4);
      REQUIRE(res.pixels[i + 2] == 3);
    }
  }
  SECTION("invalid") {
    REQUIRE_THROWS_AS(ResampleAreaAverage(MakeImage(2, 2, 3), 1, 1),
                      SignError);
    REQUIRE_THROWS_AS(ResampleAreaAverage(MakeImage(2, 2, 4), 0, 1),
                      SignError);
  }
}

TEST_CASE("Encoders") {
  const BytesVector samples(30 * 20 * 3, 0x7F);
  SECTION("flate") {
    const BytesVector compressed = FlateCompress(samples);
    REQUIRE_FALSE(compressed.empty());
    REQUIRE(compressed.size() < samples.size());
    REQUIRE(Inflate(compressed) == samples);
  }
  SECTION("jpeg") {
    const BytesVector jpeg = JpegCompress(samples, 30, 20, 3, 75);
    REQUIRE(jpeg.size() > 4);
    REQUIRE(jpeg[0] == 0xFF);
    REQUIRE(jpeg[1] == 0xD8);
    REQUIRE(jpeg[jpeg.size() - 2] == 0xFF);
    REQUIRE(jpeg.back() == 0xD9);
    REQUIRE_THROWS_AS(JpegCompress(samples, 31, 20, 3, 75), SignError);
    REQUIRE_THROWS_AS(JpegCompress(samples, 30, 20, 2, 75), SignError);
  }
}

TEST_CASE("Compose single stamp") {
  const RasterImage image = MakeImage(200, 100, 3);
  SECTION("lossless") {
    auto res = StampCompositor::Compose(image, DefaultSpec(), kLetterPage);
    REQUIRE(res.size() == 1);
    const AppearanceStream &appearance = res.front();
    REQUIRE(appearance.page_index == 0);
    REQUIRE(appearance.rect.ToString() == "[ 100 100 300 200 ]");
    REQUIRE(appearance.image_size.x == Approx(180));
    REQUIRE(appearance.image_size.y == Approx(90));
    REQUIRE(appearance.image_offset.x == Approx(10));
    REQUIRE(appearance.image_offset.y == Approx(5));
    REQUIRE(appearance.ImageMatrix().toString() == "180 0 0 90 10 5");
    REQUIRE(appearance.image);
    const ImageObj &img = appearance.image->image;
    REQUIRE(img.width == 180);
    REQUIRE(img.height == 90);
    REQUIRE(img.colorspace == kDeviceRgb);
    REQUIRE(img.filter == std::string(kFlateDecode));
    REQUIRE(Inflate(img.data).size() == 180 * 90 * 3);
    const ImageObj &mask = appearance.image->smask;
    REQUIRE(mask.colorspace == kDeviceGray);
    REQUIRE(mask.filter == std::string(kFlateDecode));
    const BytesVector alpha = Inflate(mask.data);
    REQUIRE(alpha.size() == 180 * 90);
    REQUIRE(alpha.front() == 0xFF);
  }
  SECTION("lossy") {
    StampSpec spec = DefaultSpec();
    spec.quality = 80;
    auto res = StampCompositor::Compose(image, spec, kLetterPage);
    REQUIRE(res.front().image->image.filter == std::string(kDCTDecode));
    REQUIRE(res.front().image->smask.filter == std::string(kFlateDecode));
  }
  SECTION("aspect ratio is kept") {
    StampSpec spec = DefaultSpec();
    spec.rect = BBox{{0, 0}, {100, 100}};
    spec.scale_factor = 1;
    auto res = StampCompositor::Compose(image, spec, kLetterPage);
    REQUIRE(res.front().image_size.x == Approx(100));
    REQUIRE(res.front().image_size.y == Approx(50));
    REQUIRE(res.front().image_offset.x == Approx(0));
    REQUIRE(res.front().image_offset.y == Approx(25));
  }
  SECTION("tiny image") {
    StampSpec spec = DefaultSpec();
    spec.scale_factor = 0.01;
    auto res = StampCompositor::Compose(MakeImage(10, 10, 1), spec, kLetterPage);
    REQUIRE(res.front().image->image.width == 1);
    REQUIRE(res.front().image->image.height == 1);
  }
  SECTION("rect equal to the media box") {
    StampSpec spec = DefaultSpec();
    spec.rect = kLetterPage.front();
    REQUIRE_NOTHROW(StampCompositor::Compose(image, spec, kLetterPage));
  }
}

TEST_CASE("Compose validation") {
  const RasterImage image = MakeImage(20, 10, 4);
  StampSpec spec = DefaultSpec();
  SECTION("scale") {
    spec.scale_factor = 0;
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.scale_factor = 1.01;
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.scale_factor = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
  }
  SECTION("quality") {
    spec.quality = -1;
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.quality = 101;
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.quality = 0;
    REQUIRE_FALSE(ComposeErrorKind(image, spec));
  }
  SECTION("image") {
    REQUIRE(ComposeErrorKind(RasterImage{}, spec) ==
            ErrorKind::kInvalidParameter);
  }
  SECTION("degenerate rect") {
    spec.rect = BBox{{100, 100}, {100, 200}};
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.rect = BBox{{300, 100}, {100, 200}};
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.rect.right_top.x = std::numeric_limits<double>::infinity();
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
  }
  SECTION("page") {
    spec.page_index = 1;
    REQUIRE(ComposeErrorKind(image, spec) ==
            ErrorKind::kPlacementOutOfBounds);
    spec.page_index = -1;
    REQUIRE(ComposeErrorKind(image, spec) ==
            ErrorKind::kPlacementOutOfBounds);
  }
  SECTION("outside the page") {
    spec.rect = BBox{{500, 700}, {612.001, 792}};
    REQUIRE(ComposeErrorKind(image, spec) ==
            ErrorKind::kPlacementOutOfBounds);
    spec.rect = BBox{{-1, 0}, {100, 100}};
    REQUIRE(ComposeErrorKind(image, spec) ==
            ErrorKind::kPlacementOutOfBounds);
  }
}

TEST_CASE("Compose whole month") {
  const RasterImage image = MakeImage(200, 100, 3);
  StampSpec spec = DefaultSpec();
  spec.rect = BBox{{50, 0}, {250, 620}};
  spec.whole_month = GridSpec{31, 1, 31};
  SECTION("one cell per day") {
    auto res = StampCompositor::Compose(image, spec, kLetterPage);
    REQUIRE(res.size() == 31);
    REQUIRE(res.front().rect.ToString() == "[ 50 600 250 620 ]");
    REQUIRE(res.back().rect.ToString() == "[ 50 0 250 20 ]");
    for (const auto &appearance : res) {
      REQUIRE(appearance.image == res.front().image);
      REQUIRE(appearance.rect.Height() == Approx(20));
    }
  }
  SECTION("row major") {
    spec.whole_month = GridSpec{2, 2, 3};
    auto res = StampCompositor::Compose(image, spec, kLetterPage);
    REQUIRE(res.size() == 3);
    REQUIRE(res[0].rect.ToString() == "[ 50 310 150 620 ]");
    REQUIRE(res[1].rect.ToString() == "[ 150 310 250 620 ]");
    REQUIRE(res[2].rect.ToString() == "[ 50 0 150 310 ]");
  }
  SECTION("capacity") {
    spec.whole_month = GridSpec{31, 1, 32};
    REQUIRE(ComposeErrorKind(image, spec) ==
            ErrorKind::kGridCapacityExceeded);
    spec.whole_month = GridSpec{31, 1, 0};
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
    spec.whole_month = GridSpec{0, 1, 1};
    REQUIRE(ComposeErrorKind(image, spec) == ErrorKind::kInvalidParameter);
  }
}
