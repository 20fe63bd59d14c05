/* File: test_writer.cpp
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


#include <algorithm>
#include <catch2/catch.hpp>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <qpdf/Buffer.hh>
#include <string>
#include <vector>

#include "certificate_store.hpp"
#include "common_defs.hpp"
#include "fixture_pdf.hpp"
#include "fixture_pki.hpp"
#include "incremental_writer.hpp"
#include "pdf.hpp"
#include "raster_image.hpp"
#include "sign_error.hpp"
#include "signature_engine.hpp"
#include "stamp_compositor.hpp"

using namespace dtrsign::pdf;
using dtrsign::BytesVector;
using dtrsign::ErrorKind;
using dtrsign::RangesVector;
using dtrsign::SignError;
using dtrsign::crypto::CertificateBundle;
using dtrsign::crypto::CertificateStore;
using dtrsign::crypto::SignatureEngine;

namespace {

constexpr std::time_t kSigningTime = 1700000000;

SharedBytes Share(BytesVector data) {
  return std::make_shared<const BytesVector>(std::move(data));
}

CertificateBundle TestBundle() {
  dtrsign::test::PkiOptions opts;
  return CertificateStore::Load(dtrsign::test::MakePkcs12(opts), opts.password);
}

FieldRequest Request(const std::string &name) {
  FieldRequest request;
  request.field_name = name;
  request.reason = "Daily Time Record";
  request.signer_name = "Juan Dela Cruz";
  request.signing_time = kSigningTime;
  request.app_name = "dtrsign";
  return request;
}

std::vector<AppearanceStream> Stamp(int page_index = 0,
                                    BBox rect = BBox{{100, 100}, {300, 200}}) {
  const RasterImage image{20, 10, 3, BytesVector(20 * 10 * 3, 0x55)};
  StampSpec spec;
  spec.page_index = page_index;
  spec.rect = rect;
  const std::vector<BBox> media_boxes(4, BBox{{0, 0}, {612, 792}});
  return StampCompositor::Compose(image, spec, media_boxes);
}

FinalizedDocument SignReserved(const ReservedDocument &reserved,
                               const CertificateBundle &bundle) {
  const SignatureEngine engine;
  BytesVector digest = engine.Digest(*reserved.bytes, reserved.byteranges);
  BytesVector signature = engine.Sign(digest, bundle, kSigningTime);
  const DigestedDocument digested =
    IncrementalWriter::AttachDigest(reserved, std::move(digest));
  return IncrementalWriter::Finalize(digested, signature);
}

// every signature found in the document verifies against its byte ranges
size_t VerifyAll(const SharedBytes &data) {
  Pdf pdf(data);
  if (!pdf.FindSignatures()) {
    return 0;
  }
  for (unsigned int i = 0; i < pdf.GetSignaturesCount(); ++i) {
    if (!SignatureEngine::VerifyDetached(pdf.getRawSignature(i),
                                         pdf.getRawData(i))) {
      return 0;
    }
  }
  return pdf.GetSignaturesCount();
}

std::optional<ErrorKind>
ReserveErrorKind(const BytesVector &data, const FieldRequest &request,
                 const std::vector<AppearanceStream> &appearances) {
  try {
    auto res =
      IncrementalWriter::Reserve(BaseDocument{Share(data)}, request, appearances);
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

} // namespace

TEST_CASE("Reserve placeholder") {
  const BytesVector original = dtrsign::test::MakePdf();
  const ReservedDocument reserved = IncrementalWriter::Reserve(
    BaseDocument{Share(original)}, Request("OwnerSignature1"), Stamp());
  const BytesVector &res = *reserved.bytes;
  SECTION("appended after the original") {
    REQUIRE(res.size() > original.size());
    REQUIRE(dtrsign::test::StartsWith(res, original));
    REQUIRE(dtrsign::test::CountOccurrences(res, "%%EOF") == 2);
    REQUIRE(dtrsign::test::CountOccurrences(res, "/Prev ") == 1);
  }
  SECTION("byte ranges") {
    REQUIRE(reserved.byteranges.size() == 2);
    const auto &first = reserved.byteranges[0];
    const auto &second = reserved.byteranges[1];
    REQUIRE(first.first == 0);
    REQUIRE(res[first.second] == '<');
    REQUIRE(reserved.sig_hex_offset == first.second + 1);
    REQUIRE(reserved.sig_hex_length == 2 * kDefaultReservedBytes);
    REQUIRE(second.first == first.second + reserved.sig_hex_length + 2);
    REQUIRE(res[second.first - 1] == '>');
    REQUIRE(second.first + second.second == res.size());
    REQUIRE(reserved.field_name == "OwnerSignature1");
    for (size_t i = 0; i < reserved.sig_hex_length; ++i) {
      REQUIRE(res[reserved.sig_hex_offset + i] == '0');
    }
  }
  SECTION("qpdf reads the update") {
    Pdf pdf(reserved.bytes);
    REQUIRE(pdf.GetFieldNames() == std::vector<std::string>{"OwnerSignature1"});
    REQUIRE(pdf.FindSignatures());
    REQUIRE(pdf.GetSignaturesCount() == 1);
    REQUIRE(pdf.getSigByteRanges(0) == reserved.byteranges);
    REQUIRE(pdf.getSigFieldName(0) == "OwnerSignature1");
    auto page = pdf.GetPage(0);
    REQUIRE(page);
    REQUIRE(page->getKey("/Annots").getArrayNItems() == 1);
    auto acroform = pdf.GetAcroform();
    REQUIRE(acroform);
    REQUIRE(acroform->getKey("/SigFlags").getIntValue() == 3);
    auto widget = page->getKey("/Annots").getArrayItem(0);
    REQUIRE(widget.getKey("/Rect").unparse() == "[ 100 100 300 200 ]");
    auto form = widget.getKey("/AP").getKey("/N");
    REQUIRE(form.isStream());
    REQUIRE(form.getKey("/BBox").unparse() == "[ 0 0 200 100 ]");
    auto img = form.getKey("/Resources").getKey("/XObject").getKey("/Img");
    REQUIRE(img.isStream());
    REQUIRE(img.getKey("/Width").getIntValue() == 18);
    REQUIRE(img.getKey("/SMask").isStream());
    auto sig = widget.getKey("/V");
    REQUIRE(sig.getKey("/SubFilter").getName() == "/adbe.pkcs7.detached");
    REQUIRE(sig.getKey("/M").getUTF8Value() == "D:20231114221320Z");
    REQUIRE(sig.getKey("/Reason").getUTF8Value() == "Daily Time Record");
    REQUIRE(sig.getKey("/Name").getUTF8Value() == "Juan Dela Cruz");
  }
}

TEST_CASE("Stamp text") {
  const ReservedDocument reserved =
    IncrementalWriter::Reserve(BaseDocument{Share(dtrsign::test::MakePdf())},
                               Request("OwnerSignature1"), Stamp());
  Pdf pdf(reserved.bytes);
  auto form = pdf.GetPage(0)
                ->getKey("/Annots")
                .getArrayItem(0)
                .getKey("/AP")
                .getKey("/N");
  REQUIRE(form.isStream());
  const auto raw = form.getRawStreamData();
  const std::string content(reinterpret_cast<const char *>(raw->getBuffer()),
                            raw->getSize());
  SECTION("signer and date are drawn over the image") {
    REQUIRE(content.find("/Img Do") < content.find("BT\n"));
    REQUIRE(content.find("/F1 10 Tf") != std::string::npos);
    REQUIRE(content.find("(Signed by: Juan Dela Cruz) Tj") !=
            std::string::npos);
    REQUIRE(content.find("(Date Signed: 2023-11-14 22:13:20 UTC) Tj") !=
            std::string::npos);
    REQUIRE(content.substr(content.size() - 2) == "ET");
  }
  SECTION("base-14 font resource") {
    auto font = form.getKey("/Resources").getKey("/Font").getKey("/F1");
    REQUIRE(font.isDictionary());
    REQUIRE(font.getKey("/Subtype").getName() == "/Type1");
    REQUIRE(font.getKey("/BaseFont").getName() == "/Helvetica");
    REQUIRE_FALSE(font.hasKey("/FontDescriptor"));
  }
}

TEST_CASE("Finalize") {
  const auto bundle = TestBundle();
  const BytesVector original = dtrsign::test::MakePdf();
  const ReservedDocument reserved = IncrementalWriter::Reserve(
    BaseDocument{Share(original)}, Request("OwnerSignature1"), Stamp());
  SECTION("signature verifies") {
    const FinalizedDocument finalized = SignReserved(reserved, bundle);
    REQUIRE(finalized.bytes->size() == reserved.bytes->size());
    REQUIRE(finalized.field_name == "OwnerSignature1");
    REQUIRE(VerifyAll(finalized.bytes) == 1);
    // bytes outside the span are untouched
    const auto &range = reserved.byteranges;
    REQUIRE(std::equal(reserved.bytes->cbegin(),
                       reserved.bytes->cbegin() +
                         static_cast<long>(range[0].second),
                       finalized.bytes->cbegin()));
    REQUIRE(std::equal(reserved.bytes->cbegin() +
                         static_cast<long>(range[1].first),
                       reserved.bytes->cend(),
                       finalized.bytes->cbegin() +
                         static_cast<long>(range[1].first)));
  }
  SECTION("signature too large") {
    FieldRequest request = Request("OwnerSignature1");
    request.reserved_bytes = 16;
    const ReservedDocument small = IncrementalWriter::Reserve(
      BaseDocument{Share(original)}, request, Stamp());
    const DigestedDocument digested =
      IncrementalWriter::AttachDigest(small, BytesVector(32, 1));
    REQUIRE_NOTHROW(IncrementalWriter::Finalize(digested, BytesVector(16, 1)));
    try {
      auto res = IncrementalWriter::Finalize(digested, BytesVector(17, 1));
      FAIL("exception expected");
    } catch (const SignError &ex) {
      REQUIRE(ex.kind() == ErrorKind::kReservedSpaceExhausted);
    }
  }
  SECTION("empty values") {
    REQUIRE_THROWS_AS(IncrementalWriter::AttachDigest(reserved, {}),
                      SignError);
    const DigestedDocument digested =
      IncrementalWriter::AttachDigest(reserved, BytesVector(32, 1));
    try {
      auto res = IncrementalWriter::Finalize(digested, {});
      FAIL("exception expected");
    } catch (const SignError &ex) {
      REQUIRE(ex.kind() == ErrorKind::kSigning);
    }
  }
}

TEST_CASE("Chained signatures") {
  const auto bundle = TestBundle();
  dtrsign::test::PdfOptions opts;
  SECTION("classic xref") {}
  SECTION("xref stream") { opts.xref_stream = true; }
  SECTION("existing acroform") { opts.with_acroform = true; }
  const BytesVector original = dtrsign::test::MakePdf(opts);
  const FinalizedDocument first = SignReserved(
    IncrementalWriter::Reserve(BaseDocument{Share(original)},
                               Request("OwnerSignature1"), Stamp()),
    bundle);
  const FinalizedDocument second = SignReserved(
    IncrementalWriter::Reserve(first.AsBase(), Request("InchargeSignature1"),
                               Stamp(0, BBox{{100, 300}, {300, 400}})),
    bundle);
  REQUIRE(dtrsign::test::StartsWith(*second.bytes, *first.bytes));
  REQUIRE(VerifyAll(second.bytes) == 2);
  Pdf pdf(second.bytes);
  REQUIRE(pdf.HasXRefStream() == opts.xref_stream);
  REQUIRE(pdf.GetFieldNames() ==
          std::vector<std::string>{"OwnerSignature1", "InchargeSignature1"});
  REQUIRE(pdf.GetPage(0)->getKey("/Annots").getArrayNItems() == 2);
  REQUIRE(pdf.FindSignatures());
  // the first signature covers exactly the first revision
  const RangesVector first_ranges = pdf.getSigByteRanges(0);
  REQUIRE(first_ranges[1].first + first_ranges[1].second ==
          first.bytes->size());
  if (opts.with_acroform) {
    REQUIRE(pdf.GetAcroform()->hasKey("/DA"));
  }
}

TEST_CASE("Unsigned field is signed in place") {
  const auto bundle = TestBundle();
  dtrsign::test::PdfOptions opts;
  opts.unsigned_field = "InchargeSignature1";
  const SharedBytes original = Share(dtrsign::test::MakePdf(opts));
  {
    const Pdf pdf(original);
    REQUIRE(pdf.GetUnsignedFieldNames() ==
            std::vector<std::string>{"InchargeSignature1"});
    REQUIRE(pdf.GetUnsignedField("InchargeSignature1"));
    REQUIRE_FALSE(pdf.GetUnsignedField("OwnerSignature1"));
  }
  SECTION("one appearance") {
    const FinalizedDocument finalized = SignReserved(
      IncrementalWriter::Reserve(BaseDocument{original},
                                 Request("InchargeSignature1"), Stamp()),
      bundle);
    REQUIRE(VerifyAll(finalized.bytes) == 1);
    Pdf pdf(finalized.bytes);
    REQUIRE(pdf.GetFieldNames() ==
            std::vector<std::string>{"InchargeSignature1"});
    REQUIRE(pdf.GetUnsignedFieldNames().empty());
    auto fields = pdf.GetAcroform()->getKey("/Fields");
    REQUIRE(fields.getArrayNItems() == 1);
    auto field = fields.getArrayItem(0);
    REQUIRE(field.getObjectID() == 5);
    REQUIRE(field.getKey("/V").getKey("/Type").getName() == "/Sig");
    REQUIRE(field.getKey("/AP").getKey("/N").isStream());
    REQUIRE(field.getKey("/Rect").unparse() == "[ 100 100 300 200 ]");
    auto annots = pdf.GetPage(0)->getKey("/Annots");
    REQUIRE(annots.getArrayNItems() == 1);
    REQUIRE(annots.getArrayItem(0).getObjectID() == 5);
    REQUIRE(pdf.FindSignatures());
    REQUIRE(pdf.getSigFieldName(0) == "InchargeSignature1");
    // signed now, can not be signed again
    REQUIRE(ReserveErrorKind(*finalized.bytes, Request("InchargeSignature1"),
                             Stamp()) == ErrorKind::kInvalidParameter);
  }
  SECTION("several appearances replace the widget") {
    std::vector<AppearanceStream> appearances = Stamp();
    appearances.push_back(Stamp(0, BBox{{100, 300}, {300, 400}}).front());
    const FinalizedDocument finalized = SignReserved(
      IncrementalWriter::Reserve(BaseDocument{original},
                                 Request("InchargeSignature1"), appearances),
      bundle);
    REQUIRE(VerifyAll(finalized.bytes) == 1);
    Pdf pdf(finalized.bytes);
    auto field = pdf.GetAcroform()->getKey("/Fields").getArrayItem(0);
    REQUIRE(field.getObjectID() == 5);
    REQUIRE(field.getKey("/Kids").getArrayNItems() == 2);
    REQUIRE_FALSE(field.hasKey("/Rect"));
    auto annots = pdf.GetPage(0)->getKey("/Annots");
    REQUIRE(annots.getArrayNItems() == 2);
    for (int i = 0; i < annots.getArrayNItems(); ++i) {
      REQUIRE(annots.getArrayItem(i).getObjectID() != 5);
      REQUIRE(annots.getArrayItem(i).getKey("/Parent").getObjectID() == 5);
    }
  }
}

TEST_CASE("Several appearances") {
  const auto bundle = TestBundle();
  dtrsign::test::PdfOptions opts;
  opts.page_count = 2;
  std::vector<AppearanceStream> appearances = Stamp(0);
  auto other_page = Stamp(1, BBox{{360, 105}, {560, 165}});
  // one picture for all widgets
  other_page.front().image = appearances.front().image;
  appearances.push_back(other_page.front());
  appearances.push_back(Stamp(1).front());
  const FinalizedDocument finalized = SignReserved(
    IncrementalWriter::Reserve(BaseDocument{Share(dtrsign::test::MakePdf(opts))},
                               Request("OwnerSignature1"), appearances),
    bundle);
  REQUIRE(VerifyAll(finalized.bytes) == 1);
  Pdf pdf(finalized.bytes);
  REQUIRE(pdf.GetPage(0)->getKey("/Annots").getArrayNItems() == 1);
  REQUIRE(pdf.GetPage(1)->getKey("/Annots").getArrayNItems() == 2);
  auto field = pdf.GetAcroform()->getKey("/Fields").getArrayItem(0);
  REQUIRE(field.getKey("/Kids").getArrayNItems() == 3);
  auto kid = field.getKey("/Kids").getArrayItem(1);
  REQUIRE(kid.getKey("/Parent").getObjectID() == field.getObjectID());
  REQUIRE(kid.getKey("/P").getObjectID() ==
          pdf.GetPage(1)->getObjectID());
  // two distinct pictures, each with a mask
  REQUIRE(dtrsign::test::CountOccurrences(*finalized.bytes, "/Subtype /Image") ==
          4);
}

TEST_CASE("Reserve errors") {
  const BytesVector original = dtrsign::test::MakePdf();
  SECTION("document") {
    const std::string garbage = "%PDF-1.7\nnot really a pdf\n";
    REQUIRE(ReserveErrorKind(BytesVector(garbage.cbegin(), garbage.cend()),
                             Request("OwnerSignature1"), Stamp()) ==
            ErrorKind::kDocumentStructure);
  }
  SECTION("parameters") {
    REQUIRE(ReserveErrorKind(original, Request(""), Stamp()) ==
            ErrorKind::kInvalidParameter);
    REQUIRE(ReserveErrorKind(original, Request("OwnerSignature1"), {}) ==
            ErrorKind::kInvalidParameter);
    FieldRequest request = Request("OwnerSignature1");
    request.reserved_bytes = 0;
    REQUIRE(ReserveErrorKind(original, request, Stamp()) ==
            ErrorKind::kInvalidParameter);
  }
  SECTION("page") {
    REQUIRE(ReserveErrorKind(original, Request("OwnerSignature1"), Stamp(3)) ==
            ErrorKind::kPlacementOutOfBounds);
  }
  SECTION("field exists") {
    const ReservedDocument reserved = IncrementalWriter::Reserve(
      BaseDocument{Share(original)}, Request("OwnerSignature1"), Stamp());
    REQUIRE(ReserveErrorKind(*reserved.bytes, Request("OwnerSignature1"),
                             Stamp()) == ErrorKind::kInvalidParameter);
  }
}
