/* File: test_common.cpp
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
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "common_defs.hpp"
#include "fixture_pdf.hpp"
#include "pdf.hpp"
#include "pdf_utils.hpp"
#include "sign_error.hpp"

#ifndef TEST_DIR
#define TEST_DIR "/tmp/"
#endif

using namespace dtrsign::pdf;
using dtrsign::BytesVector;
using dtrsign::ErrorKind;
using dtrsign::SignError;

namespace {

SharedBytes Share(BytesVector data) {
  return std::make_shared<const BytesVector>(std::move(data));
}

std::optional<ErrorKind> OpenErrorKind(BytesVector data) {
  try {
    const Pdf pdf(Share(std::move(data)));
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

} // namespace

TEST_CASE("Test reading file") {
  const std::string kTestDir(TEST_DIR);
  SECTION("Test FileToVector") {
    constexpr const char *const kTestFile = "test_file1";
    const std::string kFile1full(kTestDir + kTestFile);
    REQUIRE(FileToVector("") == std::nullopt);
    REQUIRE(FileToVector("/var/sadl/ff") == std::nullopt);
    REQUIRE(FileToVector(kTestDir) == std::nullopt);
    std::ofstream testfile(kFile1full, std::ios::out | std::ios::trunc);
    REQUIRE(testfile.is_open());
    auto res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->empty()));
    for (int i = 0; i < 1024; ++i) {
      testfile.write("\1", 1);
    }
    testfile.flush();
    res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->size() == 1024));
    size_t counter = 0;
    for (size_t i = 0; i < res->size(); ++i) {
      counter += res.value()[i];
    }
    REQUIRE(counter == res->size());
    testfile.close();
    std::filesystem::remove(kFile1full);
  }
}

TEST_CASE("DoubleToString") {
  REQUIRE(DoubleToString10(0) == "0");
  REQUIRE(DoubleToString10(-0.000000) == "0");
  REQUIRE(DoubleToString10(-0.0000000001) == "-0.0000000001");
  REQUIRE(DoubleToString10(-0.00000000001000100000) == "0");
  REQUIRE(DoubleToString10(612) == "612");
  REQUIRE(DoubleToString10(0.9) == "0.9");
  const BBox bbox{{0, 0.000003434121212}, {255, 100.124324454664654}};
  REQUIRE(bbox.ToString() == "[ 0 0.0000034341 255 100.1243244547 ]");
}

TEST_CASE("BBox contains") {
  const BBox page{{0, 0}, {612, 792}};
  REQUIRE(page.Contains(page));
  REQUIRE(page.Contains(BBox{{50, 105}, {250, 165}}));
  REQUIRE_FALSE(page.Contains(BBox{{-0.01, 0}, {100, 100}}));
  REQUIRE_FALSE(page.Contains(BBox{{500, 700}, {612.5, 792}}));
  REQUIRE(BBox{{50, 105}, {250, 165}}.Width() == 200);
  REQUIRE(BBox{{50, 105}, {250, 165}}.Height() == 60);
}

TEST_CASE("FindXrefOffset") {
  SECTION("classic") {
    const BytesVector doc = dtrsign::test::MakePdf();
    auto res = FindXrefOffset(doc);
    REQUIRE(res);
    const std::string tail(doc.cbegin() + std::stol(res.value()),
                           doc.cbegin() + std::stol(res.value()) + 5);
    REQUIRE(tail == "xref\n");
  }
  SECTION("the last one wins") {
    const std::string src =
      "startxref\n100\n%%EOF\nsome update\nstartxref\r\n2345\n%%EOF\n";
    auto res = FindXrefOffset(BytesVector(src.cbegin(), src.cend()));
    REQUIRE(res);
    REQUIRE(res.value() == "2345");
  }
  SECTION("missing") {
    REQUIRE_FALSE(FindXrefOffset({}));
    const std::string src = "%PDF-1.7\ntrailer\n<< >>\n%%EOF";
    REQUIRE_FALSE(FindXrefOffset(BytesVector(src.cbegin(), src.cend())));
    const std::string src2 = "%PDF-1.7\nstartxref\n%%EOF";
    REQUIRE_FALSE(FindXrefOffset(BytesVector(src2.cbegin(), src2.cend())));
  }
}

TEST_CASE("Xref table") {
  SECTION("entry is 20 bytes") {
    const XRefEntry entry{ObjRawId{7, 0}, 1234, 0};
    REQUIRE(entry.ToString() == "0000001234 00000 n \n");
    REQUIRE(entry.ToString().size() == 20);
  }
  SECTION("subsections") {
    const std::vector<XRefEntry> entries{{ObjRawId{12, 0}, 300, 0},
                                         {ObjRawId{4, 0}, 100, 0},
                                         {ObjRawId{11, 0}, 200, 0}};
    const std::string expected = "xref\n"
                                 "4 1\n"
                                 "0000000100 00000 n \n"
                                 "11 2\n"
                                 "0000000200 00000 n \n"
                                 "0000000300 00000 n \n";
    REQUIRE(BuildXrefRawTable(entries) == expected);
  }
  SECTION("stream sections") {
    std::vector<XRefEntry> entries{{ObjRawId{6, 0}, 10, 0},
                                   {ObjRawId{3, 0}, 20, 0},
                                   {ObjRawId{7, 0}, 30, 0},
                                   {ObjRawId{8, 0}, 40, 0}};
    auto sections = BuildXRefStreamSections(entries);
    REQUIRE(sections.size() == 2);
    REQUIRE(sections[0] == std::pair<int, int>{3, 1});
    REQUIRE(sections[1] == std::pair<int, int>{6, 3});
    REQUIRE(entries.front().id.id == 3);
    std::vector<XRefEntry> dup{{ObjRawId{6, 0}, 10, 0},
                               {ObjRawId{6, 0}, 20, 0}};
    REQUIRE_THROWS_AS(BuildXRefStreamSections(dup), SignError);
  }
}

TEST_CASE("Text encoding") {
  REQUIRE(ByteVectorToHexString({0x00, 0x0F, 0xAB, 0xFF}) == "000fabff");
  REQUIRE(ToPdfTextString("OwnerSignature1") == "(OwnerSignature1)");
  // non latin text is written as UTF-16BE with BOM
  const std::string cyrillic = ToPdfTextString("\xD0\x98\xD0\xB2");
  REQUIRE(cyrillic.rfind("<feff", 0) == 0);
  REQUIRE(TimeToPdfDate(0) == "19700101000000Z");
  REQUIRE(TimeToPdfDate(1700000000) == "20231114221320Z");
}

TEST_CASE("Open document") {
  SECTION("classic xref") {
    const Pdf pdf(Share(dtrsign::test::MakePdf({2})));
    REQUIRE(pdf.GetPagesCount() == 2);
    REQUIRE_FALSE(pdf.HasXRefStream());
    REQUIRE(pdf.GetLastObjID().id == 5);
    REQUIRE(pdf.GetRoot());
    REQUIRE_FALSE(pdf.GetAcroform());
    REQUIRE(pdf.GetFieldNames().empty());
    REQUIRE(pdf.GetPage(1));
    REQUIRE_FALSE(pdf.GetPage(2));
    REQUIRE_FALSE(pdf.GetPage(-1));
  }
  SECTION("xref stream") {
    dtrsign::test::PdfOptions opts;
    opts.xref_stream = true;
    const Pdf pdf(Share(dtrsign::test::MakePdf(opts)));
    REQUIRE(pdf.HasXRefStream());
    // the xref stream object takes the last number
    REQUIRE(pdf.GetLastObjID().id == 5);
  }
  SECTION("media boxes") {
    dtrsign::test::PdfOptions opts;
    opts.page_count = 3;
    opts.width = 595;
    opts.height = 842;
    opts.inherited_media_box = true;
    const Pdf pdf(Share(dtrsign::test::MakePdf(opts)));
    auto boxes = pdf.GetMediaBoxes();
    REQUIRE(boxes.size() == 3);
    for (const auto &box : boxes) {
      REQUIRE(box.ToString() == "[ 0 0 595 842 ]");
    }
  }
  SECTION("empty acroform") {
    dtrsign::test::PdfOptions opts;
    opts.with_acroform = true;
    Pdf pdf(Share(dtrsign::test::MakePdf(opts)));
    REQUIRE(pdf.GetAcroform());
    REQUIRE(pdf.GetFieldNames().empty());
    REQUIRE_FALSE(pdf.FindSignatures());
    REQUIRE(pdf.GetSignaturesCount() == 0);
    REQUIRE(pdf.getRawSignature(0).empty());
    REQUIRE(pdf.getRawData(0).empty());
  }
}

TEST_CASE("Broken documents") {
  SECTION("empty") {
    REQUIRE(OpenErrorKind({}) == ErrorKind::kDocumentStructure);
    REQUIRE_THROWS_AS(Pdf(nullptr), SignError);
  }
  SECTION("no header") {
    const std::string src = "Hello world\nstartxref\n0\n%%EOF\n";
    REQUIRE(OpenErrorKind(BytesVector(src.cbegin(), src.cend())) ==
            ErrorKind::kDocumentStructure);
  }
  SECTION("no startxref") {
    BytesVector doc = dtrsign::test::MakePdf();
    const std::string tag = "startxref";
    auto it = std::search(doc.begin(), doc.end(), tag.cbegin(), tag.cend());
    REQUIRE(it != doc.end());
    doc.erase(it, doc.end());
    REQUIRE(OpenErrorKind(doc) == ErrorKind::kDocumentStructure);
  }
  SECTION("wrong xref offset") {
    BytesVector doc = dtrsign::test::MakePdf();
    auto offset = FindXrefOffset(doc);
    REQUIRE(offset);
    const std::string tag = "startxref\n" + offset.value();
    auto it = std::search(doc.begin(), doc.end(), tag.cbegin(), tag.cend());
    REQUIRE(it != doc.end());
    // point into the middle of the catalog
    const std::string broken = "startxref\n" +
                               std::string(offset->size() - 2, '0') + "20";
    std::copy(broken.cbegin(), broken.cend(), it);
    REQUIRE(OpenErrorKind(doc) == ErrorKind::kDocumentStructure);
  }
}
