/* File: pdf.hpp
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


#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <qpdf/QPDF.hh>
#include <set>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace dtrsign::pdf {

struct SigInstance {
  PtrPdfObj signature;
  std::string field_name;
  RangesVector bytes_ranges;
};

/**
 * @brief Read access to a pdf document held in memory
 * @details the buffer is shared, the document never modifies it
 */
class Pdf {
public:
  /**
   * @brief Parse a document
   * @param data the whole file
   * @throws SignError(kDocumentStructure) if the file can not be parsed or is
   * encrypted
   */
  explicit Pdf(SharedBytes data);

  Pdf(const Pdf &) = delete;
  Pdf(Pdf &&) = delete;
  Pdf &operator=(const Pdf &) = delete;
  Pdf &operator=(Pdf &&) = delete;
  ~Pdf() = default;

  /**
   * @brief true if some Signatures found
   *
   * @return true
   * @return false
   */
  [[nodiscard]] bool FindSignatures() noexcept;

  /**
   * @brief Get the Raw Signature data
   * @return std::vector<unsigned char>
   */
  [[nodiscard]] BytesVector getRawSignature(unsigned int sig_index) noexcept;

  /**
   * @brief Get the byte ranges for the specified signature.
   * @param sig_index Signature index
   * @return RangesVector
   */
  [[nodiscard]] RangesVector getSigByteRanges(
    unsigned int sig_index) const noexcept;

  /**
   * @brief Get the Raw Data object excluding the signature value
   * @return std::vector<unsigned char>
   */
  [[nodiscard]] BytesVector getRawData(unsigned int sig_index) const noexcept;

  [[nodiscard]] std::string getSigFieldName(unsigned int sig_index) const;

  [[nodiscard]] size_t GetSignaturesCount() const noexcept {
    return signatures_.size();
  };

  /**
   * @brief Get the Last Object ID
   * @details the trailer /Size is taken into account, so free entries are
   * never reused
   * @return ObjRawId
   */
  [[nodiscard]] ObjRawId GetLastObjID() const;

  /**
   * @brief check is there /Acroform in document calalog
   * @return shared pointer to acroform
   */
  [[nodiscard]] PtrPdfObjShared GetAcroform() const noexcept;

  [[nodiscard]] PtrPdfObjShared GetPage(int page_index) const noexcept;

  [[nodiscard]] PtrPdfObjShared GetRoot() const noexcept;

  [[nodiscard]] PtrPdfObjShared GetTrailer() const noexcept;

  [[nodiscard]] size_t GetPagesCount() const;

  /**
   * @brief MediaBox of every page
   * @throws SignError(kDocumentStructure) if some page has no valid MediaBox
   */
  [[nodiscard]] std::vector<BBox> GetMediaBoxes() const;

  /// @brief fully qualified names of all form fields
  [[nodiscard]] std::vector<std::string> GetFieldNames() const;

  /// @brief names of the signature fields placed but not signed yet
  [[nodiscard]] std::vector<std::string> GetUnsignedFieldNames() const;

  /**
   * @brief Find a signature field without /V
   * @param full_name fully qualified field name
   * @return PtrPdfObjShared the field or nullptr
   */
  [[nodiscard]] PtrPdfObjShared
  GetUnsignedField(const std::string &full_name) const;

  /// @brief indexes of the pages listing any of the objects in /Annots
  [[nodiscard]] std::vector<int>
  FindPagesWithAnnots(const std::set<ObjRawId> &annot_ids) const;

  /// @brief true if the last cross-reference section is a stream
  [[nodiscard]] bool HasXRefStream() const noexcept;

  [[nodiscard]] const SharedBytes &data() const noexcept { return data_; }

  // for tests
  [[nodiscard]] const std::unique_ptr<QPDF> &getQPDF() const & noexcept {
    return qpdf_;
  }

private:
  /**
   * @brief Get the Signature Value object
   * @return PtrPdfObj
   */
  PtrPdfObj GetSignatureV(QPDFObjectHandle &field) const noexcept;

  void Log(const std::string &msg) const noexcept;

  SharedBytes data_;
  std::unique_ptr<QPDF> qpdf_;
  std::vector<SigInstance> signatures_;
};

} // namespace dtrsign::pdf
