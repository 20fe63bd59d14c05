/* File: orchestrator.hpp
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

#include <ctime>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "certificate_bundle.hpp"
#include "common_defs.hpp"
#include "pdf_defs.hpp"
#include "raster_image.hpp"
#include "signature_engine.hpp"
#include "signer_config.hpp"
#include "signer_role.hpp"
#include "signing_result.hpp"
#include "stamp_compositor.hpp"

namespace dtrsign::signer {

/// @brief everything needed to sign for one role
struct SignRequest {
  BytesVector p12;
  std::string password;
  SignerRole role = SignerRole::kOwner;
  pdf::RasterImage image;
  std::vector<pdf::StampSpec> stamps;
  std::optional<std::time_t> signing_time;
};

/**
 * @brief Runs the whole pipeline for a document
 * @details validate -> compose -> reserve -> digest -> sign -> finalize.
 * Holds only the immutable config, so one instance may serve concurrent
 * requests. Failures are reported in the result, the input bytes are
 * returned unchanged.
 */
class Orchestrator {
public:
  /// @throws SignError(kConfig)
  explicit Orchestrator(SignerConfig config = SignerConfig());

  /**
   * @brief Sign one field, the stamps are appearances of this field
   * @param pdf_data document
   * @param bundle signer key and chain
   * @param image decoded stamp picture
   * @param stamps one or more placements
   * @param role
   * @param timestamp signing time, current time if empty
   * @return SigningResult with one field outcome
   */
  [[nodiscard]] SigningResult
  SignRole(const pdf::SharedBytes &pdf_data,
           const crypto::CertificateBundle &bundle,
           const pdf::RasterImage &image,
           const std::vector<pdf::StampSpec> &stamps, SignerRole role,
           std::optional<std::time_t> timestamp = std::nullopt) const;

  /// @brief load the PKCS#12 container and sign, the key lives only for the
  /// call
  [[nodiscard]] SigningResult Sign(const pdf::SharedBytes &pdf_data,
                                   const SignRequest &request) const;

  /**
   * @brief Sign the requests one after another, each signs the result of the
   * previous one
   * @details stops at the first failure, the document is the last
   * successfully signed revision
   */
  [[nodiscard]] SigningResult
  SignSequence(const pdf::SharedBytes &pdf_data,
               const std::vector<SignRequest> &requests) const;

  /// @brief Sign on a worker thread
  [[nodiscard]] std::future<SigningResult>
  SignRoleAsync(pdf::SharedBytes pdf_data, SignRequest request) const;

  [[nodiscard]] const SignerConfig &config() const noexcept { return config_; }

private:
  // throws SignError
  void RunPipeline(const pdf::SharedBytes &pdf_data,
                   const crypto::CertificateBundle &bundle,
                   const pdf::RasterImage &image,
                   const std::vector<pdf::StampSpec> &stamps,
                   FieldOutcome &outcome, pdf::SharedBytes &signed_pdf) const;

  SignerConfig config_;
  crypto::SignatureEngine engine_;
};

/**
 * @brief Result that keeps the input document and reports the exception
 * @details SignError keeps its kind, QPDFExc is kDocumentStructure, any other
 * std::exception is kSigning
 * @param pdf_data the unchanged input
 * @param outcome role and signing time of the failed field
 * @param ex the exception caught
 */
[[nodiscard]] SigningResult FailedResult(const pdf::SharedBytes &pdf_data,
                                         FieldOutcome outcome,
                                         const std::exception_ptr &ex);

} // namespace dtrsign::signer
