/* File: orchestrator.cpp
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


#include "orchestrator.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <future>
#include <iterator>
#include <optional>
#include <qpdf/QPDFExc.hh>
#include <string>
#include <utility>
#include <vector>

#include "certificate_store.hpp"
#include "incremental_writer.hpp"
#include "logger_utils.hpp"
#include "pdf.hpp"
#include "sign_error.hpp"

namespace dtrsign::signer {

Orchestrator::Orchestrator(SignerConfig config)
    : config_(std::move(config)),
      engine_(config_.hash_algo, config_.scheme) {
  ValidateConfig(config_);
}

SigningResult
Orchestrator::SignRole(const pdf::SharedBytes &pdf_data,
                       const crypto::CertificateBundle &bundle,
                       const pdf::RasterImage &image,
                       const std::vector<pdf::StampSpec> &stamps,
                       SignerRole role,
                       std::optional<std::time_t> timestamp) const {
  const std::string func_name = "[Orchestrator::SignRole] ";
  auto logger = logger::InitLog();
  FieldOutcome outcome;
  outcome.role = role;
  outcome.signing_time = timestamp.value_or(std::time(nullptr));
  outcome.signer_subject = bundle.leaf_info().subject;
  const auto start = std::chrono::steady_clock::now();
  try {
    pdf::SharedBytes signed_pdf;
    RunPipeline(pdf_data, bundle, image, stamps, outcome, signed_pdf);
    outcome.success = true;
    if (logger) {
      const auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      logger->info("{}{} signed as {}, {} appearances, {} ms", func_name,
                   outcome.field_name, SignerRoleToString(role),
                   outcome.appearances, duration.count());
    }
    return SigningResult{std::move(signed_pdf), {std::move(outcome)}};
  } catch (const std::exception &) {
    return FailedResult(pdf_data, std::move(outcome), std::current_exception());
  }
}

SigningResult Orchestrator::Sign(const pdf::SharedBytes &pdf_data,
                                 const SignRequest &request) const {
  std::optional<crypto::CertificateBundle> bundle;
  try {
    bundle = crypto::CertificateStore::Load(request.p12, request.password);
  } catch (const std::exception &) {
    FieldOutcome outcome;
    outcome.role = request.role;
    outcome.signing_time = request.signing_time.value_or(std::time(nullptr));
    return FailedResult(pdf_data, std::move(outcome), std::current_exception());
  }
  return SignRole(pdf_data, bundle.value(), request.image, request.stamps,
                  request.role, request.signing_time);
}

SigningResult
Orchestrator::SignSequence(const pdf::SharedBytes &pdf_data,
                           const std::vector<SignRequest> &requests) const {
  SigningResult res{pdf_data, {}};
  for (const auto &request : requests) {
    SigningResult step = Sign(res.document, request);
    const bool success = step.Success();
    res.fields.insert(res.fields.end(),
                      std::make_move_iterator(step.fields.begin()),
                      std::make_move_iterator(step.fields.end()));
    if (!success) {
      break;
    }
    res.document = std::move(step.document);
  }
  return res;
}

std::future<SigningResult>
Orchestrator::SignRoleAsync(pdf::SharedBytes pdf_data,
                            SignRequest request) const {
  return std::async(std::launch::async,
                    [self = *this, pdf_data = std::move(pdf_data),
                     request = std::move(request)]() {
                      return self.Sign(pdf_data, request);
                    });
}

// ---------------------------------------------------
// private

void Orchestrator::RunPipeline(const pdf::SharedBytes &pdf_data,
                               const crypto::CertificateBundle &bundle,
                               const pdf::RasterImage &image,
                               const std::vector<pdf::StampSpec> &stamps,
                               FieldOutcome &outcome,
                               pdf::SharedBytes &signed_pdf) const {
  const std::string func_name = "[Orchestrator::RunPipeline] ";
  auto logger = logger::InitLog();
  if (!pdf_data || pdf_data->empty()) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "empty document");
  }
  if (stamps.empty()) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "no stamp placements");
  }
  crypto::CertificateStore::Validate(bundle, outcome.signing_time);

  std::vector<pdf::BBox> media_boxes;
  {
    const pdf::Pdf doc(pdf_data);
    outcome.field_name = NextFieldName(outcome.role, doc.GetFieldNames(),
                                       doc.GetUnsignedFieldNames());
    media_boxes = doc.GetMediaBoxes();
  }
  std::vector<pdf::AppearanceStream> appearances;
  for (const auto &spec : stamps) {
    auto composed = pdf::StampCompositor::Compose(image, spec, media_boxes);
    appearances.insert(appearances.end(),
                       std::make_move_iterator(composed.begin()),
                       std::make_move_iterator(composed.end()));
  }
  outcome.appearances = appearances.size();

  pdf::FieldRequest request;
  request.field_name = outcome.field_name;
  request.reason = ReasonText(outcome.role);
  request.signer_name = bundle.leaf_info().subj_common_name;
  request.signing_time = outcome.signing_time;
  request.app_name = config_.app_name;
  request.reserved_bytes = config_.signature_reserved_bytes;

  auto reserved = pdf::IncrementalWriter::Reserve(
    pdf::BaseDocument{pdf_data}, request, appearances);
  auto digest = engine_.Digest(*reserved.bytes, reserved.byteranges);
  const auto digested = pdf::IncrementalWriter::AttachDigest(
    std::move(reserved), std::move(digest));
  const auto signature =
    engine_.Sign(digested.digest, bundle, outcome.signing_time);
  if (logger) {
    logger->debug("{}{} digest {} bytes, signature {} bytes", func_name,
                  outcome.field_name, digested.digest.size(), signature.size());
  }
  signed_pdf = pdf::IncrementalWriter::Finalize(digested, signature).bytes;
}

SigningResult FailedResult(const pdf::SharedBytes &pdf_data,
                           FieldOutcome outcome, const std::exception_ptr &ex) {
  ErrorKind kind = ErrorKind::kSigning;
  std::string msg = "unknown error";
  if (ex) {
    try {
      std::rethrow_exception(ex);
    } catch (const SignError &err) {
      kind = err.kind();
      msg = err.what();
    } catch (const QPDFExc &err) {
      kind = ErrorKind::kDocumentStructure;
      msg = err.what();
    } catch (const std::exception &err) {
      msg = err.what();
    }
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->error("[Orchestrator] {} {} failed: {} {}",
                  SignerRoleToString(outcome.role), outcome.field_name,
                  ErrorKindToString(kind), msg);
  }
  outcome.success = false;
  outcome.error = kind;
  outcome.message = msg;
  return SigningResult{pdf_data, {std::move(outcome)}};
}

} // namespace dtrsign::signer
