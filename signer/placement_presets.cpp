/* File: placement_presets.cpp
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


#include "placement_presets.hpp"

#include <cctype>
#include <string>
#include <vector>

#include "sign_error.hpp"

namespace dtrsign::signer {

namespace {

// DTR stamps are lifted when the record is not for the whole month
constexpr double kDtrOwnerLift = 250;
constexpr double kDtrInChargeLift = 255;

pdf::BBox Rect(double x1, double y1, double x2, double y2) {
  return pdf::BBox{{x1, y1}, {x2, y2}};
}

} // namespace

const char *FormKindToString(FormKind form) noexcept {
  switch (form) {
  case FormKind::kDtr:
    return "dtr";
  case FormKind::kLeave:
    return "leave";
  }
  return "unknown";
}

std::optional<FormKind> FormKindFromString(const std::string &val) noexcept {
  std::string lower;
  for (const char symbol : val) {
    lower.push_back(static_cast<char>(
      std::tolower(static_cast<unsigned char>(symbol))));
  }
  if (lower == FormKindToString(FormKind::kDtr)) {
    return FormKind::kDtr;
  }
  if (lower == FormKindToString(FormKind::kLeave)) {
    return FormKind::kLeave;
  }
  return std::nullopt;
}

std::vector<pdf::BBox> PresetPlacements(FormKind form, SignerRole role,
                                        bool whole_month) {
  if (form == FormKind::kDtr) {
    if (role == SignerRole::kOwner) {
      const double lift = whole_month ? 0 : kDtrOwnerLift;
      return {Rect(50, 105 + lift, 250, 165 + lift),
              Rect(360, 105 + lift, 560, 165 + lift)};
    }
    if (role == SignerRole::kInCharge) {
      const double lift = whole_month ? 0 : kDtrInChargeLift;
      return {Rect(50, 70 + lift, 250, 130 + lift),
              Rect(360, 70 + lift, 560, 130 + lift)};
    }
  } else {
    switch (role) {
    case SignerRole::kOwner:
      return {Rect(330, 535, 550, 605)};
    case SignerRole::kHead:
      return {Rect(330, 355, 550, 425)};
    case SignerRole::kSao:
      return {Rect(50, 355, 270, 425)};
    case SignerRole::kCao:
      return {Rect(200, 155, 420, 225)};
    default:
      break;
    }
  }
  throw SignError(ErrorKind::kInvalidParameter,
                  std::string("[PresetPlacements] role ") +
                    SignerRoleToString(role) + " does not sign the " +
                    FormKindToString(form) + " form");
}

std::vector<pdf::StampSpec> PresetStampSpecs(FormKind form, SignerRole role,
                                             bool whole_month,
                                             const SignerConfig &config,
                                             int page_index) {
  std::vector<pdf::StampSpec> res;
  for (const auto &rect : PresetPlacements(form, role, whole_month)) {
    pdf::StampSpec spec;
    spec.page_index = page_index;
    spec.rect = rect;
    spec.scale_factor = config.default_scale_factor;
    spec.quality = config.default_image_quality;
    res.push_back(spec);
  }
  return res;
}

} // namespace dtrsign::signer
