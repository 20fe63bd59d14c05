/* File: placement_presets.hpp
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

#include <optional>
#include <string>
#include <vector>

#include "pdf_structs.hpp"
#include "signer_config.hpp"
#include "signer_role.hpp"
#include "stamp_compositor.hpp"

namespace dtrsign::signer {

/// known paper forms with fixed signature places
enum class FormKind { kDtr, kLeave };

[[nodiscard]] const char *FormKindToString(FormKind form) noexcept;

[[nodiscard]] std::optional<FormKind>
FormKindFromString(const std::string &val) noexcept;

/**
 * @brief Signature places of a role on a form
 * @param form
 * @param role
 * @param whole_month a daily time record for the whole month has no footer
 * rows, the stamps go lower
 * @return std::vector<pdf::BBox> one rect per stamp
 * @throws SignError(kInvalidParameter) if the role does not sign this form
 */
[[nodiscard]] std::vector<pdf::BBox>
PresetPlacements(FormKind form, SignerRole role, bool whole_month);

/// @brief stamp specs for the preset places with the config defaults
/// @throws SignError(kInvalidParameter)
[[nodiscard]] std::vector<pdf::StampSpec>
PresetStampSpecs(FormKind form, SignerRole role, bool whole_month,
                 const SignerConfig &config, int page_index = 0);

} // namespace dtrsign::signer
