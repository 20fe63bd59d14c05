/* File: fixture_pki.hpp
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

#include <string>

#include "common_defs.hpp"

namespace dtrsign::test {

enum class FixtureKey { kRsa, kRsaPss, kEc, kEd25519 };

struct PkiOptions {
  FixtureKey key = FixtureKey::kRsa;
  std::string common_name = "Juan Dela Cruz";
  std::string password = "secret";
  long valid_from_sec = -3600;            // relative to now
  long valid_to_sec = 365L * 24 * 3600;   // relative to now
  bool key_usage_ext = true;
  bool digital_signature = true;
  // 0 - self-signed leaf, 1 - leaf issued by a root, 2 - root+intermediate
  int ca_levels = 1;
  // put the CA certificates to the container root first
  bool ca_reversed = false;
};

/// @brief build a PKCS#12 container in memory
/// @throws std::runtime_error
BytesVector MakePkcs12(const PkiOptions &opts);

} // namespace dtrsign::test
