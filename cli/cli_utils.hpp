/* File: cli_utils.hpp
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

#include <spdlog/spdlog.h>

#include <boost/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "common_defs.hpp"
#include "options.hpp"
#include "signer_config.hpp"
#include "signing_result.hpp"
#include "stamp_compositor.hpp"

namespace dtrsign::cli {

/**
 * @brief Check all files - readable,non-empty, PDF
 *
 * @param files filenames
 * @param log logger
 * @return true if all files are ok
 * @return false if at least one file is bad
 */
bool CheckInputFiles(const std::vector<std::string>& files,
                     const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Check the output directory
 *
 * @param output_dir
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Stamp placements from the command line
 * @details --rect gives one placement, a grid of days with --whole-month;
 * --form gives the preset places of the role
 * @throws SignError(kInvalidParameter)
 */
std::vector<pdf::StampSpec> BuildStampSpecs(const Options& options,
                                            const SignerConfig& config);

/**
 * @brief Build the destination file name
 * @details output_dir + name + postfix + extensions, ".next" is appended
 * while the file exists
 */
std::string DestinationPath(const std::string& src_file,
                            const std::string& output_dir,
                            const std::string& postfix,
                            const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Write the signed document to a temporary file and rename it to
 * dest_file
 * @return true on success
 */
bool WriteResultFile(const BytesVector& data, const std::string& dest_file,
                     const std::shared_ptr<spdlog::logger>& log);

/// @brief result record of one input file for --json
boost::json::object FileResultToJson(const std::string& src_file,
                                     const std::string& dest_file,
                                     const signer::SigningResult& result);

}  // namespace dtrsign::cli
