/* File: options.hpp
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

#include <boost/program_options.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pdf_structs.hpp"
#include "placement_presets.hpp"
#include "signer_role.hpp"

namespace dtrsign::cli {

namespace po = boost::program_options;

const char* const kInputFileTag = "input,i";
const char* const kInputFileTagL = "input";
const char* const kHelpTag = "help,h";
const char* const kHelpTagL = "help";
const char* const kOutputDIRTag = "output-dir,d";
const char* const kOutputDIRTagL = "output-dir";
const char* const kOutputPostfixTag = "postfix,P";
const char* const kOutputPostfixTagL = "postfix";
const char* const kP12Tag = "p12,k";
const char* const kP12TagL = "p12";
const char* const kPasswordTag = "password";
const char* const kPasswordTagL = "password";
const char* const kImageTag = "image,m";
const char* const kImageTagL = "image";
const char* const kRoleTag = "role,r";
const char* const kRoleTagL = "role";
const char* const kFormTag = "form,f";
const char* const kFormTagL = "form";
const char* const kPageNumberTag = "page,p";
const char* const kPageNumberTagL = "page";
const char* const kRectTag = "rect";
const char* const kRectTagL = "rect";
const char* const kScaleTag = "scale,s";
const char* const kScaleTagL = "scale";
const char* const kQualityTag = "quality,q";
const char* const kQualityTagL = "quality";
const char* const kWholeMonthTag = "whole-month,w";
const char* const kWholeMonthTagL = "whole-month";
const char* const kDaysTag = "days";
const char* const kDaysTagL = "days";
const char* const kConfigTag = "config,c";
const char* const kConfigTagL = "config";
const char* const kJsonTag = "json,j";
const char* const kJsonTagL = "json";
const char* const kVerboseTag = "verbose,v";
const char* const kVerboseTagL = "verbose";

const char* const kPasswordEnv = "DTRSIGN_P12_PASSWORD";
const char* const kDefaultPostfix = "_signed";

/**
 * @brief Command line of the dtrsign tool
 * @details getters return already resolved and checked values, call
 * AllMandatoryAreSet first
 */
class Options {
 public:
  Options(int argc, char**& argv, std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] bool help() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }
  [[nodiscard]] bool HelpRequested() const {
    return !wrong_params_ && var_map_.count(kHelpTagL) > 0;
  }

  [[nodiscard]] std::vector<std::string> GetInputFiles() const;
  [[nodiscard]] std::string GetOutputDir() const;
  [[nodiscard]] std::string GetNamePostfix() const;
  [[nodiscard]] std::string GetP12Path() const;
  /// @brief --password or the DTRSIGN_P12_PASSWORD environment variable
  [[nodiscard]] std::string GetPassword() const;
  [[nodiscard]] std::string GetImagePath() const;
  [[nodiscard]] std::optional<signer::SignerRole> GetRole() const;
  [[nodiscard]] std::optional<signer::FormKind> GetForm() const;
  /// @brief zero based
  [[nodiscard]] int GetPageIndex() const;
  /// @brief "x1,y1,x2,y2" in pdf user space
  [[nodiscard]] std::optional<pdf::BBox> GetRect() const;
  [[nodiscard]] std::optional<double> GetScale() const;
  [[nodiscard]] std::optional<int> GetQuality() const;
  [[nodiscard]] bool WholeMonth() const;
  [[nodiscard]] std::optional<int> GetDays() const;
  [[nodiscard]] std::string GetConfigPath() const;
  [[nodiscard]] bool JsonOutput() const;
  [[nodiscard]] bool Verbose() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string& path) const;

  std::shared_ptr<spdlog::logger> log_;
  po::positional_options_description pos_opt_desc_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

/// @brief parse "x1,y1,x2,y2"
[[nodiscard]] std::optional<pdf::BBox> ParseRect(const std::string& val);

}  // namespace dtrsign::cli
