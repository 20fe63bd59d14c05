/* File: options.cpp
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


#include "options.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dtrsign::cli {

Options::Options(int argc, char**& argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_("Allowed options") {
  description_.add_options()
    // clang-format off
      (kHelpTag, "produce this help message")
      (kInputFileTag, po::value<std::vector<std::string>>(), "input PDF file, may be repeated")
      (kOutputDIRTag, po::value<std::string>(), "output directory")
      (kOutputPostfixTag, po::value<std::string>(), "postfix to add to the filename (default _signed)")
      (kP12Tag, po::value<std::string>(), "PKCS#12 file with the signer key and certificate")
      (kPasswordTag, po::value<std::string>(), "PKCS#12 password, DTRSIGN_P12_PASSWORD is used if not set")
      (kImageTag, po::value<std::string>(), "stamp picture (PNG)")
      (kRoleTag, po::value<std::string>(), "signer role: owner, incharge, head, sao, cao")
      (kFormTag, po::value<std::string>(), "preset placements for the form: dtr or leave")
      (kPageNumberTag, po::value<int>(), "page number, starting with 1 (default 1)")
      (kRectTag, po::value<std::string>(), "stamp rect x1,y1,x2,y2 in points")
      (kScaleTag, po::value<double>(), "image scale factor inside the rect, (0,1]")
      (kQualityTag, po::value<int>(), "image quality 0-100, 100 - lossless")
      (kWholeMonthTag, "whole month mode")
      (kDaysTag, po::value<int>(), "number of days in whole month mode")
      (kConfigTag, po::value<std::string>(), "JSON configuration file")
      (kJsonTag, "print the result as JSON")
      (kVerboseTag, "debug messages of the signing pipeline");
  // clang-format on
  try {
    pos_opt_desc_.add(kInputFileTagL, -1);
    po::store(po::command_line_parser(argc, argv)
                .options(description_)
                .positional(pos_opt_desc_)
                .run(),
              var_map_);
    po::notify(var_map_);
  } catch (const po::invalid_command_line_syntax& /*ex*/) {
    log_->error("Wrong parameters, see --help");
    wrong_params_ = true;
  } catch (const po::unknown_option& ex) {
    log_->error("Unknown option passed. {}", ex.what());
    wrong_params_ = true;
  } catch (const po::ambiguous_option& /*ex*/) {
    log_->error(
      "Ambiguous option passed,use - for short options and -- "
      "for full options,--help for help");
    wrong_params_ = true;
  } catch (const po::error& ex) {
    log_->error("Wrong parameters: {}", ex.what());
    wrong_params_ = true;
  }
}

bool Options::help() const {
  if (var_map_.empty() || var_map_.count(kHelpTagL) > 0 || wrong_params_ ||
      !AllMandatoryAreSet()) {
    std::cout << "A tool for signing daily time records and leave forms\n";
    // clang-format off
    std::cout << "Usage: dtrsign"
              << " --p12 ./juan.p12"
              << " --image ./signature.png"
              << " --role owner"
              << " --form dtr"
              << " --output-dir ./signed_docs"
              << " -P _signed"
              << " dtr_january.pdf dtr_february.pdf\n";
    std::cout << "       dtrsign"
              << " --p12 ./juan.p12"
              << " --image ./signature.png"
              << " --role incharge"
              << " --page 1 --rect 50,100,250,720"
              << " --whole-month --days 30"
              << " --output-dir ./signed_docs"
              << " dtr_april.pdf\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

std::string Options::ResolvePath(const std::string& path) const {
  std::string local_path = path;
  std::string current_path = std::filesystem::current_path();
  current_path += "/";
  const char* home = getenv("HOME");  // NOLINT
  std::string home_path = home != nullptr ? home : "";
  home_path += "/";
  if (local_path.empty() || local_path == ".") {
    local_path = std::filesystem::current_path();
  }
  if (boost::starts_with(local_path, "./")) {
    boost::replace_first(local_path, "./", current_path);
  }
  if (boost::starts_with(local_path, "~/")) {
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
  }
  local_path = fs_path;
  return local_path;
}

bool Options::AllMandatoryAreSet() const {
  if (var_map_.count(kInputFileTagL) == 0) {
    log_->error("No input files are set");
    return false;
  }
  if (var_map_.count(kOutputDIRTagL) == 0) {
    log_->error("No output-dir is set");
    return false;
  }
  if (var_map_.count(kP12TagL) == 0) {
    log_->error("No PKCS#12 file is set");
    return false;
  }
  if (!std::filesystem::exists(GetP12Path())) {
    log_->error("PKCS#12 file not found {}", GetP12Path());
    return false;
  }
  if (var_map_.count(kImageTagL) == 0) {
    log_->error("No stamp image is set");
    return false;
  }
  if (!std::filesystem::exists(GetImagePath())) {
    log_->error("Image file not found {}", GetImagePath());
    return false;
  }
  if (var_map_.count(kRoleTagL) == 0) {
    log_->error("No signer role is set");
    return false;
  }
  if (!GetRole()) {
    log_->error("Unknown role {}", var_map_.at(kRoleTagL).as<std::string>());
    return false;
  }
  if (var_map_.count(kFormTagL) > 0 && !GetForm()) {
    log_->error("Form is expected to be: dtr or leave");
    return false;
  }
  if (var_map_.count(kFormTagL) > 0 && var_map_.count(kRectTagL) > 0) {
    log_->error("Use either --form or --rect");
    return false;
  }
  if (var_map_.count(kFormTagL) == 0 && var_map_.count(kRectTagL) == 0) {
    log_->error("No stamp placement is set, use --form or --rect");
    return false;
  }
  if (var_map_.count(kRectTagL) > 0 && !GetRect()) {
    log_->error("Rect is expected as x1,y1,x2,y2 with x1<x2 and y1<y2");
    return false;
  }
  if (var_map_.count(kPageNumberTagL) > 0 &&
      var_map_.at(kPageNumberTagL).as<int>() <= 0) {
    log_->error("Page number should be positive integer greater than null");
    return false;
  }
  if (var_map_.count(kDaysTagL) > 0 && !WholeMonth()) {
    log_->error("--days is used only with --whole-month");
    return false;
  }
  if (var_map_.count(kOutputPostfixTagL) > 0 &&
      boost::contains(var_map_.at(kOutputPostfixTagL).as<std::string>(),
                      "/")) {
    log_->error("File postfix can not contain / symbol");
    return false;
  }
  if (var_map_.count(kConfigTagL) > 0 &&
      !std::filesystem::exists(GetConfigPath())) {
    log_->error("Config file not found {}", GetConfigPath());
    return false;
  }
  return true;
}

std::vector<std::string> Options::GetInputFiles() const {
  if (var_map_.count(kInputFileTagL) > 0) {
    auto files_list =
      var_map_.at(kInputFileTagL).as<std::vector<std::string>>();
    std::for_each(
      files_list.begin(), files_list.end(),
      [this](std::string& file_name) { file_name = ResolvePath(file_name); });
    return files_list;
  }
  return {};
}

std::string Options::GetOutputDir() const {
  if (var_map_.count(kOutputDIRTagL) == 0) {
    return {};
  }
  std::string res = ResolvePath(var_map_.at(kOutputDIRTagL).as<std::string>());
  if (!res.empty() && res.back() != '/') {
    res.push_back('/');
  }
  return res;
}

std::string Options::GetNamePostfix() const {
  if (var_map_.count(kOutputPostfixTagL) == 0) {
    return kDefaultPostfix;
  }
  return var_map_.at(kOutputPostfixTagL).as<std::string>();
}

std::string Options::GetP12Path() const {
  if (var_map_.count(kP12TagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kP12TagL).as<std::string>());
}

std::string Options::GetPassword() const {
  if (var_map_.count(kPasswordTagL) > 0) {
    return var_map_.at(kPasswordTagL).as<std::string>();
  }
  const char* env_password = std::getenv(kPasswordEnv);  // NOLINT
  if (env_password == nullptr) {
    log_->warn("No password is set, an empty password will be used");
    return {};
  }
  return env_password;
}

std::string Options::GetImagePath() const {
  if (var_map_.count(kImageTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kImageTagL).as<std::string>());
}

std::optional<signer::SignerRole> Options::GetRole() const {
  if (var_map_.count(kRoleTagL) == 0) {
    return std::nullopt;
  }
  return signer::SignerRoleFromString(
    var_map_.at(kRoleTagL).as<std::string>());
}

std::optional<signer::FormKind> Options::GetForm() const {
  if (var_map_.count(kFormTagL) == 0) {
    return std::nullopt;
  }
  return signer::FormKindFromString(var_map_.at(kFormTagL).as<std::string>());
}

int Options::GetPageIndex() const {
  if (var_map_.count(kPageNumberTagL) == 0) {
    return 0;
  }
  return var_map_.at(kPageNumberTagL).as<int>() - 1;
}

std::optional<pdf::BBox> Options::GetRect() const {
  if (var_map_.count(kRectTagL) == 0) {
    return std::nullopt;
  }
  return ParseRect(var_map_.at(kRectTagL).as<std::string>());
}

std::optional<double> Options::GetScale() const {
  if (var_map_.count(kScaleTagL) == 0) {
    return std::nullopt;
  }
  return var_map_.at(kScaleTagL).as<double>();
}

std::optional<int> Options::GetQuality() const {
  if (var_map_.count(kQualityTagL) == 0) {
    return std::nullopt;
  }
  return var_map_.at(kQualityTagL).as<int>();
}

bool Options::WholeMonth() const { return var_map_.count(kWholeMonthTagL) > 0; }

std::optional<int> Options::GetDays() const {
  if (var_map_.count(kDaysTagL) == 0) {
    return std::nullopt;
  }
  return var_map_.at(kDaysTagL).as<int>();
}

std::string Options::GetConfigPath() const {
  if (var_map_.count(kConfigTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kConfigTagL).as<std::string>());
}

bool Options::JsonOutput() const { return var_map_.count(kJsonTagL) > 0; }

bool Options::Verbose() const { return var_map_.count(kVerboseTagL) > 0; }

std::optional<pdf::BBox> ParseRect(const std::string& val) {
  std::vector<std::string> parts;
  boost::split(parts, val, boost::is_any_of(","));
  if (parts.size() != 4) {
    return std::nullopt;
  }
  std::vector<double> coords;
  for (auto& part : parts) {
    boost::trim(part);
    try {
      size_t pos = 0;
      const double coord = std::stod(part, &pos);
      if (pos != part.size() || !std::isfinite(coord)) {
        return std::nullopt;
      }
      coords.push_back(coord);
    } catch (const std::invalid_argument& /*ex*/) {
      return std::nullopt;
    } catch (const std::out_of_range& /*ex*/) {
      return std::nullopt;
    }
  }
  if (coords[0] >= coords[2] || coords[1] >= coords[3]) {
    return std::nullopt;
  }
  return pdf::BBox{{coords[0], coords[1]}, {coords[2], coords[3]}};
}

}  // namespace dtrsign::cli
