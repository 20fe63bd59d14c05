/* File: cli_utils.cpp
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


#include "cli_utils.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "placement_presets.hpp"
#include "sign_error.hpp"

namespace dtrsign::cli {

bool CheckInputFiles(const std::vector<std::string>& files,
                     const std::shared_ptr<spdlog::logger>& log) {
  return std::all_of(
    files.cbegin(), files.cend(), [&log](const std::string& file) {
      try {
        if (!std::filesystem::exists(file)) {
          log->error("File not found {}", file);
          return false;
        }
        if (!std::filesystem::is_regular_file(file)) {
          log->error("This file is not a regular file {}", file);
          return false;
        }
        if (std::filesystem::file_size(file) < 10) {
          log->error("File is empty or too small {}", file);
          return false;
        }
        // read 10 bytes to string
        auto ifile = std::ifstream(file, std::ios_base::binary);
        if (!ifile.is_open()) {
          log->error("Can not open file {}", file);
          return false;
        }
        std::string read_buff;
        read_buff.resize(20, 0x00);
        if (!ifile.read(read_buff.data(), 10)) {
          log->error("Can not read the file {}", file);
          return false;
        }
        if (!boost::contains(read_buff, "PDF")) {
          log->error("Not a pdf file {}", file);
          return false;
        }
        ifile.close();
      } catch (const std::filesystem::filesystem_error& ex) {
        log->error(ex.what());
        return false;
      }
      return true;
    });
}

bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log) {
  if (!std::filesystem::exists(output_dir) ||
      !std::filesystem::is_directory(output_dir)) {
    log->error("Directory not found {}", output_dir);
    return false;
  }
  std::string tmp_filename = output_dir;
  if (tmp_filename.back() != '/') {
    tmp_filename.push_back('/');
  }
  tmp_filename += "test_temporary_file_for_dtrsign";
  std::ofstream ofile(tmp_filename);
  if (!ofile.is_open()) {
    log->error("Can not create file in directory {}", output_dir);
    return false;
  }
  ofile.close();
  std::error_code err_code;
  std::filesystem::remove(tmp_filename, err_code);
  if (err_code) {
    log->warn("Can not remove {}: {}", tmp_filename, err_code.message());
  }
  return true;
}

std::vector<pdf::StampSpec> BuildStampSpecs(const Options& options,
                                            const SignerConfig& config) {
  const auto role = options.GetRole();
  if (!role) {
    throw SignError(ErrorKind::kInvalidParameter,
                    "[BuildStampSpecs] no signer role");
  }
  std::vector<pdf::StampSpec> res;
  const auto form = options.GetForm();
  if (form) {
    // the forms have their own whole month layout, no grid
    res = signer::PresetStampSpecs(form.value(), role.value(),
                                   options.WholeMonth(), config,
                                   options.GetPageIndex());
  } else {
    const auto rect = options.GetRect();
    if (!rect) {
      throw SignError(ErrorKind::kInvalidParameter,
                      "[BuildStampSpecs] no stamp rect");
    }
    pdf::StampSpec spec;
    spec.page_index = options.GetPageIndex();
    spec.rect = rect.value();
    spec.scale_factor = config.default_scale_factor;
    spec.quality = config.default_image_quality;
    if (options.WholeMonth()) {
      pdf::GridSpec grid;
      grid.rows_per_page = config.grid.rows_per_page;
      grid.cells_per_row = config.grid.cells_per_row;
      grid.day_count = options.GetDays().value_or(
        static_cast<int>(config.default_day_count));
      spec.whole_month = grid;
    }
    res.push_back(spec);
  }
  const auto scale = options.GetScale();
  const auto quality = options.GetQuality();
  for (auto& spec : res) {
    if (scale) {
      spec.scale_factor = scale.value();
    }
    if (quality) {
      spec.quality = quality.value();
    }
  }
  return res;
}

std::string DestinationPath(const std::string& src_file,
                            const std::string& output_dir,
                            const std::string& postfix,
                            const std::shared_ptr<spdlog::logger>& log) {
  std::vector<std::string> extensions;
  const unsigned int max_it = 10;
  unsigned int it_counter = 0;
  std::string clear_path =
    output_dir + std::filesystem::path(src_file).filename().string();
  std::string next = std::filesystem::path(clear_path).extension();
  while (!next.empty() && it_counter < max_it) {
    ++it_counter;
    // shrink one extension
    clear_path.resize(clear_path.length() - next.length());
    extensions.emplace_back(std::move(next));
    next = std::filesystem::path(clear_path).extension();
  }
  clear_path += postfix;
  // extensions were collected from the end
  std::for_each(extensions.crbegin(), extensions.crend(),
                [&clear_path](const std::string& ext) { clear_path += ext; });
  while (std::filesystem::exists(clear_path)) {
    log->warn("File already exists {}", clear_path);
    clear_path += ".next";
  }
  return clear_path;
}

bool WriteResultFile(const BytesVector& data, const std::string& dest_file,
                     const std::shared_ptr<spdlog::logger>& log) {
  const std::string tmp_file = dest_file + ".tmp";
  {
    std::ofstream ofile(tmp_file, std::ios_base::binary);
    if (!ofile.is_open()) {
      log->error("Can not create file {}", tmp_file);
      return false;
    }
    ofile.write(reinterpret_cast<const char*>(data.data()),  // NOLINT
                static_cast<std::streamsize>(data.size()));
    if (!ofile) {
      log->error("Can not write file {}", tmp_file);
      return false;
    }
  }
  std::error_code err_code;
  std::filesystem::rename(tmp_file, dest_file, err_code);
  if (err_code) {
    log->error("Rename result file failed: {}", err_code.message());
    std::filesystem::remove(tmp_file, err_code);
    return false;
  }
  log->info("Result saved to {}", dest_file);
  return true;
}

boost::json::object FileResultToJson(const std::string& src_file,
                                     const std::string& dest_file,
                                     const signer::SigningResult& result) {
  boost::json::object res = result.ToJson();
  res["input"] = src_file;
  if (result.Success()) {
    res["output"] = dest_file;
  } else {
    res["output"] = nullptr;
  }
  return res;
}

}  // namespace dtrsign::cli
