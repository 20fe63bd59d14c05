/* File: dtrsign.cpp
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


#include <spdlog/sinks/stdout_color_sinks.h>

#include <boost/json.hpp>
#include <cstddef>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cli_utils.hpp"
#include "logger_utils.hpp"
#include "options.hpp"
#include "orchestrator.hpp"
#include "pdf_utils.hpp"
#include "png_reader.hpp"
#include "sign_error.hpp"
#include "signer_config.hpp"

int main(int argc, char* argv[]) {
  namespace cli = dtrsign::cli;
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stdout_color_mt("dtrsign_cli");
    if (!console) {
      std::cerr << "Setup logger failed";
      return 1;
    }
    const cli::Options options(argc, argv, console);
    if (options.help()) {
      return options.HelpRequested() ? 0 : 1;
    }
    auto pipeline_log = dtrsign::logger::InitLog();
    if (pipeline_log) {
      pipeline_log->set_level(options.Verbose() ? spdlog::level::debug
                                                : spdlog::level::warn);
    }
    auto input_files = options.GetInputFiles();
    if (cli::CheckInputFiles(input_files, console)) {
      console->info("Files are OK");
    } else {
      console->error("Files are not OK");
      return 1;
    }
    const std::string output_dir = options.GetOutputDir();
    if (!cli::CheckOutputDir(output_dir, console)) {
      console->error("Output directory is not OK");
      return 1;
    }
    // ----------------
    // shared inputs
    const dtrsign::SignerConfig config =
      options.GetConfigPath().empty()
        ? dtrsign::SignerConfig()
        : dtrsign::LoadConfig(options.GetConfigPath());
    const dtrsign::signer::Orchestrator orchestrator(config);
    auto p12 = dtrsign::pdf::FileToVector(options.GetP12Path());
    if (!p12) {
      console->error("Can not read {}", options.GetP12Path());
      return 1;
    }
    dtrsign::signer::SignRequest request;
    request.p12 = std::move(p12.value());
    request.password = options.GetPassword();
    request.role = options.GetRole().value();
    request.image = cli::ReadPngFile(options.GetImagePath());
    request.stamps = cli::BuildStampSpecs(options, config);
    // ----------------
    // sign files
    std::vector<std::future<dtrsign::signer::SigningResult>> futures;
    futures.reserve(input_files.size());
    for (const auto& src_file : input_files) {
      console->debug("Processing file {}", src_file);
      auto data = dtrsign::pdf::FileToVector(src_file);
      if (!data) {
        throw dtrsign::SignError(dtrsign::ErrorKind::kDocumentStructure,
                                 "Can not read " + src_file);
      }
      futures.push_back(orchestrator.SignRoleAsync(
        std::make_shared<const dtrsign::BytesVector>(std::move(data.value())),
        request));
    }
    size_t succeeded_count = 0;
    boost::json::array json_results;
    for (size_t i = 0; i < futures.size(); ++i) {
      const auto result = futures[i].get();
      const std::string& src_file = input_files[i];
      std::string dest_file;
      if (result.Success()) {
        dest_file = cli::DestinationPath(src_file, output_dir,
                                         options.GetNamePostfix(), console);
        if (cli::WriteResultFile(*result.document, dest_file, console)) {
          ++succeeded_count;
          console->info("Signed successfully {} as {}", src_file,
                        result.fields.front().field_name);
        } else {
          dest_file.clear();
        }
      } else {
        const auto& failed = result.fields.front();
        console->error("Sign document failed {}: {} {}", src_file,
                       dtrsign::ErrorKindToString(
                         failed.error.value_or(dtrsign::ErrorKind::kSigning)),
                       failed.message);
      }
      if (options.JsonOutput()) {
        json_results.emplace_back(
          cli::FileResultToJson(src_file, dest_file, result));
      }
    }
    if (options.JsonOutput()) {
      std::cout << boost::json::serialize(json_results) << "\n";
    }
    // return 0 if all files succeeded
    return succeeded_count == input_files.size() ? 0 : 1;
  } catch (const dtrsign::SignError& ex) {
    std::cerr << "Error: " << ex.code() << " " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
