//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <CLI/CLI.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "cli/commands.hpp"
#include "config/app_config.hpp"
#include "type/type.hpp"
#include "utils/log/logging.hpp"

int main(int argc, char* argv[]) {
  CLI::App app{"oolong: ingest, deduplicate and catalog photo collections."};
  app.set_help_flag("-h,--help", "Show this help message and exit.");
  app.require_subcommand(1);

  std::string config_path;
  std::string catalog_path;
  std::string media_root;
  bool        verbose = false;
  bool        quiet   = false;
  app.add_option("--config", config_path, "JSON configuration file.");
  app.add_option("--catalog", catalog_path, "Catalog database, overrides the configuration.");
  app.add_option("--media-root", media_root,
                 "Managed storage directory, overrides the configuration.");
  auto* verbose_flag = app.add_flag("-v,--verbose", verbose, "Log debug output.");
  app.add_flag("-q,--quiet", quiet, "Only log errors.")->excludes(verbose_flag);

  oolong::IngestArgs ingest_args;
  auto* ingest = app.add_subcommand("ingest", "Ingest photos from a directory or a file.");
  ingest->add_option("path", ingest_args.path_, "Directory or file to ingest.")->required();
  ingest->add_option("--resolution", ingest_args.resolution_,
                     "Size of stored images, 'WIDTHxHEIGHT' or a preset name.");
  ingest->add_flag("--hash", ingest_args.hash_, "Calculate a content hash for each photo.");
  ingest->add_flag("--no-recursive", ingest_args.no_recursive_,
                   "Do not descend into subdirectories.");
  ingest->add_flag("--store-images", ingest_args.store_images_,
                   "Store a standard-format copy of each photo in the media root.");
  ingest->add_option("--device", ingest_args.device_,
                     "Device identifier to record instead of the detected one.");

  oolong::ConvertArgs convert_args;
  auto* convert = app.add_subcommand("convert", "Convert an image to a standard format.");
  convert->add_option("source", convert_args.source_, "Image to convert.")->required();
  convert->add_option("-o,--output", convert_args.output_, "Output file or directory.");
  convert->add_option("-r,--resolution", convert_args.resolution_,
                      "Target size, 'WIDTHxHEIGHT' or a preset name.");
  convert->add_option("-f,--format", convert_args.format_, "Output format.")
      ->default_val("JPEG")
      ->check(CLI::IsMember({"JPEG", "PNG"}, CLI::ignore_case));

  auto* presets = app.add_subcommand("presets", "List the resolution presets.");

  oolong::InfoArgs info_args;
  auto* info = app.add_subcommand("info", "Show the metadata of an image file.");
  info->add_option("file", info_args.file_, "Image file.")->required();
  info->add_flag("--json", info_args.json_, "Print the report as JSON.");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  oolong::AppConfig config;
  try {
    std::optional<file_path_t> explicit_config;
    if (!config_path.empty()) explicit_config = config_path;
    config = oolong::AppConfig::LoadResolved(explicit_config);
  } catch (const std::exception& e) {
    oolong::InitLogging(spdlog::level::info);
    spdlog::error("Cannot load configuration: {}", e.what());
    return 1;
  }
  if (!catalog_path.empty()) config.catalog_path_ = catalog_path;
  if (!media_root.empty()) config.media_root_ = media_root;

  auto level = oolong::ParseLogLevel(config.log_level_);
  if (verbose) level = spdlog::level::debug;
  if (quiet) level = spdlog::level::err;
  oolong::InitLogging(level);

  if (ingest->parsed()) {
    return oolong::RunIngest(config, ingest_args, std::cout, std::cerr);
  }
  if (convert->parsed()) {
    return oolong::RunConvert(convert_args, std::cout, std::cerr);
  }
  if (presets->parsed()) {
    return oolong::RunPresets(std::cout);
  }
  if (info->parsed()) {
    return oolong::RunInfo(info_args, std::cout, std::cerr);
  }
  return 1;
}
