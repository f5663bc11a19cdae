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

#include "cli/commands.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <nlohmann/json.hpp>

#include "app/convert_service.hpp"
#include "app/ingest_service.hpp"
#include "app/inspect_service.hpp"
#include "decoders/backend_registry.hpp"
#include "io/media/media_store.hpp"
#include "resolution/resolution.hpp"
#include "storage/catalog/catalog_store.hpp"

namespace oolong {
namespace {
auto DisplayValue(const nlohmann::json& value) -> std::string {
  return TruncateForDisplay(value.is_string() ? value.get<std::string>() : value.dump());
}

void PrintSection(std::ostream& out, const char* title, const nlohmann::json& section) {
  if (!section.is_object() || section.empty()) return;
  out << "\n[" << title << "]\n";
  // nlohmann::json objects iterate in key order
  for (const auto& [key, value] : section.items()) {
    out << "  " << key << ": " << DisplayValue(value) << "\n";
  }
}
}  // namespace

auto TruncateForDisplay(const std::string& value) -> std::string {
  if (value.size() <= 100) return value;
  return value.substr(0, 97) + "...";
}

auto RunIngest(const AppConfig& config, const IngestArgs& args, std::ostream& out,
               std::ostream& err) -> int {
  IngestResult result;
  try {
    auto catalog = std::make_shared<DuckDBCatalogStore>(config.catalog_path_);
    auto media   = std::make_shared<MediaStore>(config.media_root_);
    IngestServiceImpl service(catalog, media, BackendRegistry::CreateDefault());

    IngestOptions     options;
    options.resolution_    = args.resolution_;
    options.hash_          = args.hash_;
    options.recursive_     = !args.no_recursive_;
    options.store_images_  = args.store_images_;
    options.device_        = args.device_;
    options.output_format_ = config.output_format_;
    result                 = service.Ingest(args.path_, options);
  } catch (const std::exception& e) {
    err << "Error during ingestion: " << e.what() << "\n";
    return 1;
  }

  if (!result.success_) {
    for (const auto& error : result.errors_) {
      err << error << "\n";
    }
    return 1;
  }

  out << "Ingested " << result.count_ << " photo(s) from '" << args.path_ << "'\n";
  if (args.hash_) {
    out << "Calculated " << result.hashes_calculated_ << " hash(es).\n";
  }
  if (args.store_images_) {
    out << "Stored " << result.images_stored_ << " image(s) in database.\n";
  }
  if (result.skipped_ > 0) {
    out << "Skipped " << result.skipped_ << " already cataloged file(s).\n";
  }
  for (const auto& error : result.errors_) {
    err << error << "\n";
  }
  return 0;
}

auto RunConvert(const ConvertArgs& args, std::ostream& out, std::ostream& err) -> int {
  auto fmt = ParseImageFormat(args.format_);
  if (!fmt.has_value()) {
    err << "Error: Unsupported format '" << args.format_ << "', use JPEG or PNG\n";
    return 1;
  }
  file_path_t     src(args.source_);
  std::error_code ec;
  if (!std::filesystem::exists(src, ec)) {
    err << "Error: Source file does not exist: " << args.source_ << "\n";
    return 1;
  }
  auto dst = ConvertService::ResolveOutputPath(src, args.output_, *fmt);

  ConvertService service(BackendRegistry::CreateDefault());
  auto           converted = service.ConvertImage(src, dst, args.resolution_, *fmt);
  if (!converted) {
    err << "Error: Failed to convert '" << src.string() << "' to '" << dst.string()
        << "': " << converted.message_ << "\n";
    return 1;
  }
  out << "Successfully converted '" << src.string() << "' to '" << dst.string() << "'.\n";
  return 0;
}

auto RunPresets(std::ostream& out) -> int {
  out << "Available resolution presets:\n";
  out << std::string(50, '=') << "\n";
  for (const auto& [name, resolution] : ResolutionResolver::SortedPresets()) {
    out << "  " << std::left << std::setw(20) << name << " " << resolution.ToString() << "\n";
  }
  out << "\nExplicit resolutions such as '1920x1080' are accepted as well.\n";
  return 0;
}

auto RunInfo(const InfoArgs& args, std::ostream& out, std::ostream& err) -> int {
  file_path_t     path(args.file_);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    err << "Error: File does not exist: " << args.file_ << "\n";
    return 1;
  }

  nlohmann::json report;
  try {
    InspectService service(BackendRegistry::CreateDefault());
    report = service.InspectFile(path);
  } catch (const std::exception& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }

  if (args.json_) {
    out << report.dump(2) << "\n";
    return 0;
  }

  out << "Metadata for: " << args.file_ << "\n";
  out << std::string(80, '=') << "\n";
  PrintSection(out, "File Information", report["file"]);
  PrintSection(out, "Image Properties", report["image"]);
  PrintSection(out, "EXIF Data", report["exif"]);
  PrintSection(out, "RAW Metadata", report["raw"]);
  return 0;
}
};  // namespace oolong
