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

#include "app/ingest_service.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "hash/content_hasher.hpp"
#include "image/metadata_extractor.hpp"
#include "io/file/file_scanner.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
namespace {
void ReportProgress(const std::shared_ptr<IngestJob>& job, const IngestProgress& progress) {
  if (job && job->on_progress_) {
    job->on_progress_(progress);
  }
}

void FinishJob(const std::shared_ptr<IngestJob>& job, IngestResult& result) {
  if (!result.errors_.empty() && result.count_ == 0) {
    result.success_ = false;
  }
  if (job && job->on_finished_) {
    job->on_finished_(result);
  }
}
}  // namespace

IngestServiceImpl::IngestServiceImpl(std::shared_ptr<CatalogStore>    catalog,
                                     std::shared_ptr<MediaStore>      media,
                                     std::shared_ptr<BackendRegistry> backends,
                                     DeviceResolver                   resolver)
    : catalog_(std::move(catalog)),
      media_(std::move(media)),
      backends_(std::move(backends)),
      resolver_(std::move(resolver)) {
  if (!catalog_) {
    throw std::invalid_argument("IngestServiceImpl requires a catalog store");
  }
  if (!media_) {
    throw std::invalid_argument("IngestServiceImpl requires a media store");
  }
  if (!backends_) {
    backends_ = std::make_shared<BackendRegistry>();
  }
}

auto IngestServiceImpl::Ingest(const file_path_t& root, const IngestOptions& options,
                               std::shared_ptr<IngestJob> job) -> IngestResult {
  IngestResult result;

  try {
    std::optional<Resolution> resolution;
    if (options.resolution_.has_value() && !options.resolution_->empty()) {
      resolution = ResolutionResolver::Parse(*options.resolution_);
      if (!resolution.has_value()) {
        spdlog::warn("Ignoring invalid resolution '{}'", *options.resolution_);
        result.errors_.push_back("Invalid resolution format: '" + *options.resolution_ +
                                 "'. Use format 'WIDTHxHEIGHT' or a preset name (e.g., 'low', "
                                 "'medium', 'high')");
      }
    }

    auto files = FileScanner::Scan(root, options.recursive_, media_->Root());
    if (files.empty()) {
      result.errors_.push_back("No image files found in: " + root.string());
      result.success_ = false;
      FinishJob(job, result);
      return result;
    }

    IngestProgress progress;
    progress.total_ = static_cast<uint32_t>(files.size());
    spdlog::info("Ingesting {} file(s) from '{}'", files.size(), root.string());

    for (const auto& file : files) {
      if (job && job->IsCanceled()) {
        spdlog::warn("Ingestion canceled after {} of {} file(s)", progress.processed_,
                     progress.total_);
        result.errors_.push_back("Ingestion canceled after " +
                                 std::to_string(progress.processed_) + " of " +
                                 std::to_string(progress.total_) + " file(s)");
        break;
      }

      FileUnit unit;
      unit.file_ = file;
      try {
        auto outcome = ProcessFile(unit, options, resolution);
        if (outcome == FileOutcome::SKIPPED) {
          ++result.skipped_;
          ++progress.skipped_;
        } else {
          ++result.count_;
          ++progress.succeeded_;
          if (unit.hashed_) ++result.hashes_calculated_;
          if (unit.stored_) ++result.images_stored_;
          for (const auto& issue : unit.issues_) {
            result.errors_.push_back(file.string() + ": " + issue);
          }
        }
      } catch (const std::exception& e) {
        DiscardWrittenFiles(unit);
        spdlog::error("Rolled back '{}': {}", file.string(), e.what());
        result.errors_.push_back("Error processing " + file.string() + ": " + e.what());
        ++progress.failed_;
      }
      ++progress.processed_;
      ReportProgress(job, progress);
    }
  } catch (const std::exception& e) {
    spdlog::error("Ingestion of '{}' failed: {}", root.string(), e.what());
    result.success_ = false;
    result.errors_.push_back(std::string("Error during ingestion: ") + e.what());
  }

  FinishJob(job, result);
  spdlog::info("Ingested {} photo(s), skipped {}, {} error(s)", result.count_, result.skipped_,
               result.errors_.size());
  return result;
}

auto IngestServiceImpl::ProcessFile(FileUnit& unit, const IngestOptions& options,
                                    const std::optional<Resolution>& resolution) -> FileOutcome {
  auto location = resolver_.Resolve(unit.file_);
  if (options.device_.has_value()) {
    location.device_id_    = *options.device_;
    location.storage_path_ =
        conv::EscapeInvalidUtf8(DeviceResolver::CanonicalizeLenient(unit.file_).generic_string());
    location.mount_point_.reset();
  }

  TransactionGuard tx(*catalog_);

  if (catalog_->FindPath(location.storage_path_, location.device_id_).has_value()) {
    spdlog::debug("'{}' on '{}' is already cataloged", location.storage_path_,
                  location.device_id_);
    return FileOutcome::SKIPPED;
  }

  auto photograph = ResolveOrCreatePhotograph(unit, options);

  if (options.store_images_ && !photograph.stored_image_.has_value()) {
    auto stored = StoreImage(unit, options, resolution);
    if (stored) {
      photograph.stored_image_ = *stored.value_;
      unit.stored_             = true;
    } else {
      unit.issues_.push_back(stored.message_);
    }
  }

  if (!photograph.capture_time_.has_value()) {
    FillMetadata(unit, photograph);
  }

  if (!unit.issues_.empty()) {
    photograph.has_errors_ = true;
  }
  if (photograph.IsPersisted()) {
    catalog_->UpdatePhotograph(photograph);
  } else {
    catalog_->CreatePhotograph(photograph);
  }

  auto attrs = FileScanner::ReadAttributes(unit.file_);
  if (!attrs) {
    throw std::runtime_error(attrs.message_);
  }
  PhotoPath path;
  path.path_             = location.storage_path_;
  path.device_           = location.device_id_;
  path.size_             = attrs.value_->size_;
  path.file_created_at_  = attrs.value_->created_at_;
  path.file_modified_at_ = attrs.value_->modified_at_;
  path.photograph_id_    = photograph.id_;
  catalog_->CreateOrUpdatePath(path);

  tx.Commit();
  spdlog::info("Cataloged '{}' as photograph {}", unit.file_.string(), photograph.id_);
  return FileOutcome::COMMITTED;
}

auto IngestServiceImpl::ResolveOrCreatePhotograph(FileUnit& unit, const IngestOptions& options)
    -> Photograph {
  if (!options.hash_) {
    return Photograph{};
  }

  auto digest = ContentHasher::HashFile(unit.file_);
  if (!digest) {
    spdlog::warn("Hashing '{}' failed: {}", unit.file_.string(), digest.message_);
    unit.issues_.push_back(digest.message_);
    return Photograph{};
  }
  unit.hashed_   = true;
  auto hex       = digest.value_->ToString();
  auto existing  = catalog_->FindPhotographByHash(hex);
  if (existing.has_value()) {
    spdlog::debug("'{}' links to photograph {}", unit.file_.string(), existing->id_);
    return std::move(*existing);
  }
  Photograph created;
  created.content_hash_ = hex;
  return created;
}

auto IngestServiceImpl::StoreImage(FileUnit& unit, const IngestOptions& options,
                                   const std::optional<Resolution>& resolution)
    -> StageResult<std::string> {
  const auto fmt     = options.output_format_;
  auto       backend = backends_->GetBackend(unit.file_);
  if (backend) {
    spdlog::debug("Backend {} claimed '{}'", backend->Name(), unit.file_.string());
    std::optional<std::vector<uint8_t>> bytes;
    std::string                         failure = "could not decode the file";
    try {
      bytes = backend->Decode(unit.file_, fmt, resolution);
    } catch (const std::exception& e) {
      failure = std::string("failed: ") + e.what();
    }
    if (bytes.has_value()) {
      auto stored = media_->Store(*bytes, ImageFormatExtension(fmt));
      if (stored) unit.written_.push_back(*stored.value_);
      return stored;
    }
    unit.issues_.push_back("Backend " + backend->Name() + " " + failure);
    spdlog::warn("Backend {} could not decode '{}', using the generic path", backend->Name(),
                 unit.file_.string());
  }

  if (!resolution.has_value()) {
    auto stored = media_->StoreCopy(unit.file_);
    if (stored) unit.written_.push_back(*stored.value_);
    return stored;
  }

  auto bitmap = Transcoder::DecodeFile(unit.file_);
  if (bitmap.empty()) {
    return StageResult<std::string>::Fail(ErrorCode::DECODE_ERROR,
                                          "Cannot decode image for resizing");
  }
  std::vector<uint8_t> encoded;
  try {
    encoded = Transcoder::ResizeAndEncode(bitmap, resolution, fmt);
  } catch (const std::exception& e) {
    return StageResult<std::string>::Fail(ErrorCode::DECODE_ERROR,
                                          std::string("Resize failed: ") + e.what());
  }
  auto stored = media_->Store(encoded, ImageFormatExtension(fmt));
  if (stored) unit.written_.push_back(*stored.value_);
  return stored;
}

void IngestServiceImpl::FillMetadata(FileUnit& unit, Photograph& photograph) {
  try {
    auto metadata = MetadataExtractor::Extract(unit.file_);
    if (metadata.capture_time_.has_value()) {
      photograph.capture_time_ = metadata.capture_time_;
    }
    if (!photograph.camera_model_.has_value() && metadata.camera_model_.has_value()) {
      photograph.camera_model_ = metadata.camera_model_;
    }
  } catch (const std::exception& e) {
    spdlog::warn("Metadata extraction for '{}' failed: {}", unit.file_.string(), e.what());
    unit.issues_.push_back(std::string("Metadata extraction failed: ") + e.what());
  }
}

void IngestServiceImpl::DiscardWrittenFiles(FileUnit& unit) {
  for (const auto& reference : unit.written_) {
    media_->Remove(reference);
  }
  unit.written_.clear();
}
};  // namespace oolong
