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

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "decoders/backend_registry.hpp"
#include "device/device_resolver.hpp"
#include "io/image/transcoder.hpp"
#include "io/media/media_store.hpp"
#include "resolution/resolution.hpp"
#include "storage/catalog/catalog_store.hpp"
#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
struct IngestOptions {
  // "WIDTHxHEIGHT" or a preset name, applied to stored images
  std::optional<std::string> resolution_{};
  bool                       hash_          = false;
  bool                       recursive_     = true;
  bool                       store_images_  = false;
  // Replaces the resolved device identifier, paths are then stored absolute
  std::optional<device_id_t> device_{};
  ImageFormatType            output_format_ = ImageFormatType::JPEG;
};

struct IngestProgress {
  uint32_t total_     = 0;
  uint32_t processed_ = 0;
  uint32_t succeeded_ = 0;
  uint32_t skipped_   = 0;
  uint32_t failed_    = 0;
};

struct IngestResult {
  // False only when nothing was ingested and at least one error occurred
  bool                     success_           = true;
  uint32_t                 count_             = 0;
  uint32_t                 hashes_calculated_ = 0;
  uint32_t                 images_stored_     = 0;
  uint32_t                 skipped_           = 0;
  std::vector<std::string> errors_{};
};

class IngestJob {
 public:
  using ProgressCallback = std::function<void(const IngestProgress&)>;
  using FinishedCallback = std::function<void(const IngestResult&)>;

  // Cancellation token, honored between files
  std::atomic<bool> canceled_{false};

  ProgressCallback  on_progress_{};
  FinishedCallback  on_finished_{};

  void              Cancel() { canceled_.store(true); }
  auto              IsCanceled() const -> bool { return canceled_.load(); }
};

class IngestService {
 public:
  virtual ~IngestService() = default;

  /**
   * @brief Walk a root and catalog every recognized image below it, one transaction per
   *        file. Per-file failures are collected in the result, they never abort the batch.
   *
   * @param root directory or single file
   * @param options
   * @param job optional progress / cancellation handle
   * @return IngestResult
   */
  virtual auto Ingest(const file_path_t& root, const IngestOptions& options = {},
                      std::shared_ptr<IngestJob> job = nullptr) -> IngestResult = 0;
};

class IngestServiceImpl final : public IngestService {
 public:
  IngestServiceImpl(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<MediaStore> media,
                    std::shared_ptr<BackendRegistry> backends, DeviceResolver resolver = {});

  auto Ingest(const file_path_t& root, const IngestOptions& options = {},
              std::shared_ptr<IngestJob> job = nullptr) -> IngestResult override;

 private:
  enum class FileOutcome : uint8_t { COMMITTED, SKIPPED };

  // Bookkeeping of one file while its transaction is open
  struct FileUnit {
    file_path_t              file_;
    bool                     hashed_ = false;
    bool                     stored_ = false;
    std::vector<std::string> written_{};
    std::vector<std::string> issues_{};
  };

  auto ProcessFile(FileUnit& unit, const IngestOptions& options,
                   const std::optional<Resolution>& resolution) -> FileOutcome;

  auto ResolveOrCreatePhotograph(FileUnit& unit, const IngestOptions& options) -> Photograph;

  auto StoreImage(FileUnit& unit, const IngestOptions& options,
                  const std::optional<Resolution>& resolution) -> StageResult<std::string>;

  void FillMetadata(FileUnit& unit, Photograph& photograph);

  void DiscardWrittenFiles(FileUnit& unit);

  std::shared_ptr<CatalogStore>    catalog_;
  std::shared_ptr<MediaStore>      media_;
  std::shared_ptr<BackendRegistry> backends_;
  DeviceResolver                   resolver_;
};
};  // namespace oolong
