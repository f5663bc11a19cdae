#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "app/ingest_service.hpp"
#include "decoders/backend_registry.hpp"
#include "device/device_resolver.hpp"
#include "io/media/media_store.hpp"
#include "storage/catalog/catalog_store.hpp"
#include "test_support/temp_dir_fixation.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
class IngestServiceTests : public TempDirTests {
 protected:
  std::shared_ptr<DuckDBCatalogStore> catalog_;
  std::shared_ptr<MediaStore>         media_;
  std::shared_ptr<BackendRegistry>    backends_;

  // Run before any unit test runs
  void                                SetUp() override {
    TempDirTests::SetUp();
    catalog_  = std::make_shared<DuckDBCatalogStore>(root_ / "catalog.duckdb");
    media_    = std::make_shared<MediaStore>(root_ / "media");
    backends_ = std::make_shared<BackendRegistry>();
  }

  void TearDown() override {
    catalog_.reset();
    TempDirTests::TearDown();
  }

  // No mount table, every file resolves to the fake host and its absolute path
  auto MakeService(std::shared_ptr<CatalogStore> catalog = nullptr)
      -> std::unique_ptr<IngestService> {
    DeviceEnvironment env;
    env.mount_table_       = root_ / "no_such_mounts";
    env.by_label_dir_      = root_ / "no_such_by_label";
    env.by_uuid_dir_       = root_ / "no_such_by_uuid";
    env.hostname_provider_ = [] { return std::string("test-host"); };
    if (!catalog) catalog = catalog_;
    return std::make_unique<IngestServiceImpl>(catalog, media_, backends_, DeviceResolver(env));
  }

  auto PathOf(const std::filesystem::path& file, const std::string& device = "test-host")
      -> std::optional<PhotoPath> {
    return catalog_->FindPath(
        conv::EscapeInvalidUtf8(std::filesystem::canonical(file).generic_string()), device);
  }

  auto PhotographOf(const std::filesystem::path& file) -> std::optional<Photograph> {
    auto path = PathOf(file);
    if (!path || !path->photograph_id_) return std::nullopt;
    return catalog_->GetPhotograph(*path->photograph_id_);
  }
};
};  // namespace oolong
