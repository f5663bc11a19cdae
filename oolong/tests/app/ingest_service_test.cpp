#include "app/ingest_service.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "hash/content_hasher.hpp"
#include "ingest_test_fixation.hpp"
#include "io/image/transcoder.hpp"
#include "utils/clock/time_provider.hpp"

namespace oolong {
namespace {
class ThrowingBackend final : public ImageBackend {
 public:
  auto Name() const -> std::string override { return "throwing"; }
  auto CanProcess(const image_path_t& path) const -> bool override {
    return std::filesystem::exists(path);
  }
  auto Decode(const image_path_t&, ImageFormatType, const std::optional<Resolution>&)
      -> std::optional<std::vector<uint8_t>> override {
    throw std::runtime_error("sensor data truncated");
  }
};

// Delegates to the real store, refuses to record paths whose name contains reject_
class PathRejectingStore final : public CatalogStore {
 public:
  PathRejectingStore(std::shared_ptr<CatalogStore> inner, std::string reject)
      : inner_(std::move(inner)), reject_(std::move(reject)) {}

  auto FindPhotographByHash(const std::string& content_hash)
      -> std::optional<Photograph> override {
    return inner_->FindPhotographByHash(content_hash);
  }
  auto GetPhotograph(photograph_id_t id) -> std::optional<Photograph> override {
    return inner_->GetPhotograph(id);
  }
  auto CreatePhotograph(Photograph& photograph) -> photograph_id_t override {
    return inner_->CreatePhotograph(photograph);
  }
  void UpdatePhotograph(Photograph& photograph) override { inner_->UpdatePhotograph(photograph); }
  void RemovePhotograph(photograph_id_t id) override { inner_->RemovePhotograph(id); }
  auto FindPath(const std::string& path, const device_id_t& device)
      -> std::optional<PhotoPath> override {
    return inner_->FindPath(path, device);
  }
  auto CreateOrUpdatePath(PhotoPath& path) -> photo_path_id_t override {
    if (path.path_.find(reject_) != std::string::npos) {
      throw std::runtime_error("disk full");
    }
    return inner_->CreateOrUpdatePath(path);
  }
  auto GetPathsOfPhotograph(photograph_id_t id) -> std::vector<PhotoPath> override {
    return inner_->GetPathsOfPhotograph(id);
  }
  auto CountPhotographs() -> int64_t override { return inner_->CountPhotographs(); }
  auto CountPaths() -> int64_t override { return inner_->CountPaths(); }
  void BeginTransaction() override { inner_->BeginTransaction(); }
  void Commit() override { inner_->Commit(); }
  void Rollback() override { inner_->Rollback(); }

 private:
  std::shared_ptr<CatalogStore> inner_;
  std::string                   reject_;
};

auto FilesIn(const std::filesystem::path& dir) -> size_t {
  if (!std::filesystem::exists(dir)) return 0;
  return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                           std::filesystem::directory_iterator{}));
}

auto Contains(const std::vector<std::string>& errors, const std::string& needle) -> bool {
  return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
    return e.find(needle) != std::string::npos;
  });
}
}  // namespace

TEST_F(IngestServiceTests, RequiresCatalogAndMediaStore) {
  EXPECT_THROW(IngestServiceImpl(nullptr, media_, backends_), std::invalid_argument);
  EXPECT_THROW(IngestServiceImpl(catalog_, nullptr, backends_), std::invalid_argument);
  EXPECT_NO_THROW(IngestServiceImpl(catalog_, media_, nullptr));
}

TEST_F(IngestServiceTests, IdenticalContentSharesOnePhotograph) {
  auto a = WriteImage("photos/a.png", 64, 48, 0);
  auto b = WriteImage("photos/copies/b.png", 64, 48, 0);
  auto c = WriteImage("photos/c.png", 64, 48, 1);

  IngestOptions options;
  options.hash_ = true;
  auto result   = MakeService()->Ingest(root_ / "photos", options);

  EXPECT_TRUE(result.success_);
  EXPECT_TRUE(result.errors_.empty());
  EXPECT_EQ(result.count_, 3u);
  EXPECT_EQ(result.hashes_calculated_, 3u);
  EXPECT_EQ(catalog_->CountPhotographs(), 2);
  EXPECT_EQ(catalog_->CountPaths(), 3);

  auto photo_a = PhotographOf(a);
  auto photo_b = PhotographOf(b);
  auto photo_c = PhotographOf(c);
  ASSERT_TRUE(photo_a && photo_b && photo_c);
  EXPECT_EQ(photo_a->id_, photo_b->id_);
  EXPECT_NE(photo_a->id_, photo_c->id_);
  ASSERT_TRUE(photo_a->content_hash_.has_value());
  EXPECT_EQ(photo_a->content_hash_->size(), 32u);
  EXPECT_EQ(catalog_->GetPathsOfPhotograph(photo_a->id_).size(), 2u);
}

TEST_F(IngestServiceTests, WithoutHashingEveryFileIsItsOwnPhotograph) {
  WriteImage("photos/a.png", 16, 16, 0);
  WriteImage("photos/b.png", 16, 16, 0);
  auto result = MakeService()->Ingest(root_ / "photos");
  EXPECT_EQ(result.count_, 2u);
  EXPECT_EQ(result.hashes_calculated_, 0u);
  EXPECT_EQ(catalog_->CountPhotographs(), 2);
  EXPECT_FALSE(PhotographOf(root_ / "photos" / "a.png")->content_hash_.has_value());
}

TEST_F(IngestServiceTests, RerunIsNoOp) {
  WriteImage("photos/a.png", 16, 16, 0);
  WriteImage("photos/b.jpg", 16, 16, 1);
  IngestOptions options;
  options.hash_ = true;
  auto service  = MakeService();

  auto first    = service->Ingest(root_ / "photos", options);
  EXPECT_EQ(first.count_, 2u);

  auto second = service->Ingest(root_ / "photos", options);
  EXPECT_TRUE(second.success_);
  EXPECT_EQ(second.count_, 0u);
  EXPECT_EQ(second.skipped_, 2u);
  EXPECT_TRUE(second.errors_.empty());
  EXPECT_EQ(catalog_->CountPhotographs(), 2);
  EXPECT_EQ(catalog_->CountPaths(), 2);
}

TEST_F(IngestServiceTests, ManagedStorageInsideSourceIsNeverIngested) {
  media_ = std::make_shared<MediaStore>(root_ / "photos" / ".oolong");
  WriteImage("photos/a.png", 16, 16, 0);
  WriteImage("photos/b.png", 16, 16, 1);

  IngestOptions options;
  options.store_images_ = true;
  auto service          = MakeService();
  auto first            = service->Ingest(root_ / "photos", options);
  EXPECT_EQ(first.count_, 2u);
  EXPECT_EQ(first.images_stored_, 2u);

  auto second = service->Ingest(root_ / "photos", options);
  EXPECT_EQ(second.count_, 0u);
  EXPECT_EQ(second.skipped_, 2u);
  EXPECT_EQ(catalog_->CountPaths(), 2);
}

TEST_F(IngestServiceTests, FailingBackendFlagsPhotographAndBatchContinues) {
  backends_->Register(".nef", std::make_shared<ThrowingBackend>());
  auto raw  = WriteBytes("photos/DSC_0001.NEF", "not really a nikon file");
  auto good = WriteImage("photos/z.png", 16, 16, 2);

  IngestOptions options;
  options.hash_         = true;
  options.store_images_ = true;
  auto result           = MakeService()->Ingest(root_ / "photos", options);

  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.count_, 2u);
  EXPECT_TRUE(Contains(result.errors_, "Backend throwing failed: sensor data truncated"));

  auto flagged = PhotographOf(raw);
  ASSERT_TRUE(flagged.has_value());
  EXPECT_TRUE(flagged->has_errors_);
  EXPECT_TRUE(flagged->content_hash_.has_value());

  auto clean = PhotographOf(good);
  ASSERT_TRUE(clean.has_value());
  EXPECT_FALSE(clean->has_errors_);
  ASSERT_TRUE(clean->stored_image_.has_value());
  EXPECT_TRUE(std::filesystem::exists(media_->Resolve(*clean->stored_image_)));
}

TEST_F(IngestServiceTests, FailedPathWriteRollsBackTheWholeFile) {
  auto a = WriteImage("photos/a.png", 16, 16, 0);
  auto b = WriteImage("photos/b.png", 16, 16, 1);
  auto c = WriteImage("photos/c.png", 16, 16, 2);

  IngestOptions options;
  options.hash_         = true;
  options.store_images_ = true;
  auto store            = std::make_shared<PathRejectingStore>(catalog_, "b.png");
  auto result           = MakeService(store)->Ingest(root_ / "photos", options);

  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.count_, 2u);
  EXPECT_EQ(result.images_stored_, 2u);
  EXPECT_TRUE(Contains(result.errors_, "Error processing "));
  EXPECT_TRUE(Contains(result.errors_, "b.png: disk full"));

  EXPECT_EQ(catalog_->CountPhotographs(), 2);
  EXPECT_EQ(catalog_->CountPaths(), 2);
  EXPECT_FALSE(PathOf(b).has_value());
  EXPECT_FALSE(catalog_->FindPhotographByHash(
                           ContentHasher::HashFile(b).value_->ToString())
                   .has_value());

  // Only the committed files keep a stored bitmap
  EXPECT_EQ(FilesIn(media_->PhotographDir()), 2u);
  auto photo_a = PhotographOf(a);
  auto photo_c = PhotographOf(c);
  ASSERT_TRUE(photo_a && photo_c);
  ASSERT_TRUE(photo_a->stored_image_ && photo_c->stored_image_);
  EXPECT_TRUE(std::filesystem::exists(media_->Resolve(*photo_a->stored_image_)));
  EXPECT_TRUE(std::filesystem::exists(media_->Resolve(*photo_c->stored_image_)));
}

TEST_F(IngestServiceTests, UndecodableNameBytesStayDistinct) {
  auto first  = WriteImage(std::filesystem::path("photos") / std::string("a\xff.png"), 16, 16, 0);
  auto second = WriteImage(std::filesystem::path("photos") / std::string("a\xfe.png"), 16, 16, 1);

  auto service = MakeService();
  auto result  = service->Ingest(root_ / "photos");
  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.count_, 2u);
  EXPECT_EQ(result.skipped_, 0u);
  EXPECT_EQ(catalog_->CountPaths(), 2);

  auto first_path  = PathOf(first);
  auto second_path = PathOf(second);
  ASSERT_TRUE(first_path && second_path);
  EXPECT_TRUE(first_path->path_.ends_with("/a%FF.png")) << first_path->path_;
  EXPECT_TRUE(second_path->path_.ends_with("/a%FE.png")) << second_path->path_;
  EXPECT_NE(first_path->photograph_id_, second_path->photograph_id_);

  auto rerun = service->Ingest(root_ / "photos");
  EXPECT_EQ(rerun.count_, 0u);
  EXPECT_EQ(rerun.skipped_, 2u);
}

TEST_F(IngestServiceTests, StoredImagesAreResized) {
  auto src = WriteImage("photos/big.png", 400, 300, 0);

  IngestOptions options;
  options.store_images_  = true;
  options.resolution_    = "200x200";
  options.output_format_ = ImageFormatType::PNG;
  auto result            = MakeService()->Ingest(root_ / "photos", options);
  EXPECT_EQ(result.images_stored_, 1u);

  auto photo = PhotographOf(src);
  ASSERT_TRUE(photo && photo->stored_image_);
  EXPECT_TRUE(photo->stored_image_->ends_with(".png"));
  cv::Mat stored = Transcoder::DecodeFile(media_->Resolve(*photo->stored_image_));
  ASSERT_FALSE(stored.empty());
  EXPECT_EQ(stored.cols, 200);
  EXPECT_EQ(stored.rows, 150);
}

TEST_F(IngestServiceTests, InvalidResolutionIsReportedButNotFatal) {
  WriteImage("photos/a.png", 16, 16, 0);
  IngestOptions options;
  options.store_images_ = true;
  options.resolution_   = "bogus";
  auto result           = MakeService()->Ingest(root_ / "photos", options);

  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.count_, 1u);
  EXPECT_EQ(result.images_stored_, 1u);
  ASSERT_FALSE(result.errors_.empty());
  EXPECT_EQ(result.errors_.front(),
            "Invalid resolution format: 'bogus'. Use format 'WIDTHxHEIGHT' or a preset name "
            "(e.g., 'low', 'medium', 'high')");
}

TEST_F(IngestServiceTests, CaptureMetadataIsFilled) {
  auto photo = WriteImage("photos/tagged.jpg", 32, 32, 0);
  WriteExifTags(photo, {{"Exif.Photo.DateTimeOriginal", "2020:07:04 18:30:05"},
                        {"Exif.Image.Model", "ILCE-7M3"}});

  auto result = MakeService()->Ingest(root_ / "photos");
  EXPECT_EQ(result.count_, 1u);
  auto record = PhotographOf(photo);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->camera_model_, "ILCE-7M3");
  ASSERT_TRUE(record->capture_time_.has_value());
  EXPECT_EQ(TimeProvider::ToSqlTimestamp(*record->capture_time_), "2020-07-04 18:30:05.000000");
}

TEST_F(IngestServiceTests, DeviceOverrideIsStored) {
  auto photo = WriteImage("photos/a.png", 16, 16, 0);
  IngestOptions options;
  options.device_ = "archive-disk";
  auto result     = MakeService()->Ingest(root_ / "photos", options);
  EXPECT_EQ(result.count_, 1u);
  EXPECT_TRUE(PathOf(photo, "archive-disk").has_value());
  EXPECT_FALSE(PathOf(photo).has_value());
}

TEST_F(IngestServiceTests, SingleFileRoot) {
  auto photo  = WriteImage("photos/a.png", 16, 16, 0);
  WriteImage("photos/b.png", 16, 16, 1);
  auto result = MakeService()->Ingest(photo);
  EXPECT_EQ(result.count_, 1u);
  EXPECT_EQ(catalog_->CountPaths(), 1);
}

TEST_F(IngestServiceTests, MissingRootFailsTheCall) {
  auto result = MakeService()->Ingest(root_ / "does_not_exist");
  EXPECT_FALSE(result.success_);
  EXPECT_EQ(result.count_, 0u);
  ASSERT_EQ(result.errors_.size(), 1u);
  EXPECT_TRUE(result.errors_.front().starts_with("Error during ingestion: "));
}

TEST_F(IngestServiceTests, EmptyRootFailsTheCall) {
  WriteBytes("photos/readme.txt", "nothing to see");
  auto result = MakeService()->Ingest(root_ / "photos");
  EXPECT_FALSE(result.success_);
  ASSERT_EQ(result.errors_.size(), 1u);
  EXPECT_EQ(result.errors_.front(), "No image files found in: " + (root_ / "photos").string());
}

TEST_F(IngestServiceTests, ProgressAndCancellation) {
  WriteImage("photos/a.png", 16, 16, 0);
  WriteImage("photos/b.png", 16, 16, 1);
  WriteImage("photos/c.png", 16, 16, 2);

  auto                        job = std::make_shared<IngestJob>();
  std::vector<IngestProgress> seen;
  bool                        finished = false;
  job->on_progress_                    = [&](const IngestProgress& progress) {
    seen.push_back(progress);
    job->Cancel();
  };
  job->on_finished_ = [&](const IngestResult&) { finished = true; };

  auto result       = MakeService()->Ingest(root_ / "photos", {}, job);
  EXPECT_TRUE(finished);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].total_, 3u);
  EXPECT_EQ(seen[0].processed_, 1u);
  EXPECT_EQ(result.count_, 1u);
  EXPECT_TRUE(result.success_);
  ASSERT_FALSE(result.errors_.empty());
  EXPECT_EQ(result.errors_.back(), "Ingestion canceled after 1 of 3 file(s)");
  EXPECT_EQ(catalog_->CountPaths(), 1);
}
};  // namespace oolong
