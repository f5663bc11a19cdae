#include "io/image/transcoder.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "test_support/temp_dir_fixation.hpp"

namespace oolong {
TEST(TranscoderTest, FitsWideSourceIntoTarget) {
  auto size = Transcoder::ComputeTargetSize(4000, 3000, {1920, 1080});
  EXPECT_EQ(size.width, 1440);
  EXPECT_EQ(size.height, 1080);

  size = Transcoder::ComputeTargetSize(6000, 2000, {1920, 1080});
  EXPECT_EQ(size.width, 1920);
  EXPECT_EQ(size.height, 640);

  size = Transcoder::ComputeTargetSize(3000, 4000, {1920, 1080});
  EXPECT_EQ(size.width, 810);
  EXPECT_EQ(size.height, 1080);
}

TEST(TranscoderTest, UpscalesSmallSourceToTarget) {
  auto size = Transcoder::ComputeTargetSize(640, 480, {1280, 960});
  EXPECT_EQ(size.width, 1280);
  EXPECT_EQ(size.height, 960);
}

TEST(TranscoderTest, RejectsDegenerateSizes) {
  EXPECT_THROW(Transcoder::ComputeTargetSize(0, 100, {10, 10}), std::invalid_argument);
  EXPECT_THROW(Transcoder::Resize(cv::Mat(), {10, 10}), std::invalid_argument);
  EXPECT_THROW(Transcoder::Encode(cv::Mat(), ImageFormatType::JPEG), std::invalid_argument);
}

TEST(TranscoderTest, ParsesFormatNames) {
  EXPECT_EQ(ParseImageFormat("JPEG"), ImageFormatType::JPEG);
  EXPECT_EQ(ParseImageFormat("jpg"), ImageFormatType::JPEG);
  EXPECT_EQ(ParseImageFormat(" png "), ImageFormatType::PNG);
  EXPECT_FALSE(ParseImageFormat("tiff").has_value());
  EXPECT_STREQ(ImageFormatExtension(ImageFormatType::PNG), ".png");
  EXPECT_STREQ(ImageFormatName(ImageFormatType::JPEG), "JPEG");
}

TEST(TranscoderTest, JpegCompositesAlphaOnWhite) {
  cv::Mat transparent(4, 4, CV_8UC4, cv::Scalar(0, 0, 0, 0));
  cv::Mat flat = Transcoder::NormalizeForFormat(transparent, ImageFormatType::JPEG);
  ASSERT_EQ(flat.channels(), 3);
  EXPECT_EQ(flat.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 255, 255));

  cv::Mat opaque(4, 4, CV_8UC4, cv::Scalar(10, 20, 30, 255));
  flat = Transcoder::NormalizeForFormat(opaque, ImageFormatType::JPEG);
  EXPECT_EQ(flat.at<cv::Vec3b>(1, 1), cv::Vec3b(10, 20, 30));

  cv::Mat kept = Transcoder::NormalizeForFormat(transparent, ImageFormatType::PNG);
  EXPECT_EQ(kept.channels(), 4);
}

TEST(TranscoderTest, SixteenBitIsReducedToEightBit) {
  cv::Mat wide(2, 2, CV_16UC3, cv::Scalar(65535, 0, 257 * 100));
  cv::Mat narrow = Transcoder::NormalizeForFormat(wide, ImageFormatType::PNG);
  EXPECT_EQ(narrow.depth(), CV_8U);
  EXPECT_EQ(narrow.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 100));
}

TEST(TranscoderTest, ResizeAndEncodeProducesDecodableOutput) {
  cv::Mat src(300, 400, CV_8UC3, cv::Scalar(40, 80, 120));
  auto    bytes = Transcoder::ResizeAndEncode(src, Resolution{200, 200}, ImageFormatType::PNG);
  ASSERT_FALSE(bytes.empty());
  cv::Mat decoded = Transcoder::DecodeBuffer(bytes);
  ASSERT_FALSE(decoded.empty());
  EXPECT_EQ(decoded.cols, 200);
  EXPECT_EQ(decoded.rows, 150);

  auto jpeg = Transcoder::ResizeAndEncode(src, std::nullopt, ImageFormatType::JPEG);
  ASSERT_GE(jpeg.size(), 2u);
  EXPECT_EQ(jpeg[0], 0xFF);
  EXPECT_EQ(jpeg[1], 0xD8);
}

TEST(TranscoderTest, UndecodableDataGivesEmptyMat) {
  std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
  EXPECT_TRUE(Transcoder::DecodeBuffer(garbage).empty());
  EXPECT_TRUE(Transcoder::DecodeBuffer({}).empty());
  EXPECT_TRUE(Transcoder::DecodeFile("/nonexistent/oolong/a.png").empty());
}
};  // namespace oolong
