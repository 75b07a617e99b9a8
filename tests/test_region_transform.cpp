#include <gtest/gtest.h>

#include <climits>

#include <opencv2/core.hpp>

#include "region_redact/errors.hpp"
#include "region_redact/region_transform.hpp"

using namespace region_redact;

namespace {

/// Checkerboard with 1-pixel cells, guaranteed to change under blur
cv::Mat checkerboard(int width, int height) {
  cv::Mat frame(height, width, CV_8UC3);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      unsigned char v = ((x + y) % 2) ? 255 : 0;
      frame.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
    }
  }
  return frame;
}

} // namespace

TEST(RegionTransform, PreservesFrameDimensionsAndType) {
  cv::Mat frame = checkerboard(160, 120);
  apply_redaction(frame, Region{10, 20, 60, 40}, BlurParameters{15, 0});

  EXPECT_EQ(frame.cols, 160);
  EXPECT_EQ(frame.rows, 120);
  EXPECT_EQ(frame.type(), CV_8UC3);
}

TEST(RegionTransform, OnlyRegionPixelsChange) {
  const Region region{10, 20, 60, 40};
  cv::Mat original = checkerboard(160, 120);
  cv::Mat frame = original.clone();

  apply_redaction(frame, region, BlurParameters{15, 0});

  cv::Rect rect(region.x, region.y, region.width, region.height);
  cv::Mat outside_mask(frame.size(), CV_8UC1, cv::Scalar(255));
  outside_mask(rect).setTo(0);

  cv::Mat diff;
  cv::absdiff(frame, original, diff);
  cv::Mat diff_gray;
  cv::extractChannel(diff, diff_gray, 0);

  cv::Mat outside_diff;
  diff_gray.copyTo(outside_diff, outside_mask);
  EXPECT_EQ(cv::countNonZero(outside_diff), 0);
  EXPECT_GT(cv::countNonZero(diff_gray(rect)), 0);
}

TEST(RegionTransform, RegionTouchingFrameEdgeIsAccepted) {
  cv::Mat frame = checkerboard(64, 48);
  EXPECT_NO_THROW(
      apply_redaction(frame, Region{32, 24, 32, 24}, BlurParameters{5, 0}));
}

TEST(RegionTransform, RegionSmallerThanPixelateFactorStillWorks) {
  cv::Mat frame = checkerboard(64, 48);
  EXPECT_NO_THROW(
      apply_redaction(frame, Region{0, 0, 3, 2}, BlurParameters{3, 0}));
  EXPECT_EQ(frame.cols, 64);
}

TEST(RegionTransform, OutOfBoundsRegionThrows) {
  cv::Mat frame = checkerboard(64, 48);
  cv::Mat untouched = frame.clone();

  try {
    apply_redaction(frame, Region{40, 10, 30, 10}, BlurParameters{5, 0});
    FAIL() << "expected RegionOutOfBounds";
  } catch (const RedactError &e) {
    EXPECT_EQ(e.code(), ErrorCode::RegionOutOfBounds);
  }
  EXPECT_EQ(cv::norm(frame, untouched, cv::NORM_INF), 0.0);
}

TEST(RegionTransform, BoundsCheckRejectsNegativeAndEmptyRegions) {
  EXPECT_THROW(check_region_bounds(Region{-1, 0, 10, 10}, 64, 48),
               RedactError);
  EXPECT_THROW(check_region_bounds(Region{0, -1, 10, 10}, 64, 48),
               RedactError);
  EXPECT_THROW(check_region_bounds(Region{0, 0, 0, 10}, 64, 48), RedactError);
  EXPECT_THROW(check_region_bounds(Region{0, 0, 10, 49}, 64, 48),
               RedactError);
  EXPECT_THROW(check_region_bounds(Region{INT_MAX - 10, 0, 300, 10}, 640, 480),
               RedactError);
  EXPECT_THROW(check_region_bounds(Region{0, INT_MAX, 10, INT_MAX}, 640, 480),
               RedactError);
  EXPECT_THROW(check_region_bounds(Region{65, 0, 1, 1}, 64, 48), RedactError);
  EXPECT_NO_THROW(check_region_bounds(Region{0, 0, 64, 48}, 64, 48));
}

TEST(RegionTransform, OutOfBoundsMessageNamesRegionAndFrame) {
  try {
    check_region_bounds(Region{100, 200, 300, 250}, 320, 240);
    FAIL() << "expected RegionOutOfBounds";
  } catch (const RedactError &e) {
    EXPECT_STREQ(e.what(), "Region (100,200 300x250) exceeds frame size "
                           "(320x240)");
  }
}

TEST(RegionTransform, UniformRegionStaysUniformInsideBusyFrame) {
  const cv::Scalar colour(40, 90, 200);
  const Region region{16, 16, 64, 64};
  const cv::Rect rect(region.x, region.y, region.width, region.height);

  for (int i = 0; i < 10; ++i) {
    cv::Mat original = checkerboard(128, 96);
    original(rect).setTo(colour);
    cv::Mat frame = original.clone();

    apply_redaction(frame, region, BlurParameters{55, 0});

    cv::Mat expected(region.height, region.width, CV_8UC3, colour);
    EXPECT_EQ(cv::norm(frame(rect), expected, cv::NORM_INF), 0.0)
        << "frame " << i;
    EXPECT_EQ(cv::norm(frame, original, cv::NORM_INF), 0.0) << "frame " << i;
  }
}
