/**
 * @file region_transform.cpp
 * @brief Blur + pixelation of the redaction region
 */

#include "region_redact/region_transform.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <opencv2/imgproc.hpp>

#include "region_redact/errors.hpp"

namespace region_redact {

void check_region_bounds(const Region &region, int frame_width,
                         int frame_height) {
  /// Compare against the remaining extent so large coordinates cannot overflow
  bool fits = region.x >= 0 && region.y >= 0 && region.width > 0 &&
              region.height > 0 && region.x <= frame_width &&
              region.y <= frame_height &&
              region.width <= frame_width - region.x &&
              region.height <= frame_height - region.y;
  if (!fits) {
    throw RedactError(
        ErrorCode::RegionOutOfBounds,
        fmt::format("Region ({},{} {}x{}) exceeds frame size ({}x{})",
                    region.x, region.y, region.width, region.height,
                    frame_width, frame_height));
  }
}

void apply_redaction(cv::Mat &frame, const Region &region,
                     const BlurParameters &blur) {
  check_region_bounds(region, frame.cols, frame.rows);

  cv::Rect rect(region.x, region.y, region.width, region.height);
  /// ROI shares memory with the frame, writes land in place
  cv::Mat roi = frame(rect);

  /// Blur a detached copy: filtering the ROI directly would sample pixels
  /// outside the region at its border
  cv::Mat source = roi.clone();
  cv::Mat blurred;
  cv::GaussianBlur(source, blurred,
                   cv::Size(blur.kernel_size, blur.kernel_size), blur.sigma,
                   blur.sigma);

  cv::Size small(std::max(1, region.width / PIXELATE_FACTOR),
                 std::max(1, region.height / PIXELATE_FACTOR));
  cv::Mat reduced;
  cv::resize(blurred, reduced, small, 0, 0, cv::INTER_LINEAR);
  cv::resize(reduced, roi, rect.size(), 0, 0, cv::INTER_NEAREST);
}

} // namespace region_redact
