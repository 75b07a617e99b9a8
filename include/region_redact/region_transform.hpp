/**
 * @file region_transform.hpp
 * @brief Per-frame redaction: Gaussian blur followed by pixelation
 *
 * @details Pure pixel operation on a BGR frame. No I/O and no state kept
 *          between frames, so frames may be transformed in any order.
 */

#ifndef REGION_REDACT_REGION_TRANSFORM_HPP
#define REGION_REDACT_REGION_TRANSFORM_HPP

#include <opencv2/core.hpp>

#include "types.hpp"

namespace region_redact {

/**
 * @brief Check that the region lies fully inside a frame.
 * @throws RedactError RegionOutOfBounds, message carries the frame size
 */
void check_region_bounds(const Region &region, int frame_width,
                         int frame_height);

/**
 * @brief Redact the region of a frame in place.
 *
 * @attention STEPS:
 *
 * 1. Bounds check (throws before touching any pixel)
 *
 * 2. Gaussian blur of the region (square kernel, sigma from params)
 *
 * 3. Down-sample the blurred region to 1/PIXELATE_FACTOR per axis, then
 *    up-sample with nearest-neighbour back over the region
 *
 * @note Pixels outside the region are never written. A uniform region
 *       stays exactly uniform.
 */
void apply_redaction(cv::Mat &frame, const Region &region,
                     const BlurParameters &blur);

} // namespace region_redact

#endif // REGION_REDACT_REGION_TRANSFORM_HPP
