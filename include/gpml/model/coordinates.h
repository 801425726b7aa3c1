#ifndef GPML_MODEL_COORDINATES_H_
#define GPML_MODEL_COORDINATES_H_

#include <cstddef>
#include <optional>

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <gpml/model/pathway_model.h>

namespace gpml {

using Bounds = Eigen::AlignedBox2d;

/// Group padding around the union of member bounds.
constexpr double kGroupMargin = 8.0;
constexpr double kComplexGroupMargin = 12.0;

/// Project an absolute point into the [-1,1] x [-1,1] frame of bounds:
/// (0,0) is the center, +-1 the edges. An axis of zero extent keeps the
/// plain offset from the center.
Eigen::Vector2d toRelativeCoordinate(const Bounds& bounds, const Eigen::Vector2d& absolute);

/// Inverse of toRelativeCoordinate.
Eigen::Vector2d toAbsoluteCoordinate(const Bounds& bounds, const Eigen::Vector2d& relative);

/// Axis aligned box of a width x height rectangle around center, rotated by
/// rotation radians.
Bounds rotatedBounds(const Eigen::Vector2d& center, double width, double height, double rotation);

/// Absolute bounds of a shaped element. States are placed from their relative
/// position on the parent DataNode; nullopt if that parent is missing.
std::optional<Bounds> absoluteBounds(const PathwayModel& model, const ShapedElement& element);

/// Point at fraction t (0..1) of the polyline through the line's points.
Eigen::Vector2d pointAlongLine(const PathwayModel& model, const LineElement& line, double t);

/// Absolute location of an anchor, nullopt if its line is not in the model.
std::optional<Eigen::Vector2d> anchorPosition(const PathwayModel& model, const Anchor& anchor);

/// Absolute coordinate of a line point. Bound points with relative
/// coordinates are derived from their target; all others return the stored
/// position.
Eigen::Vector2d absolutePosition(const PathwayModel& model, const LinePoint& point);

/// For every line end bound through elementRef whose relative coordinates
/// are not set, project its absolute coordinate into the target's frame.
/// Returns the number of points updated.
std::size_t reconcileCoordinates(PathwayModel& model);

/// Set each Group's rectangle to the union of its members' bounds plus the
/// group margin. Nested groups are sized before their parents.
void updateGroupBounds(PathwayModel& model);

}  // namespace gpml

#endif  // GPML_MODEL_COORDINATES_H_
