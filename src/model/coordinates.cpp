#include <gpml/model/coordinates.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>

namespace gpml {

namespace {

// Points bound to anchors on other lines can chain; cycles fall back to the
// stored position once this depth is reached.
constexpr int kMaxLinkDepth = 16;

Eigen::Vector2d absolutePositionImpl(const PathwayModel& model, const LinePoint& point, int depth);

Eigen::Vector2d pointAlongLineImpl(const PathwayModel& model, const LineElement& line, double t, int depth)
{
  if (line.points.empty())
    return Eigen::Vector2d::Zero();

  std::vector<Eigen::Vector2d> pts;
  pts.reserve(line.points.size());
  for (const auto& p : line.points)
    pts.push_back(absolutePositionImpl(model, *p, depth + 1));

  double total = 0.0;
  for (size_t i = 1; i < pts.size(); ++i)
    total += (pts[i] - pts[i - 1]).norm();
  if (total <= 0.0)
    return pts.front();

  double target = std::min(std::max(t, 0.0), 1.0) * total;
  for (size_t i = 1; i < pts.size(); ++i)
  {
    double seg = (pts[i] - pts[i - 1]).norm();
    if (target <= seg && seg > 0.0)
      return pts[i - 1] + (pts[i] - pts[i - 1]) * (target / seg);
    target -= seg;
  }
  return pts.back();
}

const LineElement* owningLine(const PathwayModel& model, const Anchor& anchor)
{
  for (const LineElement* line : model.lines())
  {
    for (const auto& a : line->anchors)
    {
      if (a.get() == &anchor)
        return line;
    }
  }
  return nullptr;
}

Eigen::Vector2d absolutePositionImpl(const PathwayModel& model, const LinePoint& point, int depth)
{
  if (point.element_ref.empty() || depth > kMaxLinkDepth)
    return point.position;

  const PathwayObject* target = model.lookup(point.element_ref);
  if (!target)
    return point.position;

  if (const auto* anchor = dynamic_cast<const Anchor*>(target))
  {
    if (const LineElement* line = owningLine(model, *anchor))
      return pointAlongLineImpl(model, *line, anchor->position, depth);
    return point.position;
  }

  if (const auto* shaped = dynamic_cast<const ShapedElement*>(target))
  {
    if (!point.relative)
      return point.position;
    if (auto bounds = absoluteBounds(model, *shaped))
      return toAbsoluteCoordinate(*bounds, *point.relative);
  }
  return point.position;
}

std::optional<Bounds> lineBounds(const PathwayModel& model, const LineElement& line)
{
  if (line.points.empty())
    return std::nullopt;
  Bounds box;
  for (const auto& p : line.points)
    box.extend(absolutePosition(model, *p));
  return box;
}

std::optional<Bounds> groupBounds(PathwayModel& model, Group& group, std::set<std::string>& visiting)
{
  if (!visiting.insert(group.element_id).second)
    return std::nullopt;

  Bounds box;
  bool any = false;
  for (PathwayElement* member : model.groupMembers(group.element_id))
  {
    std::optional<Bounds> member_box;
    if (auto* nested = dynamic_cast<Group*>(member))
      member_box = groupBounds(model, *nested, visiting);
    else if (auto* shaped = dynamic_cast<ShapedElement*>(member))
      member_box = absoluteBounds(model, *shaped);
    else if (auto* line = dynamic_cast<LineElement*>(member))
      member_box = lineBounds(model, *line);

    if (member_box)
    {
      box.extend(*member_box);
      any = true;
    }
  }
  visiting.erase(group.element_id);
  if (!any)
    return std::nullopt;

  const double margin = group.type == GroupKind::Complex ? kComplexGroupMargin : kGroupMargin;
  box.min() -= Eigen::Vector2d(margin, margin);
  box.max() += Eigen::Vector2d(margin, margin);

  group.center = box.center();
  group.width = box.sizes().x();
  group.height = box.sizes().y();
  return box;
}

}  // namespace

Eigen::Vector2d toRelativeCoordinate(const Bounds& bounds, const Eigen::Vector2d& absolute)
{
  Eigen::Vector2d rel = absolute - bounds.center();
  const Eigen::Vector2d half = bounds.sizes() / 2.0;
  if (rel.x() != 0.0 && half.x() != 0.0)
    rel.x() /= half.x();
  if (rel.y() != 0.0 && half.y() != 0.0)
    rel.y() /= half.y();
  return rel;
}

Eigen::Vector2d toAbsoluteCoordinate(const Bounds& bounds, const Eigen::Vector2d& relative)
{
  Eigen::Vector2d abs = relative;
  const Eigen::Vector2d half = bounds.sizes() / 2.0;
  if (half.x() != 0.0)
    abs.x() *= half.x();
  if (half.y() != 0.0)
    abs.y() *= half.y();
  return abs + bounds.center();
}

Bounds rotatedBounds(const Eigen::Vector2d& center, double width, double height, double rotation)
{
  const double c = std::abs(std::cos(rotation));
  const double s = std::abs(std::sin(rotation));
  const Eigen::Vector2d half((width * c + height * s) / 2.0, (width * s + height * c) / 2.0);
  return Bounds(center - half, center + half);
}

std::optional<Bounds> absoluteBounds(const PathwayModel& model, const ShapedElement& element)
{
  if (const auto* state = dynamic_cast<const State*>(&element))
  {
    const auto* parent = model.find<DataNode>(state->element_ref);
    if (!parent)
      return std::nullopt;
    auto parent_bounds = absoluteBounds(model, *parent);
    if (!parent_bounds)
      return std::nullopt;
    const Eigen::Vector2d center = toAbsoluteCoordinate(*parent_bounds, state->relative);
    return rotatedBounds(center, state->width, state->height, state->rotation);
  }
  return rotatedBounds(element.center, element.width, element.height, element.rotation);
}

Eigen::Vector2d pointAlongLine(const PathwayModel& model, const LineElement& line, double t)
{
  return pointAlongLineImpl(model, line, t, 0);
}

std::optional<Eigen::Vector2d> anchorPosition(const PathwayModel& model, const Anchor& anchor)
{
  const LineElement* line = owningLine(model, anchor);
  if (!line)
    return std::nullopt;
  return pointAlongLine(model, *line, anchor.position);
}

Eigen::Vector2d absolutePosition(const PathwayModel& model, const LinePoint& point)
{
  return absolutePositionImpl(model, point, 0);
}

std::size_t reconcileCoordinates(PathwayModel& model)
{
  std::size_t updated = 0;
  for (LineElement* line : model.lines())
  {
    if (line->points.empty())
      continue;

    for (LinePoint* point : { line->startPoint(), line->endPoint() })
    {
      if (point->element_ref.empty() || point->relative)
        continue;

      const PathwayObject* target = model.lookup(point->element_ref);
      if (!target)
        continue;

      if (target->objectType() == ObjectType::Anchor)
      {
        point->relative = Eigen::Vector2d::Zero();
        ++updated;
      }
      else if (const auto* shaped = dynamic_cast<const ShapedElement*>(target))
      {
        if (auto bounds = absoluteBounds(model, *shaped))
        {
          point->relative = toRelativeCoordinate(*bounds, point->position);
          ++updated;
        }
      }
      // Single-point lines have start == end.
      if (line->points.size() == 1)
        break;
    }
  }
  return updated;
}

void updateGroupBounds(PathwayModel& model)
{
  std::set<std::string> visiting;
  for (const auto& group : model.groups())
    groupBounds(model, *group, visiting);
}

}  // namespace gpml
