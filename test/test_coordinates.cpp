#include <cmath>
#include <memory>
#include <string>

#include <gpml/model/coordinates.h>
#include <gpml/model/pathway_model.h>

#include <gtest/gtest.h>

using namespace gpml;

static Shape& addShape(PathwayModel& model, const std::string& id, double x, double y, double w, double h,
                       const std::string& group_ref = "")
{
  auto shape = std::make_unique<Shape>();
  shape->element_id = id;
  shape->center = Eigen::Vector2d(x, y);
  shape->width = w;
  shape->height = h;
  shape->group_ref = group_ref;
  return model.add(std::move(shape));
}

TEST(Coordinates, RelativeFrameIsCenteredOnBounds)
{
  Bounds box(Eigen::Vector2d(75, 75), Eigen::Vector2d(125, 125));

  Eigen::Vector2d rel = toRelativeCoordinate(box, Eigen::Vector2d(125, 100));
  EXPECT_DOUBLE_EQ(rel.x(), 1.0);
  EXPECT_DOUBLE_EQ(rel.y(), 0.0);

  rel = toRelativeCoordinate(box, Eigen::Vector2d(75, 75));
  EXPECT_DOUBLE_EQ(rel.x(), -1.0);
  EXPECT_DOUBLE_EQ(rel.y(), -1.0);

  Eigen::Vector2d abs = toAbsoluteCoordinate(box, Eigen::Vector2d(0.5, -0.5));
  EXPECT_DOUBLE_EQ(abs.x(), 112.5);
  EXPECT_DOUBLE_EQ(abs.y(), 87.5);
}

TEST(Coordinates, ZeroExtentAxisKeepsOffset)
{
  Bounds flat(Eigen::Vector2d(0, 10), Eigen::Vector2d(100, 10));
  Eigen::Vector2d rel = toRelativeCoordinate(flat, Eigen::Vector2d(50, 14));
  EXPECT_DOUBLE_EQ(rel.x(), 0.0);
  EXPECT_DOUBLE_EQ(rel.y(), 4.0);
}

TEST(Coordinates, RotatedBoundsSwapsExtentsAtQuarterTurn)
{
  Bounds box = rotatedBounds(Eigen::Vector2d(0, 0), 40, 10, M_PI / 2.0);
  EXPECT_NEAR(box.sizes().x(), 10.0, 1e-9);
  EXPECT_NEAR(box.sizes().y(), 40.0, 1e-9);
}

TEST(Coordinates, ReconcileProjectsBoundPointIntoTargetFrame)
{
  PathwayModel model;
  addShape(model, "s1", 100, 100, 50, 50);

  auto line = std::make_unique<GraphicalLine>();
  line->element_id = "l1";
  line->addPoint(125, 100).element_ref = "s1";
  line->addPoint(300, 100);
  GraphicalLine& added = model.add(std::move(line));

  EXPECT_EQ(reconcileCoordinates(model), 1u);
  ASSERT_TRUE(added.points[0]->relative.has_value());
  EXPECT_DOUBLE_EQ(added.points[0]->relative->x(), 1.0);
  EXPECT_DOUBLE_EQ(added.points[0]->relative->y(), 0.0);
  EXPECT_FALSE(added.points[1]->relative.has_value());

  // Already reconciled points are left alone.
  EXPECT_EQ(reconcileCoordinates(model), 0u);
}

TEST(Coordinates, BoundPointFollowsItsTarget)
{
  PathwayModel model;
  Shape& shape = addShape(model, "s1", 100, 100, 50, 50);

  auto line = std::make_unique<GraphicalLine>();
  line->element_id = "l1";
  LinePoint& start = line->addPoint(125, 100);
  start.element_ref = "s1";
  start.relative = Eigen::Vector2d(1.0, 0.0);
  line->addPoint(300, 100);
  model.add(std::move(line));

  shape.center = Eigen::Vector2d(200, 50);
  Eigen::Vector2d pos = absolutePosition(model, start);
  EXPECT_DOUBLE_EQ(pos.x(), 225.0);
  EXPECT_DOUBLE_EQ(pos.y(), 50.0);
}

TEST(Coordinates, AnchorSitsAlongItsLine)
{
  PathwayModel model;
  auto line = std::make_unique<Interaction>();
  line->element_id = "i1";
  line->addPoint(0, 0);
  line->addPoint(100, 0);
  line->addPoint(100, 100);
  Interaction& added = model.add(std::move(line));
  Anchor& anchor = model.addAnchor(added, 0.75);

  auto pos = anchorPosition(model, anchor);
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->x(), 100.0);
  EXPECT_DOUBLE_EQ(pos->y(), 50.0);

  auto other = std::make_unique<Interaction>();
  other->element_id = "i2";
  other->addPoint(0, 200).element_ref = anchor.element_id;
  other->addPoint(0, 300);
  Interaction& bound = model.add(std::move(other));

  Eigen::Vector2d start = absolutePosition(model, *bound.startPoint());
  EXPECT_DOUBLE_EQ(start.x(), 100.0);
  EXPECT_DOUBLE_EQ(start.y(), 50.0);
}

TEST(Coordinates, StateBoundsArePlacedOnParent)
{
  PathwayModel model;
  auto node = std::make_unique<DataNode>();
  node->element_id = "n1";
  node->center = Eigen::Vector2d(100, 100);
  node->width = 80;
  node->height = 20;
  model.add(std::move(node));

  auto state = std::make_unique<State>();
  state->element_id = "st1";
  state->element_ref = "n1";
  state->relative = Eigen::Vector2d(1.0, -1.0);
  state->width = 10;
  state->height = 10;
  State& added = model.add(std::move(state));

  auto bounds = absoluteBounds(model, added);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_DOUBLE_EQ(bounds->center().x(), 140.0);
  EXPECT_DOUBLE_EQ(bounds->center().y(), 90.0);

  added.element_ref = "gone";
  EXPECT_FALSE(absoluteBounds(model, added).has_value());
}

TEST(Coordinates, GroupBoundsWrapMembersWithMargin)
{
  PathwayModel model;
  auto group = std::make_unique<Group>();
  group->element_id = "g1";
  Group& g1 = model.add(std::move(group));
  auto complex = std::make_unique<Group>();
  complex->element_id = "g2";
  complex->type = GroupKind::Complex;
  Group& g2 = model.add(std::move(complex));

  addShape(model, "a", 50, 50, 20, 20, "g1");
  addShape(model, "b", 150, 100, 20, 40, "g1");
  addShape(model, "c", 0, 0, 10, 10, "g2");

  updateGroupBounds(model);

  // Members span (40,40)-(160,120).
  EXPECT_DOUBLE_EQ(g1.center.x(), 100.0);
  EXPECT_DOUBLE_EQ(g1.center.y(), 80.0);
  EXPECT_DOUBLE_EQ(g1.width, 120.0 + 2 * kGroupMargin);
  EXPECT_DOUBLE_EQ(g1.height, 80.0 + 2 * kGroupMargin);

  EXPECT_DOUBLE_EQ(g2.width, 10.0 + 2 * kComplexGroupMargin);
}

TEST(Coordinates, NestedGroupsAreSizedBeforeParents)
{
  PathwayModel model;
  auto outer = std::make_unique<Group>();
  outer->element_id = "outer";
  Group& g_outer = model.add(std::move(outer));
  auto inner = std::make_unique<Group>();
  inner->element_id = "inner";
  inner->group_ref = "outer";
  Group& g_inner = model.add(std::move(inner));
  addShape(model, "s", 0, 0, 20, 20, "inner");

  updateGroupBounds(model);

  EXPECT_DOUBLE_EQ(g_inner.width, 20.0 + 2 * kGroupMargin);
  EXPECT_DOUBLE_EQ(g_outer.width, 20.0 + 4 * kGroupMargin);
}
