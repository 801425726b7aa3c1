#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/pathway_model.h>

#include <spdlog/sinks/ostream_sink.h>

#include <gtest/gtest.h>

using namespace gpml;

static DataNode& addNode(PathwayModel& model, const std::string& id, const std::string& group_ref = "")
{
  auto node = std::make_unique<DataNode>();
  node->element_id = id;
  node->text_label = id;
  node->group_ref = group_ref;
  node->center = Eigen::Vector2d(100, 100);
  node->width = 80;
  node->height = 20;
  return model.add(std::move(node));
}

static Group& addGroup(PathwayModel& model, const std::string& id, const std::string& group_ref = "")
{
  auto group = std::make_unique<Group>();
  group->element_id = id;
  group->group_ref = group_ref;
  return model.add(std::move(group));
}

static Interaction& addInteraction(PathwayModel& model, const std::string& id, const std::string& from,
                                   const std::string& to)
{
  auto line = std::make_unique<Interaction>();
  line->element_id = id;
  line->addPoint(0, 0).element_ref = from;
  line->addPoint(50, 50).element_ref = to;
  return model.add(std::move(line));
}

namespace {

struct RecordingListener : ModelListener
{
  std::vector<ModelEvent> events;

  void modelEvent(const ModelEvent& event) override
  {
    events.push_back(event);
  }
};

}  // namespace

TEST(PathwayModel, AddAssignsIdWhenAbsent)
{
  PathwayModel model(SchemaVersion::Gpml2021, 11);
  auto label = std::make_unique<Label>();
  label->text_label = "hello";
  Label& added = model.add(std::move(label));

  EXPECT_FALSE(added.element_id.empty());
  EXPECT_EQ(model.find<Label>(added.element_id), &added);
}

TEST(PathwayModel, AddDuplicateIdThrowsAndRegistersNothing)
{
  PathwayModel model;
  addNode(model, "n1");

  auto line = std::make_unique<Interaction>();
  line->element_id = "line1";
  line->addPoint(0, 0);
  line->addPoint(10, 0);
  line->addAnchor(0.5).element_id = "n1";

  EXPECT_THROW(model.add(std::move(line)), DuplicateIdError);
  EXPECT_EQ(model.lookup("line1"), nullptr);
  EXPECT_TRUE(model.interactions().empty());
  EXPECT_NE(model.find<DataNode>("n1"), nullptr);
}

TEST(PathwayModel, GroupMembersAreDerivedFromGroupRef)
{
  PathwayModel model;
  addGroup(model, "g1");
  addNode(model, "a", "g1");
  addNode(model, "b", "g1");
  addNode(model, "c");

  auto members = model.groupMembers("g1");
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0]->element_id, "a");
  EXPECT_EQ(members[1]->element_id, "b");
}

TEST(PathwayModel, RemovingGroupKeepsMembersAndClearsTheirRef)
{
  PathwayModel model;
  RecordingListener listener;
  addGroup(model, "g1");
  DataNode& a = addNode(model, "a", "g1");
  model.addListener(&listener);

  EXPECT_TRUE(model.removeElement("g1"));
  EXPECT_EQ(model.lookup("g1"), nullptr);
  EXPECT_EQ(model.find<DataNode>("a"), &a);
  EXPECT_TRUE(a.group_ref.empty());

  ASSERT_EQ(listener.events.size(), 2u);
  EXPECT_EQ(listener.events[0].type, ModelEventType::Modified);
  EXPECT_EQ(listener.events[0].element_id, "a");
  EXPECT_EQ(listener.events[1].type, ModelEventType::Removed);
  EXPECT_EQ(listener.events[1].object_type, ObjectType::Group);
  model.removeListener(&listener);
}

TEST(PathwayModel, RemovingDataNodeRemovesItsStatesAndUnbindsPoints)
{
  PathwayModel model;
  addNode(model, "n1");
  auto state = std::make_unique<State>();
  state->element_id = "s1";
  state->element_ref = "n1";
  model.add(std::move(state));
  Interaction& line = addInteraction(model, "i1", "n1", "");
  line.points[0]->relative = Eigen::Vector2d(1.0, 0.0);

  EXPECT_TRUE(model.removeElement("n1"));
  EXPECT_EQ(model.lookup("s1"), nullptr);
  EXPECT_TRUE(model.states().empty());

  // The point keeps the position it had while bound: right edge of the node.
  EXPECT_TRUE(line.points[0]->element_ref.empty());
  EXPECT_FALSE(line.points[0]->relative.has_value());
  EXPECT_DOUBLE_EQ(line.points[0]->position.x(), 140.0);
  EXPECT_DOUBLE_EQ(line.points[0]->position.y(), 100.0);
}

TEST(PathwayModel, RemovedIdIsNotReissued)
{
  PathwayModel model(SchemaVersion::Gpml2021, 5);
  addNode(model, "n1");
  model.removeElement("n1");
  EXPECT_TRUE(model.ids().wasIssued("n1"));
  for (int i = 0; i < 100; ++i)
    EXPECT_NE(model.ids().allocate(), "n1");
}

TEST(PathwayModel, PoolEntriesAreDeduplicatedByContent)
{
  PathwayModel model;
  auto first = std::make_unique<Annotation>();
  first->value = "apoptosis";
  first->type = AnnotationKind::Ontology;
  Annotation& a = model.add(std::move(first));

  auto second = std::make_unique<Annotation>();
  second->value = "apoptosis";
  second->type = AnnotationKind::Ontology;
  Annotation& b = model.add(std::move(second));

  EXPECT_EQ(&a, &b);
  EXPECT_EQ(model.annotations().size(), 1u);
}

TEST(PathwayModel, PoolEntryRemovalIsRefusedWhileReferenced)
{
  PathwayModel model;
  auto citation = std::make_unique<Citation>();
  citation->xref = Xref{ "123456", "PubMed" };
  Citation& c = model.add(std::move(citation));
  const std::string cid = c.element_id;

  DataNode& node = addNode(model, "n1");
  node.citation_refs.push_back(CitationRef{ cid, {} });

  EXPECT_EQ(model.referenceCount(cid), 1u);
  EXPECT_FALSE(model.removePoolEntry(cid));

  node.citation_refs.clear();
  EXPECT_TRUE(model.removePoolEntry(cid));
  EXPECT_EQ(model.lookup(cid), nullptr);
}

TEST(PathwayModel, ReferenceCountIncludesNestedRefs)
{
  PathwayModel model;
  auto annotation = std::make_unique<Annotation>();
  annotation->value = "kinase";
  const std::string aid = model.add(std::move(annotation)).element_id;
  auto evidence = std::make_unique<Evidence>();
  evidence->value = "ECO:0000269";
  const std::string eid = model.add(std::move(evidence)).element_id;

  AnnotationRef ref{ aid, {}, { EvidenceRef{ eid } } };
  model.pathway().annotation_refs.push_back(ref);
  addNode(model, "n1").annotation_refs.push_back(ref);

  EXPECT_EQ(model.referenceCount(aid), 2u);
  EXPECT_EQ(model.referenceCount(eid), 2u);
}

TEST(PathwayModel, RemovingLastReferrerDropsPoolEntry)
{
  PathwayModel model;
  auto annotation = std::make_unique<Annotation>();
  annotation->value = "membrane";
  const std::string aid = model.add(std::move(annotation)).element_id;
  addNode(model, "n1").annotation_refs.push_back(AnnotationRef{ aid, {}, {} });

  model.removeElement("n1");
  EXPECT_EQ(model.lookup(aid), nullptr);
  EXPECT_TRUE(model.annotations().empty());
}

TEST(PathwayModel, PurgeUnreferencedKeepsUsedEntries)
{
  PathwayModel model;
  auto used = std::make_unique<Evidence>();
  used->value = "used";
  const std::string used_id = model.add(std::move(used)).element_id;
  auto unused = std::make_unique<Evidence>();
  unused->value = "unused";
  model.add(std::move(unused));
  model.pathway().evidence_refs.push_back(EvidenceRef{ used_id });

  EXPECT_EQ(model.purgeUnreferenced(), 1u);
  ASSERT_EQ(model.evidences().size(), 1u);
  EXPECT_EQ(model.evidences()[0]->element_id, used_id);
}

TEST(PathwayModel, FixReferencesClearsEveryDanglingRef)
{
  PathwayModel model;
  addGroup(model, "g1");
  addNode(model, "a", "g1");
  addNode(model, "b", "missing-group");
  addNode(model, "c", "also-missing");
  addInteraction(model, "i1", "a", "nowhere");
  auto state = std::make_unique<State>();
  state->element_ref = "ghost";
  model.add(std::move(state));

  // two groupRefs + one point elementRef + one state elementRef
  EXPECT_EQ(model.fixReferences(), 4u);
  EXPECT_EQ(model.fixReferences(), 0u);

  EXPECT_EQ(model.find<DataNode>("a")->group_ref, "g1");
  EXPECT_TRUE(model.find<DataNode>("b")->group_ref.empty());
  EXPECT_EQ(model.interactions()[0]->points[0]->element_ref, "a");
  EXPECT_TRUE(model.interactions()[0]->points[1]->element_ref.empty());
}

TEST(PathwayModel, FixReferencesPrunesDanglingPoolRefs)
{
  PathwayModel model;
  DataNode& node = addNode(model, "n1");
  node.annotation_refs.push_back(AnnotationRef{ "no-such-annotation", {}, {} });
  node.evidence_refs.push_back(EvidenceRef{ "no-such-evidence" });

  EXPECT_EQ(model.fixReferences(), 2u);
  EXPECT_TRUE(node.annotation_refs.empty());
  EXPECT_TRUE(node.evidence_refs.empty());
}

TEST(PathwayModel, RepairTallyIsLoggedAsWarning)
{
  std::ostringstream out;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  setLogger(std::make_shared<spdlog::logger>("gpml-test", sink));

  PathwayModel model;
  addNode(model, "n1", "missing-group");
  EXPECT_EQ(model.fixReferences(), 1u);
  EXPECT_EQ(model.fixReferences(), 0u);
  setLogger(nullptr);

  const std::string text = out.str();
  EXPECT_NE(text.find("[warning] fixReferences: fixed 1 reference(s)"), std::string::npos) << text;
  EXPECT_EQ(text.find("fixed 0"), std::string::npos);
}

TEST(PathwayModel, RemoveEmptyGroupsCascadesToParents)
{
  PathwayModel model;
  addGroup(model, "outer");
  addGroup(model, "inner", "outer");
  addGroup(model, "kept");
  addNode(model, "n1", "kept");

  EXPECT_EQ(model.removeEmptyGroups(), 2u);
  ASSERT_EQ(model.groups().size(), 1u);
  EXPECT_EQ(model.groups()[0]->element_id, "kept");
}

TEST(PathwayModel, LineIdForIsStableAndAvoidsIssuedIds)
{
  PathwayModel model(SchemaVersion::Gpml2021, 9);
  Interaction line;
  line.addPoint(10, 20);
  line.addPoint(30, 40);

  const std::string id = model.lineIdFor(line);
  EXPECT_EQ(id, model.lineIdFor(line));
  EXPECT_EQ(id.rfind("id", 0), 0u);

  model.ids().reserve(id);
  EXPECT_NE(model.lineIdFor(line), id);
}

TEST(PathwayModel, AddAnchorRegistersIt)
{
  PathwayModel model;
  Interaction& line = addInteraction(model, "i1", "", "");
  Anchor& anchor = model.addAnchor(line, 0.25);

  EXPECT_FALSE(anchor.element_id.empty());
  EXPECT_EQ(model.find<Anchor>(anchor.element_id), &anchor);
  EXPECT_EQ(line.anchors.size(), 1u);
}
