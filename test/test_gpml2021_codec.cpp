#include <cmath>
#include <memory>
#include <string>

#include <gpml/errors.h>
#include <gpml/xml/gpml2021_reader.h>
#include <gpml/xml/gpml2021_writer.h>
#include <gpml/xml/utils.h>

#include <gtest/gtest.h>

using namespace gpml;

static PathwayModel readFixture(const std::string& name)
{
  tinyxml2::XMLDocument doc;
  const std::string filename = std::string(GPML_TEST_FOLDER) + name;
  EXPECT_EQ(doc.LoadFile(filename.c_str()), tinyxml2::XML_SUCCESS) << filename;
  return xml::Gpml2021Reader().read(doc.RootElement(), 23);
}

static PathwayModel readText(const std::string& text)
{
  tinyxml2::XMLDocument doc;
  EXPECT_EQ(doc.Parse(text.c_str()), tinyxml2::XML_SUCCESS);
  return xml::Gpml2021Reader().read(doc.RootElement(), 23);
}

static const tinyxml2::XMLElement* findById(const tinyxml2::XMLElement* parent, const char* tag, const char* id)
{
  for (const auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    if (std::string(child->Name()) == tag && child->Attribute("elementId", id))
      return child;
    if (const auto* found = findById(child, tag, id))
      return found;
  }
  return nullptr;
}

TEST(Gpml2021Codec, ReadsPathwayMetadata)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");
  const Pathway& pathway = model.pathway();

  EXPECT_EQ(model.version(), SchemaVersion::Gpml2021);
  EXPECT_EQ(pathway.title, "Caspase cascade");
  ASSERT_TRUE(pathway.xref.has_value());
  EXPECT_EQ(pathway.xref->identifier, "WP0000");
  EXPECT_EQ(pathway.description, std::optional<std::string>("Caspase activation downstream of death receptors."));
  EXPECT_EQ(pathway.background_color, (Color{ 0xfa, 0xfa, 0xfa, 0xff }));

  ASSERT_EQ(pathway.authors.size(), 2u);
  EXPECT_EQ(pathway.authors[0].name, "Jane Roe");
  EXPECT_EQ(pathway.authors[0].username, "jroe");
  EXPECT_EQ(pathway.authors[1].order, 2);

  ASSERT_EQ(pathway.comments.size(), 1u);
  EXPECT_EQ(pathway.comments[0].source, "curator");
  EXPECT_EQ(pathway.dynamicProperty("org.example.note"), std::optional<std::string>("fragment"));
}

TEST(Gpml2021Codec, NestedRefsAreKept)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");

  const auto& refs = model.pathway().annotation_refs;
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].annotation_id, "ann1");
  ASSERT_EQ(refs[0].citation_refs.size(), 1u);
  EXPECT_EQ(refs[0].citation_refs[0].citation_id, "cit1");
  ASSERT_EQ(refs[0].evidence_refs.size(), 1u);
  EXPECT_EQ(refs[0].evidence_refs[0].evidence_id, "ev1");

  EXPECT_EQ(model.referenceCount("cit1"), 2u);
  EXPECT_EQ(model.referenceCount("ev1"), 2u);
}

TEST(Gpml2021Codec, DuplicatePoolEntriesCollapse)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");

  EXPECT_EQ(model.annotations().size(), 2u);
  EXPECT_NE(model.find<Annotation>("ann1"), nullptr);
  EXPECT_EQ(model.lookup("ann3"), nullptr);

  const Annotation* sbo = model.find<Annotation>("ann2");
  ASSERT_NE(sbo, nullptr);
  EXPECT_EQ(sbo->url, "https://example.org/sbo/0000216");
}

TEST(Gpml2021Codec, RefsToMergedEntriesAreRedirected)
{
  PathwayModel model = readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2021" title="merge">
  <Graphics boardWidth="100" boardHeight="100"/>
  <EvidenceRef elementRef="evB"/>
  <Evidences>
    <Evidence elementId="evA" value="same"/>
    <Evidence elementId="evB" value="same"/>
  </Evidences>
</Pathway>)");

  ASSERT_EQ(model.evidences().size(), 1u);
  ASSERT_EQ(model.pathway().evidence_refs.size(), 1u);
  EXPECT_EQ(model.pathway().evidence_refs[0].evidence_id, "evA");
}

TEST(Gpml2021Codec, StatesAreNestedInDataNodes)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");

  ASSERT_EQ(model.states().size(), 1u);
  const State& state = *model.states()[0];
  EXPECT_EQ(state.element_id, "s1");
  EXPECT_EQ(state.element_ref, "n2");
  EXPECT_EQ(state.type, StateKind::ProteinModification);
  EXPECT_EQ(state.style.shape_type, ShapeKind::Oval);
  ASSERT_EQ(state.annotation_refs.size(), 1u);
  EXPECT_EQ(state.annotation_refs[0].annotation_id, "ann2");

  auto states = model.statesOf("n2");
  ASSERT_EQ(states.size(), 1u);
  EXPECT_EQ(states[0], &state);
}

TEST(Gpml2021Codec, LinesAnchorsAndAliases)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");

  const Interaction* conversion = model.find<Interaction>("i1");
  ASSERT_NE(conversion, nullptr);
  EXPECT_EQ(conversion->start_arrow_head, ArrowHeadKind::Undirected);
  EXPECT_EQ(conversion->end_arrow_head, ArrowHeadKind::Conversion);
  EXPECT_EQ(conversion->line_style, LineStyleKind::Double);
  ASSERT_EQ(conversion->anchors.size(), 1u);
  EXPECT_EQ(conversion->anchors[0]->shape_type, AnchorShapeKind::Circle);

  const Interaction* catalysis = model.find<Interaction>("i2");
  ASSERT_NE(catalysis, nullptr);
  EXPECT_EQ(catalysis->points[1]->element_ref, "a1");
  EXPECT_FALSE(catalysis->points[1]->relative.has_value());

  const DataNode* alias = model.find<DataNode>("n4");
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->type, DataNodeKind::Alias);
  EXPECT_EQ(alias->alias_ref, "g1");

  const Group* group = model.find<Group>("g1");
  ASSERT_NE(group, nullptr);
  ASSERT_TRUE(group->xref.has_value());
  EXPECT_EQ(group->xref->data_source, "complexportal");
  EXPECT_EQ(model.groupMembers("g1").size(), 2u);
}

TEST(Gpml2021Codec, WriteThenReadKeepsContent)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");
  auto doc = xml::Gpml2021Writer().write(model);
  const std::string text = xml::printDocument(*doc);
  PathwayModel reread = readText(text);

  EXPECT_EQ(reread.pathway().title, model.pathway().title);
  EXPECT_EQ(reread.pathway().description, model.pathway().description);
  EXPECT_EQ(reread.pathway().authors.size(), 2u);
  EXPECT_EQ(reread.pathway().background_color, model.pathway().background_color);
  EXPECT_EQ(reread.dataNodes().size(), model.dataNodes().size());
  EXPECT_EQ(reread.states().size(), 1u);
  EXPECT_EQ(reread.interactions().size(), 2u);
  EXPECT_EQ(reread.annotations().size(), 2u);
  EXPECT_EQ(reread.citations().size(), 1u);
  EXPECT_EQ(reread.evidences().size(), 1u);

  const Shape* shape = reread.find<Shape>("sh1");
  ASSERT_NE(shape, nullptr);
  EXPECT_EQ(shape->style.shape_type, ShapeKind::Mitochondria);
  EXPECT_EQ(shape->style.border_style, LineStyleKind::Double);
  EXPECT_DOUBLE_EQ(shape->style.border_width, 3.0);
  EXPECT_NEAR(shape->rotation, M_PI / 2.0, 1e-12);

  const Interaction* conversion = reread.find<Interaction>("i1");
  ASSERT_NE(conversion, nullptr);
  ASSERT_TRUE(conversion->points[0]->relative.has_value());
  EXPECT_DOUBLE_EQ(conversion->points[0]->relative->x(), 1.0);
  ASSERT_EQ(conversion->evidence_refs.size(), 1u);

  const Group* group = reread.find<Group>("g1");
  ASSERT_NE(group, nullptr);
  EXPECT_EQ(group->type, GroupKind::Complex);
  EXPECT_EQ(group->style.fill_color, (Color{ 0xb4, 0xb4, 0x64, 0x19 }));
}

TEST(Gpml2021Codec, WriterOmitsDefaultValues)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");
  auto doc = xml::Gpml2021Writer().write(model);

  const auto* node = findById(doc->RootElement(), "DataNode", "n3");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->Attribute("groupRef"), nullptr);
  EXPECT_EQ(node->Attribute("aliasRef"), nullptr);

  const auto* gfx = node->FirstChildElement("Graphics");
  ASSERT_NE(gfx, nullptr);
  EXPECT_STREQ(gfx->Attribute("textColor"), "14961e");
  EXPECT_STREQ(gfx->Attribute("fontWeight"), "Bold");
  EXPECT_STREQ(gfx->Attribute("centerX"), "400");
  EXPECT_EQ(gfx->Attribute("fontName"), nullptr);
  EXPECT_EQ(gfx->Attribute("fillColor"), nullptr);
  EXPECT_EQ(gfx->Attribute("borderWidth"), nullptr);
  EXPECT_EQ(gfx->Attribute("rotation"), nullptr);
}

TEST(Gpml2021Codec, WriterSortsPoolEntriesById)
{
  PathwayModel model = readFixture("caspase_cascade_2021.gpml");
  auto doc = xml::Gpml2021Writer().write(model);

  const auto* annotations = doc->RootElement()->FirstChildElement("Annotations");
  ASSERT_NE(annotations, nullptr);
  const auto* first = annotations->FirstChildElement("Annotation");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(first->NextSiblingElement("Annotation"), nullptr);
  EXPECT_STREQ(first->Attribute("elementId"), "ann1");
  EXPECT_STREQ(first->NextSiblingElement("Annotation")->Attribute("elementId"), "ann2");
}

TEST(Gpml2021Codec, OrphanStateIsNotWritten)
{
  PathwayModel model;
  model.pathway().title = "orphan";
  auto state = std::make_unique<State>();
  state->element_id = "s9";
  state->element_ref = "gone";
  state->text_label = "P";
  model.add(std::move(state));

  auto doc = xml::Gpml2021Writer().write(model);
  EXPECT_EQ(findById(doc->RootElement(), "State", "s9"), nullptr);
}

TEST(Gpml2021Codec, WriterRejectsUnconvertedModel)
{
  PathwayModel model(SchemaVersion::Gpml2013a);
  model.pathway().title = "old";
  EXPECT_THROW(xml::Gpml2021Writer().write(model), ConversionError);
}

TEST(Gpml2021Codec, MissingWaypointsThrows)
{
  EXPECT_THROW(readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2021" title="broken">
  <Graphics boardWidth="100" boardHeight="100"/>
  <GraphicalLines>
    <GraphicalLine elementId="gl1">
      <Graphics/>
    </GraphicalLine>
  </GraphicalLines>
</Pathway>)"),
               ConversionError);
}

TEST(Gpml2021Codec, DuplicateElementIdThrows)
{
  EXPECT_THROW(readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2021" title="dup">
  <Graphics boardWidth="100" boardHeight="100"/>
  <Labels>
    <Label elementId="x1" textLabel="a"><Graphics centerX="1" centerY="1" width="1" height="1"/></Label>
    <Label elementId="x1" textLabel="b"><Graphics centerX="2" centerY="2" width="1" height="1"/></Label>
  </Labels>
</Pathway>)"),
               ConversionError);
}
