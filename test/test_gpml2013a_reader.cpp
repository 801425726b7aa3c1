#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include <gpml/errors.h>
#include <gpml/xml/gpml2013a_format.h>
#include <gpml/xml/gpml2013a_reader.h>

#include <gtest/gtest.h>

using namespace gpml;

static PathwayModel readFixture(const std::string& name)
{
  tinyxml2::XMLDocument doc;
  const std::string filename = std::string(GPML_TEST_FOLDER) + name;
  EXPECT_EQ(doc.LoadFile(filename.c_str()), tinyxml2::XML_SUCCESS) << filename;
  return xml::Gpml2013aReader().read(doc.RootElement(), 17);
}

static PathwayModel readText(const char* text)
{
  tinyxml2::XMLDocument doc;
  EXPECT_EQ(doc.Parse(text), tinyxml2::XML_SUCCESS);
  return xml::Gpml2013aReader().read(doc.RootElement(), 17);
}

static const Annotation* annotationByValue(const PathwayModel& model, const std::string& value)
{
  for (const auto& annotation : model.annotations())
  {
    if (annotation->value == value)
      return annotation.get();
  }
  return nullptr;
}

TEST(Gpml2013aReader, PathwayAttributes)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");
  const Pathway& pathway = model.pathway();

  EXPECT_EQ(model.version(), SchemaVersion::Gpml2013a);
  EXPECT_EQ(pathway.title, "Caspase cascade");
  EXPECT_EQ(pathway.organism, "Homo sapiens");
  EXPECT_EQ(pathway.license, "CC0");
  EXPECT_DOUBLE_EQ(pathway.board_width, 600.0);
  EXPECT_DOUBLE_EQ(pathway.board_height, 400.0);

  // The description comment moves to its own field.
  ASSERT_TRUE(pathway.description.has_value());
  EXPECT_EQ(*pathway.description, "Caspase activation downstream of death receptors.");
  ASSERT_EQ(pathway.comments.size(), 1u);
  EXPECT_EQ(pathway.comments[0].source, "curator");

  EXPECT_EQ(pathway.dynamicProperty("org.example.note"), std::optional<std::string>("fragment"));
  EXPECT_EQ(pathway.dynamicProperty(xml::gpml2013a::kPathwayAuthor), std::optional<std::string>("Jane Roe, John Doe"));
  EXPECT_EQ(pathway.dynamicProperty(xml::gpml2013a::kPathwayLastModified), std::optional<std::string>("20210215"));
  EXPECT_EQ(pathway.dynamicProperty(xml::gpml2013a::kInfoBoxCenterX), std::optional<std::string>("0.0"));
}

TEST(Gpml2013aReader, GroupRefsResolveToGroupMembers)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");

  const Group* group = model.find<Group>("g1");
  ASSERT_NE(group, nullptr);
  EXPECT_EQ(group->type, GroupKind::Complex);

  auto members = model.groupMembers("g1");
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0]->element_id, "n1");
  EXPECT_EQ(members[1]->element_id, "n2");

  // Member bounds span (60,90)-(140,150), padded by the complex margin.
  EXPECT_DOUBLE_EQ(group->center.x(), 100.0);
  EXPECT_DOUBLE_EQ(group->center.y(), 120.0);
  EXPECT_DOUBLE_EQ(group->width, 104.0);
  EXPECT_DOUBLE_EQ(group->height, 84.0);
}

TEST(Gpml2013aReader, EmptyGroupsAreDropped)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");
  EXPECT_EQ(model.groups().size(), 1u);
  EXPECT_EQ(model.lookup("orphan"), nullptr);
}

TEST(Gpml2013aReader, BiopaxPublicationsBecomeCitations)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");

  ASSERT_EQ(model.citations().size(), 1u);
  const Citation& citation = *model.citations()[0];
  EXPECT_EQ(citation.element_id, "pub1");
  ASSERT_TRUE(citation.xref.has_value());
  EXPECT_EQ(citation.xref->identifier, "10200555");
  EXPECT_EQ(citation.xref->data_source, "PubMed");
  EXPECT_EQ(citation.title, "Caspases in apoptosis");
  EXPECT_EQ(citation.year, "1999");
  ASSERT_EQ(citation.authors.size(), 2u);
  EXPECT_EQ(citation.authors[1], "Doe J");

  ASSERT_EQ(model.pathway().citation_refs.size(), 1u);
  EXPECT_EQ(model.pathway().citation_refs[0].citation_id, "pub1");
  const DataNode* node = model.find<DataNode>("n1");
  ASSERT_NE(node, nullptr);
  ASSERT_EQ(node->citation_refs.size(), 1u);
  EXPECT_EQ(model.referenceCount("pub1"), 2u);
}

TEST(Gpml2013aReader, OntologyTermsBecomePathwayAnnotations)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");

  const Annotation* term = annotationByValue(model, "apoptotic cell death pathway");
  ASSERT_NE(term, nullptr);
  EXPECT_EQ(term->type, AnnotationKind::Ontology);
  ASSERT_TRUE(term->xref.has_value());
  EXPECT_EQ(term->xref->identifier, "0000106");
  EXPECT_EQ(term->xref->data_source, "PW");

  const auto& refs = model.pathway().annotation_refs;
  EXPECT_TRUE(std::any_of(refs.begin(), refs.end(),
                          [&](const AnnotationRef& ref) { return ref.annotation_id == term->element_id; }));
}

TEST(Gpml2013aReader, PhosphositeStateCommentsBecomeAnnotations)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");

  const State* state = model.find<State>("s1");
  ASSERT_NE(state, nullptr);
  EXPECT_EQ(state->element_ref, "n2");
  EXPECT_DOUBLE_EQ(state->relative.x(), 1.0);
  EXPECT_DOUBLE_EQ(state->relative.y(), -1.0);

  // Plain comments survive, key=value comments do not.
  ASSERT_EQ(state->comments.size(), 1u);
  EXPECT_EQ(state->comments[0].text, "Cleaved form");

  ASSERT_TRUE(state->xref.has_value());
  EXPECT_EQ(state->xref->identifier, "447801");
  EXPECT_EQ(state->xref->data_source, "phosphositeplus");

  EXPECT_EQ(state->annotation_refs.size(), 3u);
  const Annotation* ptm = annotationByValue(model, "Phosphorylation");
  ASSERT_NE(ptm, nullptr);
  EXPECT_EQ(ptm->type, AnnotationKind::Ontology);
  EXPECT_EQ(ptm->xref->data_source, "SBO");

  const Annotation* parent = annotationByValue(model, "P42574");
  ASSERT_NE(parent, nullptr);
  EXPECT_EQ(parent->xref->data_source, "uniprot");
  EXPECT_NE(annotationByValue(model, "positive regulation of biological process"), nullptr);
}

TEST(Gpml2013aReader, InteractionsPointsAndAnchors)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");
  ASSERT_EQ(model.interactions().size(), 2u);

  const Interaction* conversion = model.find<Interaction>("i1");
  ASSERT_NE(conversion, nullptr);
  EXPECT_EQ(conversion->start_arrow_head, ArrowHeadKind::Line);
  EXPECT_EQ(conversion->end_arrow_head, ArrowHeadKind::MimConversion);
  ASSERT_EQ(conversion->points.size(), 2u);
  EXPECT_EQ(conversion->points[0]->element_ref, "n1");
  ASSERT_TRUE(conversion->points[0]->relative.has_value());
  EXPECT_DOUBLE_EQ(conversion->points[0]->relative->x(), 1.0);

  ASSERT_EQ(conversion->anchors.size(), 1u);
  EXPECT_EQ(conversion->anchors[0]->element_id, "a1");
  EXPECT_EQ(conversion->anchors[0]->shape_type, AnchorShapeKind::Circle);
  EXPECT_EQ(model.find<Anchor>("a1"), conversion->anchors[0].get());

  // The line without GraphId gets a derived id.
  const Interaction* catalysis = nullptr;
  for (const auto& interaction : model.interactions())
  {
    if (interaction.get() != conversion)
      catalysis = interaction.get();
  }
  ASSERT_NE(catalysis, nullptr);
  EXPECT_EQ(catalysis->element_id.rfind("id", 0), 0u);
  EXPECT_EQ(catalysis->line_style, LineStyleKind::Broken);
  EXPECT_EQ(catalysis->end_arrow_head, ArrowHeadKind::MimCatalysis);
  EXPECT_EQ(catalysis->points[1]->element_ref, "a1");
}

TEST(Gpml2013aReader, DerivedLineIdsAreStableAcrossReads)
{
  PathwayModel first = readFixture("caspase_cascade_2013a.gpml");
  PathwayModel second = readFixture("caspase_cascade_2013a.gpml");

  std::vector<std::string> first_ids;
  std::vector<std::string> second_ids;
  for (const auto& line : first.interactions())
    first_ids.push_back(line->element_id);
  for (const auto& line : second.interactions())
    second_ids.push_back(line->element_id);
  EXPECT_EQ(first_ids, second_ids);
}

TEST(Gpml2013aReader, ShapeGraphics)
{
  PathwayModel model = readFixture("caspase_cascade_2013a.gpml");

  const Shape* shape = model.find<Shape>("sh1");
  ASSERT_NE(shape, nullptr);
  EXPECT_EQ(shape->style.shape_type, ShapeKind::Organelle);
  EXPECT_TRUE(shape->style.fill_color.isTransparent());
  EXPECT_NEAR(shape->rotation, M_PI / 2.0, 1e-12);
  EXPECT_EQ(shape->style.z_order, std::optional<int>(16384));

  const DataNode* pathway_node = model.find<DataNode>("n3");
  ASSERT_NE(pathway_node, nullptr);
  EXPECT_TRUE(pathway_node->font.bold);
  EXPECT_EQ(pathway_node->font.text_color, (Color{ 0x14, 0x96, 0x1e, 0xff }));
  EXPECT_FALSE(pathway_node->xref.has_value());
}

TEST(Gpml2013aReader, PointsMayNameGroupsByGraphId)
{
  PathwayModel model = readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="groups">
  <Graphics BoardWidth="100" BoardHeight="100"/>
  <DataNode TextLabel="A" GraphId="a" GroupRef="grp">
    <Graphics CenterX="10" CenterY="10" Width="10" Height="10"/>
    <Xref Database="" ID=""/>
  </DataNode>
  <GraphicalLine GraphId="line">
    <Graphics>
      <Point X="0" Y="0" GraphRef="ffff9"/>
      <Point X="50" Y="50"/>
    </Graphics>
  </GraphicalLine>
  <Group GroupId="grp" GraphId="ffff9"/>
  <InfoBox CenterX="0" CenterY="0"/>
</Pathway>)");

  const GraphicalLine* line = model.find<GraphicalLine>("line");
  ASSERT_NE(line, nullptr);
  EXPECT_EQ(line->points[0]->element_ref, "grp");
  EXPECT_EQ(model.groups()[0]->type, GroupKind::None);
}

TEST(Gpml2013aReader, MalformedNumberThrows)
{
  EXPECT_THROW(readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="bad">
  <Graphics BoardWidth="100" BoardHeight="100"/>
  <Label TextLabel="x">
    <Graphics CenterX="ten" CenterY="10" Width="10" Height="10"/>
  </Label>
  <InfoBox CenterX="0" CenterY="0"/>
</Pathway>)"),
               ConversionError);
}

TEST(Gpml2013aReader, MissingRequiredNameThrows)
{
  EXPECT_THROW(readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2013a">
  <Graphics BoardWidth="100" BoardHeight="100"/>
  <InfoBox CenterX="0" CenterY="0"/>
</Pathway>)"),
               ConversionError);
}

TEST(Gpml2013aReader, DuplicateGraphIdThrows)
{
  try
  {
    readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="dup">
  <Graphics BoardWidth="100" BoardHeight="100"/>
  <Label TextLabel="one" GraphId="same">
    <Graphics CenterX="10" CenterY="10" Width="10" Height="10"/>
  </Label>
  <Shape GraphId="same">
    <Graphics CenterX="10" CenterY="10" Width="10" Height="10"/>
  </Shape>
  <InfoBox CenterX="0" CenterY="0"/>
</Pathway>)");
    FAIL() << "expected ConversionError";
  }
  catch (const ConversionError& e)
  {
    EXPECT_EQ(e.tag(), "Shape");
    EXPECT_NE(std::string(e.what()).find("same"), std::string::npos);
  }
}

TEST(Gpml2013aReader, SinglePointLineThrows)
{
  EXPECT_THROW(readText(R"(
<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="short">
  <Graphics BoardWidth="100" BoardHeight="100"/>
  <GraphicalLine>
    <Graphics>
      <Point X="0" Y="0"/>
    </Graphics>
  </GraphicalLine>
  <InfoBox CenterX="0" CenterY="0"/>
</Pathway>)"),
               ConversionError);
}

TEST(Gpml2013aReader, RootMustBePathway)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse("<Graph/>"), tinyxml2::XML_SUCCESS);
  EXPECT_THROW(xml::Gpml2013aReader().read(doc.RootElement(), 1), ConversionError);
}

TEST(Gpml2013aReader, ResolverRecordsDataSourceIds)
{
  tinyxml2::XMLDocument doc;
  const std::string filename = std::string(GPML_TEST_FOLDER) + "caspase_cascade_2013a.gpml";
  ASSERT_EQ(doc.LoadFile(filename.c_str()), tinyxml2::XML_SUCCESS);

  MapDataSourceResolver resolver({ { "Entrez Gene", "L" } });
  PathwayModel model = xml::Gpml2013aReader(&resolver).read(doc.RootElement(), 17);

  const DataNode* casp8 = model.find<DataNode>("n1");
  ASSERT_NE(casp8, nullptr);
  ASSERT_TRUE(casp8->xref.has_value());
  EXPECT_EQ(casp8->xref->data_source, "Entrez Gene");
  EXPECT_EQ(casp8->xref->data_source_id, std::optional<std::string>("L"));

  // Unknown names are kept as written without an id.
  const Citation* citation = model.find<Citation>("pub1");
  ASSERT_NE(citation, nullptr);
  ASSERT_TRUE(citation->xref.has_value());
  EXPECT_FALSE(citation->xref->data_source_id.has_value());
}

TEST(Gpml2013aReader, CollidingGroupIdGetsFreshId)
{
  PathwayModel model = readText(R"(<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="x">
  <Graphics BoardWidth="300" BoardHeight="200"/>
  <DataNode GraphId="shared" TextLabel="A" GroupRef="shared">
    <Graphics CenterX="50" CenterY="50" Width="40" Height="20"/>
    <Xref Database="" ID=""/>
  </DataNode>
  <DataNode GraphId="b" TextLabel="B" GroupRef="shared">
    <Graphics CenterX="50" CenterY="90" Width="40" Height="20"/>
    <Xref Database="" ID=""/>
  </DataNode>
  <Group GroupId="shared" Style="Complex"/>
</Pathway>)");

  ASSERT_EQ(model.groups().size(), 1u);
  const Group& group = *model.groups()[0];
  EXPECT_NE(group.element_id, "shared");
  EXPECT_EQ(model.find<DataNode>("shared")->group_ref, group.element_id);
  EXPECT_EQ(model.groupMembers(group.element_id).size(), 2u);
}

TEST(Gpml2013aReader, GroupKeepsIdSharedByGroupIdAndGraphId)
{
  PathwayModel model = readText(R"(<Pathway xmlns="http://pathvisio.org/GPML/2013a" Name="x">
  <Graphics BoardWidth="300" BoardHeight="200"/>
  <DataNode GraphId="a" TextLabel="A" GroupRef="g1">
    <Graphics CenterX="50" CenterY="50" Width="40" Height="20"/>
    <Xref Database="" ID=""/>
  </DataNode>
  <DataNode GraphId="b" TextLabel="B" GroupRef="g1">
    <Graphics CenterX="50" CenterY="90" Width="40" Height="20"/>
    <Xref Database="" ID=""/>
  </DataNode>
  <GraphicalLine GraphId="line">
    <Graphics>
      <Point X="0" Y="0" GraphRef="g1"/>
      <Point X="250" Y="150"/>
    </Graphics>
  </GraphicalLine>
  <Group GroupId="g1" GraphId="g1" Style="Complex"/>
</Pathway>)");

  ASSERT_EQ(model.groups().size(), 1u);
  const Group* group = model.find<Group>("g1");
  ASSERT_NE(group, nullptr);
  EXPECT_EQ(group->type, GroupKind::Complex);
  EXPECT_EQ(model.groupMembers("g1").size(), 2u);
  EXPECT_EQ(model.find<DataNode>("a")->group_ref, "g1");

  const GraphicalLine* line = model.find<GraphicalLine>("line");
  ASSERT_NE(line, nullptr);
  EXPECT_EQ(line->points[0]->element_ref, "g1");
}
