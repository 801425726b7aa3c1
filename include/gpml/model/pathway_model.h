#ifndef GPML_MODEL_PATHWAY_MODEL_H_
#define GPML_MODEL_PATHWAY_MODEL_H_

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <gpml/model/elements.h>
#include <gpml/model/id_registry.h>
#include <gpml/model/model_event.h>
#include <gpml/schema_version.h>

namespace gpml {

/// Owns every entity of one pathway document.
///
/// Entities are stored per category and indexed by element id through the
/// IdRegistry. Relations (group membership, states of a data node, pool
/// reference counts) are stored only as id strings on the referring side and
/// derived on demand, so there are no back-pointers to keep in sync.
///
/// version() names the schema vocabulary the model is expressed in (e.g. a
/// model read from GPML2013a still uses 2013a group styles until converted).
class PathwayModel
{
public:
  explicit PathwayModel(SchemaVersion version = SchemaVersion::Gpml2021,
                        std::uint32_t id_seed = std::random_device{}());

  PathwayModel(PathwayModel&&) = default;
  PathwayModel& operator=(PathwayModel&&) = default;

  SchemaVersion version() const
  {
    return version_;
  }
  void setVersion(SchemaVersion version)
  {
    version_ = version;
  }

  Pathway& pathway()
  {
    return *pathway_;
  }
  const Pathway& pathway() const
  {
    return *pathway_;
  }

  IdRegistry& ids()
  {
    return ids_;
  }
  const IdRegistry& ids() const
  {
    return ids_;
  }

  /// ---------------------------------------------------------------------------
  /// Admission. Each add assigns an id when absent, registers the element and
  /// its anchors (and identified points), then notifies listeners.
  /// Throws DuplicateIdError if any of those ids is taken; nothing is
  /// registered in that case.
  /// ---------------------------------------------------------------------------
  DataNode& add(std::unique_ptr<DataNode> node);
  State& add(std::unique_ptr<State> state);
  Interaction& add(std::unique_ptr<Interaction> interaction);
  GraphicalLine& add(std::unique_ptr<GraphicalLine> line);
  Label& add(std::unique_ptr<Label> label);
  Shape& add(std::unique_ptr<Shape> shape);
  Group& add(std::unique_ptr<Group> group);

  /// Pool entries are content addressed: adding an entry equal to an existing
  /// one returns the existing entry and discards the argument.
  Annotation& add(std::unique_ptr<Annotation> annotation);
  Citation& add(std::unique_ptr<Citation> citation);
  Evidence& add(std::unique_ptr<Evidence> evidence);

  /// Add an anchor to a line that is already part of the model.
  Anchor& addAnchor(LineElement& line, double position, AnchorShapeType shape_type = AnchorShapeKind::Square);

  /// ---------------------------------------------------------------------------
  /// Removal.
  /// ---------------------------------------------------------------------------

  /// Remove a pathway element. Members of a removed Group stay in the model
  /// with their groupRef cleared; States of a removed DataNode are removed
  /// with it; line points bound to the element are unbound at their current
  /// absolute position. Pool entries left without refs are dropped.
  /// Returns false if id does not name a removable element.
  bool removeElement(const std::string& id);

  /// Remove an Annotation, Citation or Evidence. Refused (returns false)
  /// while any ref still points to it.
  bool removePoolEntry(const std::string& id);

  /// Drop every pool entry without refs. Returns the number removed.
  std::size_t purgeUnreferenced();

  /// Remove groups without members, repeatedly, since removing a nested
  /// group may empty its parent. Returns the number removed.
  std::size_t removeEmptyGroups();

  /// ---------------------------------------------------------------------------
  /// Queries.
  /// ---------------------------------------------------------------------------
  PathwayObject* lookup(const std::string& id) const;

  template <typename T>
  T* find(const std::string& id) const
  {
    return dynamic_cast<T*>(lookup(id));
  }

  const std::vector<std::unique_ptr<DataNode>>& dataNodes() const
  {
    return data_nodes_;
  }
  const std::vector<std::unique_ptr<State>>& states() const
  {
    return states_;
  }
  const std::vector<std::unique_ptr<Interaction>>& interactions() const
  {
    return interactions_;
  }
  const std::vector<std::unique_ptr<GraphicalLine>>& graphicalLines() const
  {
    return graphical_lines_;
  }
  const std::vector<std::unique_ptr<Label>>& labels() const
  {
    return labels_;
  }
  const std::vector<std::unique_ptr<Shape>>& shapes() const
  {
    return shapes_;
  }
  const std::vector<std::unique_ptr<Group>>& groups() const
  {
    return groups_;
  }
  const std::vector<std::unique_ptr<Annotation>>& annotations() const
  {
    return annotations_;
  }
  const std::vector<std::unique_ptr<Citation>>& citations() const
  {
    return citations_;
  }
  const std::vector<std::unique_ptr<Evidence>>& evidences() const
  {
    return evidences_;
  }

  /// Every element except the Pathway itself, in category order.
  std::vector<PathwayElement*> elements() const;

  /// Lines of both kinds, interactions first.
  std::vector<LineElement*> lines() const;

  /// Elements whose groupRef equals group_id.
  std::vector<PathwayElement*> groupMembers(const std::string& group_id) const;

  /// States whose elementRef equals data_node_id, in insertion order.
  std::vector<State*> statesOf(const std::string& data_node_id) const;

  /// Number of refs (at any nesting depth, on any element or the Pathway)
  /// pointing to the given pool entry.
  std::size_t referenceCount(const std::string& pool_id) const;

  /// ---------------------------------------------------------------------------
  /// Integrity.
  /// ---------------------------------------------------------------------------

  /// Clear every dangling reference: point and state elementRefs, groupRefs,
  /// aliasRefs and pool refs. Returns the number cleared and logs the tally
  /// as a warning when non-zero.
  std::size_t fixReferences();

  /// Deterministic id for a line that has none, derived from its end
  /// coordinates and arrowheads; salted until it collides with no id ever
  /// issued in this model.
  std::string lineIdFor(const LineElement& line) const;

  /// ---------------------------------------------------------------------------
  /// Event channel.
  /// ---------------------------------------------------------------------------
  void addListener(ModelListener* listener);
  void removeListener(ModelListener* listener);
  void notify(ModelEventType type, const PathwayObject& object) const;

private:
  template <typename T>
  T& admit(std::unique_ptr<T> element, std::vector<std::unique_ptr<T>>& storage);

  template <typename T>
  T& admitPooled(std::unique_ptr<T> entry, std::vector<std::unique_ptr<T>>& storage);

  void registerLineParts(LineElement& line, std::vector<std::string>& registered);
  void unbindPointsTo(const std::string& id);
  void collectPoolIds(const PathwayElement& element, std::vector<std::string>& out) const;
  bool eraseElement(const PathwayObject* object);

  SchemaVersion version_;
  IdRegistry ids_;
  std::unique_ptr<Pathway> pathway_;

  std::vector<std::unique_ptr<DataNode>> data_nodes_;
  std::vector<std::unique_ptr<State>> states_;
  std::vector<std::unique_ptr<Interaction>> interactions_;
  std::vector<std::unique_ptr<GraphicalLine>> graphical_lines_;
  std::vector<std::unique_ptr<Label>> labels_;
  std::vector<std::unique_ptr<Shape>> shapes_;
  std::vector<std::unique_ptr<Group>> groups_;

  std::vector<std::unique_ptr<Annotation>> annotations_;
  std::vector<std::unique_ptr<Citation>> citations_;
  std::vector<std::unique_ptr<Evidence>> evidences_;

  std::vector<ModelListener*> listeners_;
};

}  // namespace gpml

#endif  // GPML_MODEL_PATHWAY_MODEL_H_
