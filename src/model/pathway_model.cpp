#include <gpml/model/pathway_model.h>

#include <algorithm>
#include <cstdio>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/coordinates.h>

namespace gpml {

namespace {

// 31-based string hash; stable across platforms and runs.
std::uint32_t stableHash(const std::string& text)
{
  std::uint32_t h = 0;
  for (unsigned char c : text)
    h = 31 * h + c;
  return h;
}

template <typename T>
void eraseOwned(std::vector<std::unique_ptr<T>>& storage, const PathwayObject* object)
{
  storage.erase(std::remove_if(storage.begin(), storage.end(),
                               [object](const std::unique_ptr<T>& p) { return p.get() == object; }),
                storage.end());
}

template <typename Fn>
void forEachAnnotationRef(std::vector<AnnotationRef>& refs, Fn&& fn);

template <typename Fn>
void forEachCitationRef(std::vector<CitationRef>& refs, Fn&& fn)
{
  for (auto& ref : refs)
  {
    fn(ref);
    forEachAnnotationRef(ref.annotation_refs, fn);
  }
}

template <typename Fn>
void forEachAnnotationRef(std::vector<AnnotationRef>& refs, Fn&& fn)
{
  for (auto& ref : refs)
  {
    fn(ref);
    forEachCitationRef(ref.citation_refs, fn);
    for (auto& ev : ref.evidence_refs)
      fn(ev);
  }
}

/// Visit every ref of an element, nested ones included. fn is called with
/// AnnotationRef&, CitationRef& or EvidenceRef&.
template <typename Fn>
void forEachRef(PathwayElement& element, Fn&& fn)
{
  forEachAnnotationRef(element.annotation_refs, fn);
  forEachCitationRef(element.citation_refs, fn);
  for (auto& ev : element.evidence_refs)
    fn(ev);
}

struct RefIdCollector
{
  std::vector<std::string>* out;

  void operator()(const AnnotationRef& ref) const
  {
    out->push_back(ref.annotation_id);
  }
  void operator()(const CitationRef& ref) const
  {
    out->push_back(ref.citation_id);
  }
  void operator()(const EvidenceRef& ref) const
  {
    out->push_back(ref.evidence_id);
  }
};

/// Drop refs whose target is not a pool entry of the expected type.
/// Returns the number of refs removed, nested ones included.
std::size_t pruneAnnotationRefs(std::vector<AnnotationRef>& refs, const PathwayModel& model);

std::size_t pruneEvidenceRefs(std::vector<EvidenceRef>& refs, const PathwayModel& model)
{
  auto it = std::remove_if(refs.begin(), refs.end(),
                           [&model](const EvidenceRef& r) { return !model.find<Evidence>(r.evidence_id); });
  std::size_t removed = static_cast<std::size_t>(std::distance(it, refs.end()));
  refs.erase(it, refs.end());
  return removed;
}

std::size_t pruneCitationRefs(std::vector<CitationRef>& refs, const PathwayModel& model)
{
  auto it = std::remove_if(refs.begin(), refs.end(),
                           [&model](const CitationRef& r) { return !model.find<Citation>(r.citation_id); });
  std::size_t removed = static_cast<std::size_t>(std::distance(it, refs.end()));
  refs.erase(it, refs.end());
  for (auto& ref : refs)
    removed += pruneAnnotationRefs(ref.annotation_refs, model);
  return removed;
}

std::size_t pruneAnnotationRefs(std::vector<AnnotationRef>& refs, const PathwayModel& model)
{
  auto it = std::remove_if(refs.begin(), refs.end(),
                           [&model](const AnnotationRef& r) { return !model.find<Annotation>(r.annotation_id); });
  std::size_t removed = static_cast<std::size_t>(std::distance(it, refs.end()));
  refs.erase(it, refs.end());
  for (auto& ref : refs)
  {
    removed += pruneCitationRefs(ref.citation_refs, model);
    removed += pruneEvidenceRefs(ref.evidence_refs, model);
  }
  return removed;
}

}  // namespace

PathwayModel::PathwayModel(SchemaVersion version, std::uint32_t id_seed)
  : version_(version), ids_(id_seed), pathway_(std::make_unique<Pathway>())
{
}

/// ---------------------------------------------------------------------------
/// Admission
/// ---------------------------------------------------------------------------

void PathwayModel::registerLineParts(LineElement& line, std::vector<std::string>& registered)
{
  for (auto& anchor : line.anchors)
  {
    if (anchor->element_id.empty())
      anchor->element_id = ids_.allocate();
    ids_.registerId(anchor->element_id, anchor.get());
    registered.push_back(anchor->element_id);
  }
  for (auto& point : line.points)
  {
    if (point->element_id.empty())
      continue;
    ids_.registerId(point->element_id, point.get());
    registered.push_back(point->element_id);
  }
}

template <typename T>
T& PathwayModel::admit(std::unique_ptr<T> element, std::vector<std::unique_ptr<T>>& storage)
{
  if (!element)
    throw std::invalid_argument("Cannot add a null element");

  if (element->element_id.empty())
    element->element_id = ids_.allocate();

  std::vector<std::string> registered;
  try
  {
    ids_.registerId(element->element_id, element.get());
    registered.push_back(element->element_id);
    if constexpr (std::is_base_of_v<LineElement, T>)
      registerLineParts(*element, registered);
  }
  catch (const DuplicateIdError&)
  {
    for (const auto& id : registered)
      ids_.release(id);
    throw;
  }

  storage.push_back(std::move(element));
  T& added = *storage.back();
  notify(ModelEventType::Added, added);
  return added;
}

template <typename T>
T& PathwayModel::admitPooled(std::unique_ptr<T> entry, std::vector<std::unique_ptr<T>>& storage)
{
  if (!entry)
    throw std::invalid_argument("Cannot add a null pool entry");

  for (auto& existing : storage)
  {
    if (existing->sameContent(*entry))
      return *existing;
  }

  if (entry->element_id.empty())
    entry->element_id = ids_.allocate();
  ids_.registerId(entry->element_id, entry.get());

  storage.push_back(std::move(entry));
  T& added = *storage.back();
  notify(ModelEventType::Added, added);
  return added;
}

DataNode& PathwayModel::add(std::unique_ptr<DataNode> node)
{
  return admit(std::move(node), data_nodes_);
}

State& PathwayModel::add(std::unique_ptr<State> state)
{
  return admit(std::move(state), states_);
}

Interaction& PathwayModel::add(std::unique_ptr<Interaction> interaction)
{
  return admit(std::move(interaction), interactions_);
}

GraphicalLine& PathwayModel::add(std::unique_ptr<GraphicalLine> line)
{
  return admit(std::move(line), graphical_lines_);
}

Label& PathwayModel::add(std::unique_ptr<Label> label)
{
  return admit(std::move(label), labels_);
}

Shape& PathwayModel::add(std::unique_ptr<Shape> shape)
{
  return admit(std::move(shape), shapes_);
}

Group& PathwayModel::add(std::unique_ptr<Group> group)
{
  return admit(std::move(group), groups_);
}

Annotation& PathwayModel::add(std::unique_ptr<Annotation> annotation)
{
  return admitPooled(std::move(annotation), annotations_);
}

Citation& PathwayModel::add(std::unique_ptr<Citation> citation)
{
  return admitPooled(std::move(citation), citations_);
}

Evidence& PathwayModel::add(std::unique_ptr<Evidence> evidence)
{
  return admitPooled(std::move(evidence), evidences_);
}

Anchor& PathwayModel::addAnchor(LineElement& line, double position, AnchorShapeType shape_type)
{
  Anchor& anchor = line.addAnchor(position, shape_type);
  anchor.element_id = ids_.allocate();
  ids_.registerId(anchor.element_id, &anchor);
  notify(ModelEventType::Added, anchor);
  return anchor;
}

/// ---------------------------------------------------------------------------
/// Removal
/// ---------------------------------------------------------------------------

void PathwayModel::unbindPointsTo(const std::string& id)
{
  for (LineElement* line : lines())
  {
    for (auto& point : line->points)
    {
      if (point->element_ref != id)
        continue;
      point->position = absolutePosition(*this, *point);
      point->element_ref.clear();
      point->relative.reset();
    }
  }
}

void PathwayModel::collectPoolIds(const PathwayElement& element, std::vector<std::string>& out) const
{
  forEachRef(const_cast<PathwayElement&>(element), RefIdCollector{ &out });
}

bool PathwayModel::eraseElement(const PathwayObject* object)
{
  switch (object->objectType())
  {
    case ObjectType::DataNode:
      eraseOwned(data_nodes_, object);
      return true;
    case ObjectType::State:
      eraseOwned(states_, object);
      return true;
    case ObjectType::Interaction:
      eraseOwned(interactions_, object);
      return true;
    case ObjectType::GraphicalLine:
      eraseOwned(graphical_lines_, object);
      return true;
    case ObjectType::Label:
      eraseOwned(labels_, object);
      return true;
    case ObjectType::Shape:
      eraseOwned(shapes_, object);
      return true;
    case ObjectType::Group:
      eraseOwned(groups_, object);
      return true;
    default:
      return false;
  }
}

bool PathwayModel::removeElement(const std::string& id)
{
  auto* element = dynamic_cast<PathwayElement*>(lookup(id));
  if (!element || element->objectType() == ObjectType::Pathway)
    return false;

  const ObjectType type = element->objectType();
  std::vector<std::string> pool_ids;
  collectPoolIds(*element, pool_ids);

  if (type == ObjectType::DataNode)
  {
    for (State* state : statesOf(id))
      removeElement(state->element_id);
  }

  if (type == ObjectType::Group)
  {
    for (PathwayElement* member : groupMembers(id))
    {
      dynamic_cast<Groupable*>(member)->group_ref.clear();
      notify(ModelEventType::Modified, *member);
    }
    for (auto& node : data_nodes_)
    {
      if (node->alias_ref == id)
        node->alias_ref.clear();
    }
  }

  unbindPointsTo(id);
  if (auto* line = dynamic_cast<LineElement*>(element))
  {
    for (auto& anchor : line->anchors)
    {
      unbindPointsTo(anchor->element_id);
      ids_.release(anchor->element_id);
    }
    for (auto& point : line->points)
    {
      if (!point->element_id.empty())
        ids_.release(point->element_id);
    }
  }

  ModelEvent event{ ModelEventType::Removed, type, id };
  ids_.release(id);
  eraseElement(element);

  for (const auto& pool_id : pool_ids)
  {
    if (referenceCount(pool_id) == 0)
      removePoolEntry(pool_id);
  }

  for (ModelListener* listener : listeners_)
    listener->modelEvent(event);
  return true;
}

bool PathwayModel::removePoolEntry(const std::string& id)
{
  PathwayObject* entry = lookup(id);
  if (!entry)
    return false;

  const ObjectType type = entry->objectType();
  if (type != ObjectType::Annotation && type != ObjectType::Citation && type != ObjectType::Evidence)
    return false;
  if (referenceCount(id) > 0)
    return false;

  ModelEvent event{ ModelEventType::Removed, type, id };
  ids_.release(id);
  if (type == ObjectType::Annotation)
    eraseOwned(annotations_, entry);
  else if (type == ObjectType::Citation)
    eraseOwned(citations_, entry);
  else
    eraseOwned(evidences_, entry);

  for (ModelListener* listener : listeners_)
    listener->modelEvent(event);
  return true;
}

std::size_t PathwayModel::purgeUnreferenced()
{
  std::vector<std::string> candidates;
  for (const auto& a : annotations_)
    candidates.push_back(a->element_id);
  for (const auto& c : citations_)
    candidates.push_back(c->element_id);
  for (const auto& e : evidences_)
    candidates.push_back(e->element_id);

  std::size_t removed = 0;
  for (const auto& id : candidates)
  {
    if (removePoolEntry(id))
      ++removed;
  }
  return removed;
}

std::size_t PathwayModel::removeEmptyGroups()
{
  std::size_t removed = 0;
  bool changed = true;
  while (changed)
  {
    changed = false;
    for (const auto& group : groups_)
    {
      if (groupMembers(group->element_id).empty())
      {
        std::string id = group->element_id;
        removeElement(id);
        ++removed;
        changed = true;
        break;
      }
    }
  }
  return removed;
}

/// ---------------------------------------------------------------------------
/// Queries
/// ---------------------------------------------------------------------------

PathwayObject* PathwayModel::lookup(const std::string& id) const
{
  if (id.empty())
    return nullptr;
  return ids_.lookup(id);
}

std::vector<PathwayElement*> PathwayModel::elements() const
{
  std::vector<PathwayElement*> out;
  for (const auto& e : data_nodes_)
    out.push_back(e.get());
  for (const auto& e : states_)
    out.push_back(e.get());
  for (const auto& e : interactions_)
    out.push_back(e.get());
  for (const auto& e : graphical_lines_)
    out.push_back(e.get());
  for (const auto& e : labels_)
    out.push_back(e.get());
  for (const auto& e : shapes_)
    out.push_back(e.get());
  for (const auto& e : groups_)
    out.push_back(e.get());
  return out;
}

std::vector<LineElement*> PathwayModel::lines() const
{
  std::vector<LineElement*> out;
  for (const auto& e : interactions_)
    out.push_back(e.get());
  for (const auto& e : graphical_lines_)
    out.push_back(e.get());
  return out;
}

std::vector<PathwayElement*> PathwayModel::groupMembers(const std::string& group_id) const
{
  std::vector<PathwayElement*> members;
  if (group_id.empty())
    return members;
  for (PathwayElement* element : elements())
  {
    const auto* groupable = dynamic_cast<const Groupable*>(element);
    if (groupable && groupable->group_ref == group_id)
      members.push_back(element);
  }
  return members;
}

std::vector<State*> PathwayModel::statesOf(const std::string& data_node_id) const
{
  std::vector<State*> out;
  for (const auto& state : states_)
  {
    if (state->element_ref == data_node_id)
      out.push_back(state.get());
  }
  return out;
}

std::size_t PathwayModel::referenceCount(const std::string& pool_id) const
{
  std::vector<std::string> ids;
  collectPoolIds(*pathway_, ids);
  for (PathwayElement* element : elements())
    collectPoolIds(*element, ids);
  return static_cast<std::size_t>(std::count(ids.begin(), ids.end(), pool_id));
}

/// ---------------------------------------------------------------------------
/// Integrity
/// ---------------------------------------------------------------------------

std::size_t PathwayModel::fixReferences()
{
  std::size_t fixed = 0;

  for (LineElement* line : lines())
  {
    for (auto& point : line->points)
    {
      if (point->element_ref.empty())
        continue;
      const PathwayObject* target = lookup(point->element_ref);
      if (!target || !isLinkable(*target))
      {
        point->element_ref.clear();
        point->relative.reset();
        ++fixed;
      }
    }
  }

  for (auto& state : states_)
  {
    if (!state->element_ref.empty() && !find<DataNode>(state->element_ref))
    {
      state->element_ref.clear();
      ++fixed;
    }
  }

  for (PathwayElement* element : elements())
  {
    auto* groupable = dynamic_cast<Groupable*>(element);
    if (!groupable || groupable->group_ref.empty())
      continue;
    if (!find<Group>(groupable->group_ref) || groupable->group_ref == element->element_id)
    {
      groupable->group_ref.clear();
      ++fixed;
    }
  }

  for (auto& node : data_nodes_)
  {
    if (!node->alias_ref.empty() && !find<Group>(node->alias_ref))
    {
      node->alias_ref.clear();
      ++fixed;
    }
  }

  auto prune = [this](PathwayElement& element) {
    return pruneAnnotationRefs(element.annotation_refs, *this) + pruneCitationRefs(element.citation_refs, *this) +
           pruneEvidenceRefs(element.evidence_refs, *this);
  };
  fixed += prune(*pathway_);
  for (PathwayElement* element : elements())
    fixed += prune(*element);

  if (fixed > 0)
    logger()->warn("fixReferences: fixed {} reference(s)", fixed);
  return fixed;
}

std::string PathwayModel::lineIdFor(const LineElement& line) const
{
  std::string base;
  if (const LinePoint* start = line.startPoint())
    base += std::to_string(start->position.x()) + std::to_string(start->position.y());
  if (const LinePoint* end = line.endPoint())
    base += std::to_string(end->position.x()) + std::to_string(end->position.y());
  base += line.start_arrow_head.name() + line.end_arrow_head.name();

  char buf[16];
  for (int salt = 0;; ++salt)
  {
    std::snprintf(buf, sizeof(buf), "%x", stableHash(base + "_" + std::to_string(salt)));
    std::string id = std::string("id") + buf;
    if (!ids_.wasIssued(id))
      return id;
  }
}

/// ---------------------------------------------------------------------------
/// Event channel
/// ---------------------------------------------------------------------------

void PathwayModel::addListener(ModelListener* listener)
{
  if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
    listeners_.push_back(listener);
}

void PathwayModel::removeListener(ModelListener* listener)
{
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void PathwayModel::notify(ModelEventType type, const PathwayObject& object) const
{
  ModelEvent event{ type, object.objectType(), object.element_id };
  for (ModelListener* listener : listeners_)
    listener->modelEvent(event);
}

}  // namespace gpml
