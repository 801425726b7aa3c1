#ifndef GPML_MODEL_MODEL_EVENT_H_
#define GPML_MODEL_MODEL_EVENT_H_

#include <string>

#include <gpml/model/elements.h>

namespace gpml {

enum class ModelEventType
{
  Added,
  Removed,
  Modified
};

struct ModelEvent
{
  ModelEventType type = ModelEventType::Modified;
  ObjectType object_type = ObjectType::Pathway;
  std::string element_id;
};

/// Receives structural changes of a PathwayModel. Listeners are not owned
/// by the model and must outlive their registration.
class ModelListener
{
public:
  virtual ~ModelListener() = default;

  virtual void modelEvent(const ModelEvent& event) = 0;
};

}  // namespace gpml

#endif  // GPML_MODEL_MODEL_EVENT_H_
