#ifndef GPML_MODEL_ID_REGISTRY_H_
#define GPML_MODEL_ID_REGISTRY_H_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace gpml {

struct PathwayObject;

/// Element ids of one pathway document.
///
/// allocate() never hands out an id that was issued or registered before,
/// even after the owner was removed, so stale references cannot silently
/// re-link to a new element. Registry writes are serialized by a mutex.
class IdRegistry
{
public:
  /// Issued-id count above which generated ids grow from 5 to 8 hex digits.
  static constexpr std::size_t kWideIdThreshold = 0x10000;

  explicit IdRegistry(std::uint32_t seed = std::random_device{}());

  IdRegistry(const IdRegistry&) = delete;
  IdRegistry& operator=(const IdRegistry&) = delete;
  IdRegistry(IdRegistry&& other) noexcept;
  IdRegistry& operator=(IdRegistry&& other) noexcept;

  /// Fresh id, unique among everything issued or registered so far. The
  /// id is reserved but not mapped to an object.
  std::string allocate();

  /// Map id to object. Throws DuplicateIdError if id is currently mapped.
  void registerId(const std::string& id, PathwayObject* object);

  /// Reserve an id without mapping it, so allocate() will not produce it.
  void reserve(const std::string& id);

  void release(const std::string& id);

  PathwayObject* lookup(const std::string& id) const;

  bool contains(const std::string& id) const;

  /// True if the id was ever issued, reserved or registered.
  bool wasIssued(const std::string& id) const;

  std::size_t size() const;

private:
  std::string generate();

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<std::string, PathwayObject*> objects_;
  std::unordered_set<std::string> issued_;
};

}  // namespace gpml

#endif  // GPML_MODEL_ID_REGISTRY_H_
