#include <gpml/model/id_registry.h>

#include <cstdio>
#include <utility>

#include <gpml/errors.h>
#include <gpml/logging.h>

namespace gpml {

IdRegistry::IdRegistry(std::uint32_t seed) : rng_(seed)
{
}

IdRegistry::IdRegistry(IdRegistry&& other) noexcept
{
  std::lock_guard<std::mutex> lock(other.mutex_);
  rng_ = other.rng_;
  objects_ = std::move(other.objects_);
  issued_ = std::move(other.issued_);
}

IdRegistry& IdRegistry::operator=(IdRegistry&& other) noexcept
{
  if (this != &other)
  {
    std::scoped_lock lock(mutex_, other.mutex_);
    rng_ = other.rng_;
    objects_ = std::move(other.objects_);
    issued_ = std::move(other.issued_);
  }
  return *this;
}

std::string IdRegistry::generate()
{
  // First hex digit lands in a-f so ids are valid xsd:ID values.
  std::uint32_t min = 0xa0000;
  std::uint32_t mod = 0x60000;
  if (issued_.size() > kWideIdThreshold)
  {
    min = 0xa0000000;
    mod = 0x60000000;
  }
  std::uniform_int_distribution<std::uint32_t> dist(0, mod - 1);

  char buf[16];
  std::string id;
  do
  {
    std::snprintf(buf, sizeof(buf), "%x", min + dist(rng_));
    id = buf;
  } while (issued_.count(id) > 0);
  return id;
}

std::string IdRegistry::allocate()
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = generate();
  issued_.insert(id);
  logger()->trace("allocated element id {}", id);
  return id;
}

void IdRegistry::registerId(const std::string& id, PathwayObject* object)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (objects_.count(id) > 0)
    throw DuplicateIdError(id);
  objects_.emplace(id, object);
  issued_.insert(id);
}

void IdRegistry::reserve(const std::string& id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  issued_.insert(id);
}

void IdRegistry::release(const std::string& id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  objects_.erase(id);
}

PathwayObject* IdRegistry::lookup(const std::string& id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(id);
  return it == objects_.end() ? nullptr : it->second;
}

bool IdRegistry::contains(const std::string& id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.count(id) > 0;
}

bool IdRegistry::wasIssued(const std::string& id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return issued_.count(id) > 0;
}

std::size_t IdRegistry::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

}  // namespace gpml
