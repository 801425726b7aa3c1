#include <cctype>
#include <set>
#include <string>

#include <gpml/errors.h>
#include <gpml/model/elements.h>
#include <gpml/model/id_registry.h>

#include <gtest/gtest.h>

using namespace gpml;

static bool isHex(const std::string& id)
{
  for (char c : id)
  {
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return !id.empty();
}

TEST(IdRegistry, AllocatedIdsAreUniqueAndStartWithLetter)
{
  IdRegistry ids(42);
  std::set<std::string> seen;
  for (int i = 0; i < 2000; ++i)
  {
    std::string id = ids.allocate();
    EXPECT_EQ(id.size(), 5u);
    EXPECT_TRUE(isHex(id)) << id;
    EXPECT_TRUE(std::isalpha(static_cast<unsigned char>(id.front()))) << id;
    EXPECT_TRUE(seen.insert(id).second) << "duplicate " << id;
  }
}

TEST(IdRegistry, SameSeedGivesSameSequence)
{
  IdRegistry a(7);
  IdRegistry b(7);
  for (int i = 0; i < 20; ++i)
    EXPECT_EQ(a.allocate(), b.allocate());
}

TEST(IdRegistry, RegisterDuplicateThrows)
{
  IdRegistry ids(1);
  DataNode first;
  DataNode second;
  ids.registerId("abc12", &first);
  EXPECT_THROW(ids.registerId("abc12", &second), DuplicateIdError);
  EXPECT_EQ(ids.lookup("abc12"), &first);
}

TEST(IdRegistry, ReleasedIdIsNeverAllocatedAgain)
{
  IdRegistry ids(3);
  DataNode node;
  ids.registerId("d0d0d", &node);
  ids.release("d0d0d");

  EXPECT_FALSE(ids.contains("d0d0d"));
  EXPECT_EQ(ids.lookup("d0d0d"), nullptr);
  EXPECT_TRUE(ids.wasIssued("d0d0d"));

  // A released id can be registered explicitly again.
  EXPECT_NO_THROW(ids.registerId("d0d0d", &node));
}

TEST(IdRegistry, ReservedIdIsSkippedButNotMapped)
{
  IdRegistry ids(5);
  ids.reserve("ffff1");
  EXPECT_TRUE(ids.wasIssued("ffff1"));
  EXPECT_FALSE(ids.contains("ffff1"));
  EXPECT_EQ(ids.size(), 0u);
}

TEST(IdRegistry, LookupOfUnknownIdIsNull)
{
  IdRegistry ids;
  EXPECT_EQ(ids.lookup("nope"), nullptr);
  EXPECT_EQ(ids.lookup(""), nullptr);
}
