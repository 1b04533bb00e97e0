#include "internal/model/identifier.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

namespace {

using tally::model::Identifier;

void TestMintedIdsAreTemporaryAndWellFormed() {
  const auto id = Identifier::MintTemporary();
  assert(id.IsTemporary());
  assert(!id.IsPersistent());
  assert(id.GetKind() == Identifier::Kind::kTemporary);

  const auto& value = id.Value();
  assert(value.rfind("temp_", 0) == 0);

  const auto last = value.rfind('_');
  assert(last != std::string::npos && last > 5);

  const auto millis = value.substr(5, last - 5);
  assert(!millis.empty());
  for (char c : millis) assert(std::isdigit(static_cast<unsigned char>(c)));

  const auto suffix = value.substr(last + 1);
  assert(suffix.size() == 9);
  for (char c : suffix) assert(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'));
}

void TestMintedIdsAreUnique() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    assert(seen.insert(Identifier::MintTemporary().Value()).second);
  }
}

void TestKindIsCarriedByTagNotText() {
  // a server id that happens to look temporary stays persistent
  const auto persistent = Identifier::Persistent("temp_123_abcdefghi");
  assert(persistent.IsPersistent());

  const auto temporary = Identifier::Temporary("42");
  assert(temporary.IsTemporary());

  assert(persistent != Identifier::Temporary("temp_123_abcdefghi"));
  assert(persistent == Identifier::Persistent("temp_123_abcdefghi"));
}

void TestStoredKindRoundTrip() {
  const auto temp = Identifier::FromStored("temp_1_aaaaaaaaa", static_cast<int>(Identifier::Kind::kTemporary));
  assert(temp.IsTemporary());
  assert(temp.Value() == "temp_1_aaaaaaaaa");

  const auto server = Identifier::FromStored("7f3c", static_cast<int>(Identifier::Kind::kPersistent));
  assert(server.IsPersistent());
  assert(server.Value() == "7f3c");
}

void TestDefaultIsEmptyPersistent() {
  Identifier id;
  assert(id.Empty());
  assert(id.IsPersistent());
}

void TestToStringNamesTheKind() {
  assert(tally::model::ToString(Identifier::Temporary("t1")) == "temporary:t1");
  assert(tally::model::ToString(Identifier::Persistent("p1")) == "persistent:p1");
}

} // namespace

int main() {
  TestMintedIdsAreTemporaryAndWellFormed();
  TestMintedIdsAreUnique();
  TestKindIsCarriedByTagNotText();
  TestStoredKindRoundTrip();
  TestDefaultIsEmptyPersistent();
  TestToStringNamesTheKind();

  std::cout << "tally_unit_identifier: pass\n";
  return 0;
}
