#include "identifier.hpp"

#include <random>

#include "internal/util/time.hpp"

namespace tally::model {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr int  kSuffixLength = 9;

std::string RandomSuffix() {
  static thread_local std::mt19937_64          rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, 35);

  std::string suffix;
  suffix.reserve(kSuffixLength);
  for (int i = 0; i < kSuffixLength; ++i) {
    suffix.push_back(kBase36[pick(rng)]);
  }
  return suffix;
}

} // namespace

Identifier Identifier::Temporary(std::string value) {
  return Identifier(TemporaryId{std::move(value)});
}

Identifier Identifier::Persistent(std::string value) {
  return Identifier(PersistentId{std::move(value)});
}

Identifier Identifier::MintTemporary() {
  return Temporary("temp_" + std::to_string(util::NowMs()) + "_" + RandomSuffix());
}

Identifier Identifier::FromStored(std::string value, int kind) {
  if (kind == static_cast<int>(Kind::kTemporary)) {
    return Temporary(std::move(value));
  }
  return Persistent(std::move(value));
}

const std::string& Identifier::Value() const {
  return Visit([](const auto& id) -> const std::string& { return id.value; });
}

std::string ToString(const Identifier& id) {
  return (id.IsTemporary() ? "temporary:" : "persistent:") + id.Value();
}

} // namespace tally::model
