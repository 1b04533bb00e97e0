#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace tally::model {

struct TemporaryId {
  std::string value;

  bool operator==(const TemporaryId&) const = default;
};

struct PersistentId {
  std::string value;

  bool operator==(const PersistentId&) const = default;
};

/*
  Record identifier.

  Either a locally minted temporary id (not yet confirmed by the remote
  backend) or a server-assigned persistent id. Classification is carried
  by the tag, never by inspecting the string.
*/
class Identifier {
 public:
  // Stored alongside the id text in the local store.
  enum class Kind : std::uint8_t {
    kPersistent = 0,
    kTemporary  = 1,
  };

  Identifier() = default;

  static Identifier Temporary(std::string value);
  static Identifier Persistent(std::string value);

  // "temp_<epoch ms>_<9 base36 chars>"
  static Identifier MintTemporary();

  static Identifier FromStored(std::string value, int kind);

  bool IsTemporary() const {
    return std::holds_alternative<TemporaryId>(id_);
  }

  bool IsPersistent() const {
    return std::holds_alternative<PersistentId>(id_);
  }

  const std::string& Value() const;

  Kind GetKind() const {
    return IsTemporary() ? Kind::kTemporary : Kind::kPersistent;
  }

  bool Empty() const {
    return Value().empty();
  }

  template <typename Visitor>
  decltype(auto) Visit(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), id_);
  }

  bool operator==(const Identifier&) const = default;

 private:
  explicit Identifier(std::variant<TemporaryId, PersistentId> id) : id_(std::move(id)) {
  }

  std::variant<TemporaryId, PersistentId> id_{PersistentId{}};
};

std::string ToString(const Identifier& id);

} // namespace tally::model
