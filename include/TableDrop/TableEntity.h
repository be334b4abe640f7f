#pragma once
#include "Card.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace TableDrop {

// A committed build. `value` is the capture target all cards jointly sum to.
struct Build {
  std::string buildId;
  int owner = -1;                 // player expected to capture it later
  int value = 0;
  CardList cards;
  bool isExtendable = false;
};

// A player-confirmable staging pile; it has no committed value until shown.
struct TemporaryStack {
  std::string stackId;
  int owner = -1;
  CardList cards;
};

// Loose card, build or temporary stack. The alternative index is the kind.
using TableEntity = std::variant<Card, Build, TemporaryStack>;
using EntityList  = std::vector<TableEntity>;

enum class EntityKind : uint8_t { LooseCard, Build, TemporaryStack };

EntityKind  KindOf(const TableEntity& e);
const char* KindName(EntityKind k);

// Stable key a renderer registers a slot under:
// "loose-<rank>-<suit>", the build id or the stack id.
std::string EntityKey(const TableEntity& e);

// The cards an entity shows (one for a loose card).
CardList EntityCards(const TableEntity& e);

std::string Describe(const TableEntity& e);

inline const Card*           AsLooseCard(const TableEntity& e) { return std::get_if<Card>(&e); }
inline const Build*          AsBuild(const TableEntity& e)     { return std::get_if<Build>(&e); }
inline const TemporaryStack* AsTempStack(const TableEntity& e) { return std::get_if<TemporaryStack>(&e); }

} // namespace TableDrop
