#include "TableDrop/EntityLocator.h"

namespace TableDrop {

template <typename T>
static int indexOfStack(const T& target, const std::string& (*idOf)(const T&),
                        const EntityList& entities) {
  const std::string& id = idOf(target);
  int ordinal = 0;
  for (const auto& e : entities) {
    const T* other = std::get_if<T>(&e);
    if (!other) continue;
    bool match = id.empty() ? other->cards == target.cards : idOf(*other) == id;
    if (match) return ordinal;
    ++ordinal;
  }
  return -1;
}

static const std::string& buildIdOf(const Build& b) { return b.buildId; }
static const std::string& stackIdOf(const TemporaryStack& t) { return t.stackId; }

int IndexAmongKind(const TableEntity& entity, const EntityList& entities) {
  if (const Build* b = AsBuild(entity))
    return indexOfStack<Build>(*b, &buildIdOf, entities);
  if (const TemporaryStack* t = AsTempStack(entity))
    return indexOfStack<TemporaryStack>(*t, &stackIdOf, entities);

  const Card* card = AsLooseCard(entity);
  int ordinal = 0;
  for (const auto& e : entities) {
    const Card* other = AsLooseCard(e);
    if (!other) continue;
    if (*other == *card) return ordinal;
    ++ordinal;
  }
  return -1;
}

std::optional<Rect> LocateEntity(const TableEntity& entity, const EntityList& entities,
                                 const ContactConfig& config) {
  int idx = IndexAmongKind(entity, entities);
  if (idx < 0) return std::nullopt;

  const auto& L = config.locator;
  const glm::vec2 card = config.cardSize;
  const float i = static_cast<float>(idx);

  switch (KindOf(entity)) {
  case EntityKind::Build:
    return Rect{L.buildOrigin.x + i * L.buildSpacing, L.buildOrigin.y,
                card.x * L.buildWidthFactor, card.y};
  case EntityKind::TemporaryStack:
    return Rect{L.stackOrigin.x + i * L.stackSpacing, L.stackOrigin.y,
                card.x * L.stackWidthFactor, card.y};
  case EntityKind::LooseCard:
  default:
    return Rect{L.looseOrigin.x + i * L.looseSpacing, L.looseOrigin.y, card.x, card.y};
  }
}

} // namespace TableDrop
