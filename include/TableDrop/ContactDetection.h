#pragma once
#include "ContactConfig.h"
#include "Geometry.h"
#include "TableEntity.h"
#include "TableLayout.h"

#include <optional>
#include <vector>

namespace TableDrop {

// Best match of a drop against the table.
struct ContactResult {
  bool hasContact = false;
  std::optional<TableEntity> target;
  std::optional<EntityKind> targetKind;            // empty without contact
  float overlapPercentage = 0.f;
  std::optional<Rect> tableBounds;
  Rect droppedBounds;
};

// One qualifying entity of a ranked contact query.
struct ContactEntry {
  TableEntity entity;
  EntityKind kind = EntityKind::LooseCard;
  float overlapPercentage = 0.f;
  Rect bounds;
};

// Entry of the loose-card-only view.
struct LooseContact {
  Card card;
  float overlapPercentage = 0.f;
  Rect bounds;
};

// Answers "what did this drop touch?". Pure queries over the entity list
// snapshot passed in; bounds come from the provider on every call.
class ContactResolver {
 public:
  // Uses the built-in heuristic layout.
  explicit ContactResolver(const ContactConfig& config = {});
  // `layout` must outlive the resolver. Any heuristic fallback inside
  // `layout` must use the same card size and locator constants as `config`.
  ContactResolver(const ContactConfig& config, const IBoundsProvider& layout);
  // Takes the config from the recorded layout so both scales agree.
  explicit ContactResolver(const RecordedLayout& layout);

  ContactResolver(const ContactResolver&) = delete;
  ContactResolver& operator=(const ContactResolver&) = delete;

  // Entity with the strictly highest overlap above the threshold; on a tie
  // the earlier entity in the list wins.
  ContactResult ResolveBestContact(glm::vec2 dropPoint, const EntityList& entities) const;

  // Every entity above the threshold, highest overlap first. Equal overlaps
  // keep list order.
  std::vector<ContactEntry> ResolveAllContacts(glm::vec2 dropPoint, const EntityList& entities) const;

  bool HasAnyContact(glm::vec2 dropPoint, const EntityList& entities) const;

  // ResolveAllContacts restricted to loose cards.
  std::vector<LooseContact> ResolveLooseContacts(glm::vec2 dropPoint, const EntityList& entities) const;

  // Any overlap at all with a locatable entity, threshold ignored.
  bool HasAnyOverlap(glm::vec2 dropPoint, const EntityList& entities) const;

  const ContactConfig& Config() const { return m_Config; }

 private:
  Rect droppedBounds(glm::vec2 dropPoint) const;

 private:
  ContactConfig m_Config;
  HeuristicLayout m_Heuristic;
  const IBoundsProvider& m_Layout;
};

// Free-function forms using the heuristic layout.
ContactResult ResolveBestContact(glm::vec2 dropPoint, const EntityList& entities,
                                 const ContactConfig& config = {});
std::vector<ContactEntry> ResolveAllContacts(glm::vec2 dropPoint, const EntityList& entities,
                                             const ContactConfig& config = {});
bool HasAnyContact(glm::vec2 dropPoint, const EntityList& entities,
                   const ContactConfig& config = {});
std::vector<LooseContact> ResolveLooseContacts(glm::vec2 dropPoint, const EntityList& entities,
                                               const ContactConfig& config = {});

} // namespace TableDrop
