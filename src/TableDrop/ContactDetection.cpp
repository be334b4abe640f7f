#include "TableDrop/ContactDetection.h"
#include "core/Log.h"

#include <algorithm>

namespace TableDrop {

ContactResolver::ContactResolver(const ContactConfig& config)
  : m_Config(config), m_Heuristic(config), m_Layout(m_Heuristic) {}

ContactResolver::ContactResolver(const ContactConfig& config, const IBoundsProvider& layout)
  : m_Config(config), m_Heuristic(config), m_Layout(layout) {}

ContactResolver::ContactResolver(const RecordedLayout& layout)
  : ContactResolver(layout.Config(), layout) {}

Rect ContactResolver::droppedBounds(glm::vec2 dropPoint) const {
  return DroppedBounds(dropPoint, m_Config.cardSize);
}

ContactResult ContactResolver::ResolveBestContact(glm::vec2 dropPoint,
                                                  const EntityList& entities) const {
  ContactResult best;
  best.droppedBounds = droppedBounds(dropPoint);

  for (const auto& entity : entities) {
    auto bounds = m_Layout.BoundsOf(entity, entities);
    if (!bounds) {
      TD_CORE_TRACE("contact: skipping unlocatable {}", Describe(entity));
      continue;
    }

    float pct = OverlapPercentage(best.droppedBounds, *bounds);
    if (pct > m_Config.contactThreshold && pct > best.overlapPercentage) {
      best.hasContact = true;
      best.target = entity;
      best.targetKind = KindOf(entity);
      best.overlapPercentage = pct;
      best.tableBounds = bounds;
    }
  }

  if (best.hasContact) {
    TD_CORE_TRACE("contact: drop ({:.1f},{:.1f}) -> {} {:.0f}%", dropPoint.x, dropPoint.y,
                  Describe(*best.target), best.overlapPercentage * 100.f);
  }
  return best;
}

std::vector<ContactEntry> ContactResolver::ResolveAllContacts(glm::vec2 dropPoint,
                                                              const EntityList& entities) const {
  const Rect dropped = droppedBounds(dropPoint);
  std::vector<ContactEntry> out;

  for (const auto& entity : entities) {
    auto bounds = m_Layout.BoundsOf(entity, entities);
    if (!bounds) continue;

    float pct = OverlapPercentage(dropped, *bounds);
    if (pct > m_Config.contactThreshold)
      out.push_back(ContactEntry{entity, KindOf(entity), pct, *bounds});
  }

  std::stable_sort(out.begin(), out.end(), [](const ContactEntry& a, const ContactEntry& b) {
    return a.overlapPercentage > b.overlapPercentage;
  });
  return out;
}

bool ContactResolver::HasAnyContact(glm::vec2 dropPoint, const EntityList& entities) const {
  return ResolveBestContact(dropPoint, entities).hasContact;
}

std::vector<LooseContact> ContactResolver::ResolveLooseContacts(glm::vec2 dropPoint,
                                                                const EntityList& entities) const {
  std::vector<LooseContact> out;
  for (const auto& c : ResolveAllContacts(dropPoint, entities)) {
    if (const Card* card = AsLooseCard(c.entity))
      out.push_back(LooseContact{*card, c.overlapPercentage, c.bounds});
  }
  return out;
}

bool ContactResolver::HasAnyOverlap(glm::vec2 dropPoint, const EntityList& entities) const {
  const Rect dropped = droppedBounds(dropPoint);
  for (const auto& entity : entities) {
    auto bounds = m_Layout.BoundsOf(entity, entities);
    if (bounds && HasOverlap(dropped, *bounds)) return true;
  }
  return false;
}

// ---------- free functions

ContactResult ResolveBestContact(glm::vec2 dropPoint, const EntityList& entities,
                                 const ContactConfig& config) {
  return ContactResolver(config).ResolveBestContact(dropPoint, entities);
}

std::vector<ContactEntry> ResolveAllContacts(glm::vec2 dropPoint, const EntityList& entities,
                                             const ContactConfig& config) {
  return ContactResolver(config).ResolveAllContacts(dropPoint, entities);
}

bool HasAnyContact(glm::vec2 dropPoint, const EntityList& entities, const ContactConfig& config) {
  return ContactResolver(config).HasAnyContact(dropPoint, entities);
}

std::vector<LooseContact> ResolveLooseContacts(glm::vec2 dropPoint, const EntityList& entities,
                                               const ContactConfig& config) {
  return ContactResolver(config).ResolveLooseContacts(dropPoint, entities);
}

} // namespace TableDrop
