#include "TableDrop/TableLayout.h"
#include "core/Log.h"

namespace TableDrop {

std::optional<Rect> HeuristicLayout::BoundsOf(const TableEntity& entity,
                                              const EntityList& entities) const {
  return LocateEntity(entity, entities, m_Config);
}

void RecordedLayout::Record(const TableEntity& entity, const Rect& bounds) {
  Record(EntityKey(entity), bounds);
}

void RecordedLayout::Record(const std::string& key, const Rect& bounds) {
  if (key.empty()) {
    TD_CORE_WARN("RecordedLayout: ignoring rect for entity without a key");
    return;
  }
  if (bounds.w < 0.f || bounds.h < 0.f) {
    TD_CORE_WARN("RecordedLayout: ignoring negative rect {}x{} for '{}'", bounds.w, bounds.h, key);
    return;
  }
  m_Slots[key] = bounds;
}

bool RecordedLayout::Forget(const TableEntity& entity) {
  return m_Slots.erase(EntityKey(entity)) != 0;
}

bool RecordedLayout::HasRecorded(const TableEntity& entity) const {
  return m_Slots.count(EntityKey(entity)) != 0;
}

std::optional<Rect> RecordedLayout::BoundsOf(const TableEntity& entity,
                                             const EntityList& entities) const {
  if (IndexAmongKind(entity, entities) < 0) return std::nullopt; // stale slot
  auto it = m_Slots.find(EntityKey(entity));
  if (it != m_Slots.end()) return it->second;
  return m_Fallback.BoundsOf(entity, entities);
}

} // namespace TableDrop
