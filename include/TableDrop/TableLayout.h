#pragma once
#include "ContactConfig.h"
#include "EntityLocator.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace TableDrop {

// Anything that can say where a table entity is drawn.
class IBoundsProvider {
 public:
  virtual ~IBoundsProvider() = default;

  virtual std::optional<Rect> BoundsOf(const TableEntity& entity,
                                       const EntityList& entities) const = 0;

  // True when the rectangle comes from the renderer rather than an estimate.
  virtual bool IsAuthoritative(const TableEntity& /*entity*/) const { return false; }
};

// Default provider: positions estimated by LocateEntity.
class HeuristicLayout : public IBoundsProvider {
 public:
  explicit HeuristicLayout(const ContactConfig& config = {}) : m_Config(config) {}

  std::optional<Rect> BoundsOf(const TableEntity& entity,
                               const EntityList& entities) const override;

  const ContactConfig& Config() const { return m_Config; }

 private:
  ContactConfig m_Config;
};

// Rectangles a renderer recorded after laying out the table, keyed by
// EntityKey(). Entities without a record fall back to the heuristic.
// A record is only used while the entity is still in the list queried.
// Owned by the caller; there is no global registry.
class RecordedLayout : public IBoundsProvider {
 public:
  explicit RecordedLayout(const ContactConfig& config = {}) : m_Fallback(config) {}

  void Record(const TableEntity& entity, const Rect& bounds);
  void Record(const std::string& key, const Rect& bounds);
  bool Forget(const TableEntity& entity);
  void Clear() { m_Slots.clear(); }

  bool HasRecorded(const TableEntity& entity) const;
  size_t Size() const { return m_Slots.size(); }
  const ContactConfig& Config() const { return m_Fallback.Config(); }

  std::optional<Rect> BoundsOf(const TableEntity& entity,
                               const EntityList& entities) const override;
  bool IsAuthoritative(const TableEntity& entity) const override { return HasRecorded(entity); }

 private:
  HeuristicLayout m_Fallback;
  std::unordered_map<std::string, Rect> m_Slots;
};

} // namespace TableDrop
