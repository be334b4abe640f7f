#pragma once

#include "input/Touch.h"

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>

// A finished drag: where the finger lifted, in window and table coordinates.
struct DropEvent {
  std::int64_t finger = 0;
  glm::vec2 windowPos{0.f, 0.f};
  glm::vec2 tablePos{0.f, 0.f};
};

// Follows one finger from Began to Ended and reports the drop point.
// Touches from other fingers are ignored while a drag is active.
class DragTracker {
 public:
  explicit DragTracker(glm::vec2 tableOrigin = {0.f, 0.f}) : m_TableOrigin(tableOrigin) {}

  // Returns the drop when `p` ends the active drag.
  std::optional<DropEvent> OnTouch(const TouchPoint& p);

  bool IsDragging() const { return m_Active; }
  glm::vec2 Position() const { return m_Position; }
  glm::vec2 TablePosition() const { return ToTable(m_Position); }

  void SetTableOrigin(glm::vec2 origin) { m_TableOrigin = origin; }
  glm::vec2 ToTable(glm::vec2 windowPos) const { return windowPos - m_TableOrigin; }

  void Reset();

 private:
  glm::vec2 m_TableOrigin;
  bool m_Active = false;
  std::int64_t m_Finger = 0;
  glm::vec2 m_Start{0.f, 0.f};
  glm::vec2 m_Position{0.f, 0.f};
};
