#include "input/DragTracker.h"
#include "core/Log.h"

void DragTracker::Reset() {
  m_Active = false;
  m_Finger = 0;
  m_Start = m_Position = {0.f, 0.f};
}

std::optional<DropEvent> DragTracker::OnTouch(const TouchPoint& p) {
  const glm::vec2 pos{p.x, p.y};

  if (!m_Active) {
    if (p.phase != TouchPhase::Began) return std::nullopt; // stray move/up
    m_Active = true;
    m_Finger = p.id;
    m_Start = m_Position = pos;
    TD_CORE_TRACE("[Drag] finger {} began at ({:.1f}, {:.1f})", p.id, p.x, p.y);
    return std::nullopt;
  }

  if (p.id != m_Finger) return std::nullopt;

  switch (p.phase) {
  case TouchPhase::Began:
    // platform lost our Ended; restart from here
    TD_CORE_WARN("[Drag] finger {} began twice, restarting drag", p.id);
    m_Start = m_Position = pos;
    return std::nullopt;

  case TouchPhase::Moved:
  case TouchPhase::Stationary:
    m_Position = pos;
    return std::nullopt;

  case TouchPhase::Cancelled:
    TD_CORE_TRACE("[Drag] finger {} cancelled", p.id);
    Reset();
    return std::nullopt;

  case TouchPhase::Ended:
    break;
  }

  m_Position = pos;
  DropEvent drop{m_Finger, pos, ToTable(pos)};
  TD_CORE_TRACE("[Drag] finger {} dropped at table ({:.1f}, {:.1f})", p.id,
                drop.tablePos.x, drop.tablePos.y);
  Reset();
  return drop;
}
