#include "TableDrop/Geometry.h"

#include <algorithm>
#include <cassert>

namespace TableDrop {

static void checkRect(const Rect& r) {
  assert(r.w >= 0.f && r.h >= 0.f && "Rect with negative size");
  (void)r;
}

float OverlapArea(const Rect& a, const Rect& b) {
  checkRect(a); checkRect(b);
  float left   = std::max(a.x, b.x);
  float right  = std::min(a.x + a.w, b.x + b.w);
  float top    = std::max(a.y, b.y);
  float bottom = std::min(a.y + a.h, b.y + b.h);

  if (left < right && top < bottom) return (right - left) * (bottom - top);
  return 0.f;
}

float OverlapPercentage(const Rect& a, const Rect& b) {
  float overlap = OverlapArea(a, b);
  if (overlap <= 0.f) return 0.f; // also covers zero-area rects (no 0/0)

  float smaller = std::min(a.Area(), b.Area());
  return std::min(1.f, overlap / smaller);
}

bool HasOverlap(const Rect& a, const Rect& b) {
  return a.x < b.x + b.w && a.x + a.w > b.x &&
         a.y < b.y + b.h && a.y + a.h > b.y;
}

Rect DroppedBounds(glm::vec2 dropPoint, glm::vec2 cardSize) {
  return Rect{dropPoint.x - cardSize.x * 0.5f,
              dropPoint.y - cardSize.y * 0.5f,
              cardSize.x, cardSize.y};
}

bool IsWithinBounds(glm::vec2 p, const Rect& r, float tolerance) {
  return p.x >= r.x - tolerance && p.x <= r.x + r.w + tolerance &&
         p.y >= r.y - tolerance && p.y <= r.y + r.h + tolerance;
}

glm::vec2 Center(const Rect& r) {
  return {r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

float Distance(glm::vec2 a, glm::vec2 b) {
  return glm::distance(a, b);
}

} // namespace TableDrop
