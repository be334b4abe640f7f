#pragma once
#include <glm/glm.hpp>

namespace TableDrop {

// Axis-aligned rectangle in table-local units, origin top-left.
struct Rect {
  float x = 0.f, y = 0.f, w = 0.f, h = 0.f;

  float Area() const { return w * h; }
  bool Contains(float px, float py) const {
    return px >= x && px < x + w && py >= y && py < y + h;
  }
  bool operator==(const Rect& o) const { return x==o.x && y==o.y && w==o.w && h==o.h; }
  bool operator!=(const Rect& o) const { return !(*this==o); }
};

float OverlapArea(const Rect& a, const Rect& b);

// Overlap as a fraction of the smaller of the two areas; 0 when nothing overlaps.
float OverlapPercentage(const Rect& a, const Rect& b);

// Strict test: touching edges do not overlap.
bool HasOverlap(const Rect& a, const Rect& b);

// Rectangle of `cardSize` centred on the drop point.
Rect DroppedBounds(glm::vec2 dropPoint, glm::vec2 cardSize = {60.f, 80.f});

// Inclusive test against `r` grown by `tolerance` on every side.
bool IsWithinBounds(glm::vec2 p, const Rect& r, float tolerance);

glm::vec2 Center(const Rect& r);
float Distance(glm::vec2 a, glm::vec2 b);

} // namespace TableDrop
