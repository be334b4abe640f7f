#pragma once
#include <glm/glm.hpp>

namespace TableDrop {

// Where the locator assumes each kind of entity sits when no renderer
// has recorded a rectangle for it.
struct LocatorLayout {
  glm::vec2 looseOrigin{50.f, 100.f};
  float     looseSpacing = 80.f;

  glm::vec2 buildOrigin{200.f, 50.f};
  float     buildSpacing = 100.f;
  float     buildWidthFactor = 1.5f;   // x card width

  glm::vec2 stackOrigin{200.f, 200.f};
  float     stackSpacing = 120.f;
  float     stackWidthFactor = 1.2f;   // x card width
};

struct ContactConfig {
  glm::vec2 cardSize{60.f, 80.f};

  // Overlap (fraction of the smaller rect) that must be exceeded to count as contact.
  float contactThreshold = 0.20f;

  LocatorLayout locator;

  // Proximity analysis: how far outside a card a drop still counts as "near".
  float proximityTolerance = 100.f;    // estimated positions
  float recordedTolerance  = 80.f;     // renderer-recorded rectangles
  float estimateMargin     = 20.f;     // gap between estimated loose cards

  // Copy with every length multiplied by a device-pixel ratio.
  ContactConfig ScaledBy(float dpr) const;

  // Logs and returns false for a non-positive card size or a threshold outside [0,1).
  bool Validate() const;
};

} // namespace TableDrop
