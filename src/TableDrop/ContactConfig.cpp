#include "TableDrop/ContactConfig.h"
#include "core/Log.h"

namespace TableDrop {

ContactConfig ContactConfig::ScaledBy(float dpr) const {
  ContactConfig c = *this;
  if (dpr <= 0.f) {
    TD_CORE_WARN("ContactConfig::ScaledBy ignoring dpr={}", dpr);
    return c;
  }
  c.cardSize *= dpr;

  c.locator.looseOrigin  *= dpr;
  c.locator.looseSpacing *= dpr;
  c.locator.buildOrigin  *= dpr;
  c.locator.buildSpacing *= dpr;
  c.locator.stackOrigin  *= dpr;
  c.locator.stackSpacing *= dpr;

  c.proximityTolerance *= dpr;
  c.recordedTolerance  *= dpr;
  c.estimateMargin     *= dpr;
  return c;
}

bool ContactConfig::Validate() const {
  if (cardSize.x <= 0.f || cardSize.y <= 0.f) {
    TD_CORE_ERROR("ContactConfig: card size must be positive, got {}x{}", cardSize.x, cardSize.y);
    return false;
  }
  if (contactThreshold < 0.f || contactThreshold >= 1.f) {
    TD_CORE_ERROR("ContactConfig: contact threshold {} outside [0,1)", contactThreshold);
    return false;
  }
  if (locator.buildWidthFactor <= 0.f || locator.stackWidthFactor <= 0.f) {
    TD_CORE_ERROR("ContactConfig: locator width factors must be positive");
    return false;
  }
  if (proximityTolerance < 0.f || recordedTolerance < 0.f) {
    TD_CORE_ERROR("ContactConfig: proximity tolerances must not be negative");
    return false;
  }
  return true;
}

} // namespace TableDrop
