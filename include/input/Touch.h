#pragma once

#include <cstdint>

enum class TouchPhase : uint8_t { Began, Moved, Stationary, Ended, Cancelled };

struct TouchPoint {
  std::int64_t id = 0; // platform finger id
  float x = 0.f, y = 0.f;   // logical window coordinates
  float dx = 0.f, dy = 0.f; // optional deltas
  float pressure = 1.f;     // 0..1 if available
  TouchPhase phase = TouchPhase::Began;
};

// Mouse drags reuse the touch path under a reserved finger id.
constexpr std::int64_t kMouseFingerId = -1;

inline TouchPoint MouseTouch(float x, float y, TouchPhase phase) {
  TouchPoint p;
  p.id = kMouseFingerId;
  p.x = x; p.y = y;
  p.phase = phase;
  return p;
}
