#pragma once
#include "ContactConfig.h"
#include "Geometry.h"
#include "TableEntity.h"
#include "TableLayout.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TableDrop {

enum class Confidence : uint8_t { Low, Medium, High };

enum class Intent : uint8_t { Capture, BuildAttempt, UnclearCapture, Trail };

struct CardDistance {
  Card card;
  float distance = 0.f;
};

struct EstimatedPosition {
  Card card;
  Rect bounds;
};

// Loose cards near a drop point, split by whether they share the dropped card's rank.
struct ProximityResult {
  std::optional<Card> nearSameRank;
  std::optional<Card> nearDifferentRank;
  std::vector<CardDistance> sameRankDistances;
  std::vector<CardDistance> differentRankDistances;
  Confidence confidence = Confidence::Low;
};

struct UserIntent {
  Intent intent = Intent::Trail;
  std::optional<Card> target;
  Confidence confidence = Confidence::Low;
  std::string reason;
};

CardList FindSameRankCards(const EntityList& entities, const Card& dropped);
CardList FindDifferentRankCards(const EntityList& entities, const Card& dropped);

// Loose cards laid out left to right from the locator's loose origin,
// one card width plus a margin apart.
std::vector<EstimatedPosition> EstimateCardPositions(const EntityList& entities,
                                                     const ContactConfig& config = {});

// Uses `layout` when it holds renderer rectangles for every loose card
// (confidence High); otherwise the estimated positions (confidence Medium).
ProximityResult DetectProximity(glm::vec2 dropPoint, const EntityList& entities,
                                const Card& dropped, const IBoundsProvider& layout,
                                const ContactConfig& config = {});
ProximityResult DetectProximity(glm::vec2 dropPoint, const EntityList& entities,
                                const Card& dropped, const ContactConfig& config = {});

UserIntent DetermineUserIntent(const ProximityResult& proximity,
                               const CardList& sameRankCards,
                               const CardList& differentRankCards);

const char* IntentName(Intent i);
const char* ConfidenceName(Confidence c);

} // namespace TableDrop
