#include "TableDrop/Proximity.h"
#include "core/Log.h"

#include <limits>

namespace TableDrop {

// Same-rank card must be this much closer than the different-rank one to
// count as a clear capture, and this much further to count as a build.
static constexpr float kCaptureRatio = 0.7f;
static constexpr float kBuildRatio   = 1.5f;
// Tables this crowded need an explicit target before a capture is guessed.
static constexpr size_t kCrowdedTable = 3;

namespace {

struct Closest {
  std::optional<Card> card;
  float distance = std::numeric_limits<float>::infinity();

  void Offer(const Card& c, float d) {
    if (d < distance) { card = c; distance = d; }
  }
};

float distanceOf(const std::vector<CardDistance>& list, const Card& card) {
  for (const auto& d : list)
    if (d.card == card) return d.distance;
  return std::numeric_limits<float>::infinity();
}

} // namespace

CardList FindSameRankCards(const EntityList& entities, const Card& dropped) {
  CardList out;
  for (const auto& e : entities) {
    const Card* c = AsLooseCard(e);
    if (c && RankValue(c->rank) == RankValue(dropped.rank)) out.push_back(*c);
  }
  return out;
}

CardList FindDifferentRankCards(const EntityList& entities, const Card& dropped) {
  CardList out;
  for (const auto& e : entities) {
    const Card* c = AsLooseCard(e);
    if (c && RankValue(c->rank) != RankValue(dropped.rank)) out.push_back(*c);
  }
  return out;
}

std::vector<EstimatedPosition> EstimateCardPositions(const EntityList& entities,
                                                     const ContactConfig& config) {
  std::vector<EstimatedPosition> out;
  float x = config.locator.looseOrigin.x;
  for (const auto& e : entities) {
    const Card* c = AsLooseCard(e);
    if (!c) continue;
    out.push_back({*c, Rect{x, config.locator.looseOrigin.y, config.cardSize.x, config.cardSize.y}});
    x += config.cardSize.x + config.estimateMargin;
  }
  return out;
}

static ProximityResult analyse(glm::vec2 dropPoint, const std::vector<EstimatedPosition>& positions,
                               const Card& dropped, float tolerance, Confidence confidence) {
  ProximityResult result;
  result.confidence = confidence;
  Closest same, different;

  for (const auto& pos : positions) {
    if (!IsWithinBounds(dropPoint, pos.bounds, tolerance)) continue;
    float d = Distance(dropPoint, Center(pos.bounds));

    if (RankValue(pos.card.rank) == RankValue(dropped.rank)) {
      result.sameRankDistances.push_back({pos.card, d});
      same.Offer(pos.card, d);
    } else {
      result.differentRankDistances.push_back({pos.card, d});
      different.Offer(pos.card, d);
    }
  }

  result.nearSameRank = same.card;
  result.nearDifferentRank = different.card;
  return result;
}

ProximityResult DetectProximity(glm::vec2 dropPoint, const EntityList& entities,
                                const Card& dropped, const IBoundsProvider& layout,
                                const ContactConfig& config) {
  // Renderer rectangles only count if every loose card has one.
  std::vector<EstimatedPosition> recorded;
  bool allRecorded = true;
  for (const auto& e : entities) {
    const Card* c = AsLooseCard(e);
    if (!c) continue;
    auto bounds = layout.IsAuthoritative(e) ? layout.BoundsOf(e, entities) : std::nullopt;
    if (!bounds) { allRecorded = false; break; }
    recorded.push_back({*c, *bounds});
  }

  if (allRecorded && !recorded.empty())
    return analyse(dropPoint, recorded, dropped, config.recordedTolerance, Confidence::High);

  TD_CORE_TRACE("proximity: using estimated positions for {}", dropped.ToString());
  return analyse(dropPoint, EstimateCardPositions(entities, config), dropped,
                 config.proximityTolerance, Confidence::Medium);
}

ProximityResult DetectProximity(glm::vec2 dropPoint, const EntityList& entities,
                                const Card& dropped, const ContactConfig& config) {
  return analyse(dropPoint, EstimateCardPositions(entities, config), dropped,
                 config.proximityTolerance, Confidence::Medium);
}

UserIntent DetermineUserIntent(const ProximityResult& proximity,
                               const CardList& sameRankCards,
                               const CardList& differentRankCards) {
  const auto& same = proximity.nearSameRank;
  const auto& different = proximity.nearDifferentRank;

  if (same && !different)
    return {Intent::Capture, same, proximity.confidence, "near same-rank card only"};

  if (different && !same)
    return {Intent::BuildAttempt, different, proximity.confidence, "near different-rank card only"};

  if (same && different) {
    float sameDist = distanceOf(proximity.sameRankDistances, *same);
    float diffDist = distanceOf(proximity.differentRankDistances, *different);
    float ratio = sameDist / diffDist;
    Confidence bumped = proximity.confidence == Confidence::High ? Confidence::High
                                                                 : Confidence::Medium;

    if (ratio < kCaptureRatio)
      return {Intent::Capture, same, bumped, "significantly closer to same-rank card"};
    if (ratio > kBuildRatio)
      return {Intent::BuildAttempt, different, bumped, "significantly closer to different-rank card"};
    return {Intent::UnclearCapture, same, Confidence::Low,
            "similar distances to both card types"};
  }

  if (!sameRankCards.empty()) {
    if (differentRankCards.size() > kCrowdedTable)
      return {Intent::Trail, std::nullopt, Confidence::Medium,
              "crowded table, explicit target required"};
    return {Intent::UnclearCapture, sameRankCards.front(), Confidence::Low,
            "same-rank cards on table but none near the drop"};
  }

  return {Intent::Trail, std::nullopt, proximity.confidence, "no nearby cards"};
}

const char* IntentName(Intent i) {
  switch (i) {
  case Intent::Capture:        return "capture";
  case Intent::BuildAttempt:   return "build_attempt";
  case Intent::UnclearCapture: return "unclear_capture";
  default:                     return "trail";
  }
}

const char* ConfidenceName(Confidence c) {
  switch (c) {
  case Confidence::High:   return "high";
  case Confidence::Medium: return "medium";
  default:                 return "low";
  }
}

} // namespace TableDrop
