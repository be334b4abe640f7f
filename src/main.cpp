#include "core/Log.h"
#include "input/DragTracker.h"
#include "TableDrop/ContactDetection.h"
#include "TableDrop/Proximity.h"
#include "TableDrop/StackValue.h"
#include "TableDrop/TableLayout.h"

#include <vector>

using namespace TableDrop;

static Card C(Rank r, Suit s){ return Card{r,s}; }

// Table as the game controller would hand it over mid-round.
static EntityList sampleTable() {
  Build b8;
  b8.buildId = "build-1";
  b8.owner = 0;
  b8.value = 8;
  b8.cards = { C(Rank::Five,Suit::Clubs), C(Rank::Three,Suit::Diamonds) };
  b8.isExtendable = true;

  TemporaryStack staged;
  staged.stackId = "temp-1";
  staged.owner = 1;
  staged.cards = { C(Rank::Nine,Suit::Hearts), C(Rank::Nine,Suit::Spades) };

  return {
    C(Rank::Seven,Suit::Clubs),
    C(Rank::Two,Suit::Spades),
    b8,
    C(Rank::Ten,Suit::Diamonds),
    staged,
  };
}

static void report(const char* what, glm::vec2 drop, const EntityList& table,
                   const ContactResolver& resolver, const Card& dragged,
                   const IBoundsProvider& layout) {
  TD_INFO("--- {}: {} dropped at ({:.0f}, {:.0f})", what, dragged.ToString(), drop.x, drop.y);

  auto best = resolver.ResolveBestContact(drop, table);
  if (best.hasContact) {
    TD_INFO("best contact: {} [{}] {:.0f}%", Describe(*best.target),
            KindName(*best.targetKind), best.overlapPercentage * 100.f);
  } else {
    TD_INFO("best contact: none{}", resolver.HasAnyOverlap(drop, table) ? " (grazed an entity)" : "");
  }

  for (const auto& c : resolver.ResolveAllContacts(drop, table))
    TD_INFO("  contact {} [{}] {:.0f}%", Describe(c.entity), KindName(c.kind), c.overlapPercentage * 100.f);

  for (const auto& c : resolver.ResolveLooseContacts(drop, table))
    TD_INFO("  loose {} {:.0f}%", c.card.ToString(), c.overlapPercentage * 100.f);

  auto same = FindSameRankCards(table, dragged);
  auto diff = FindDifferentRankCards(table, dragged);
  auto prox = DetectProximity(drop, table, dragged, layout, resolver.Config());
  auto intent = DetermineUserIntent(prox, same, diff);
  TD_INFO("intent: {} -> {} ({}, {})", IntentName(intent.intent),
          intent.target ? intent.target->ToString() : "-", ConfidenceName(intent.confidence),
          intent.reason);
}

int main() {
  Log::Init();
  TD_INFO("TableDrop sandbox");

  ContactConfig config;
  config.contactThreshold = 0.20f;
  if (!config.Validate()) return 1;

  EntityList table = sampleTable();
  for (const auto& e : table) {
    TD_INFO("table: {}", Describe(e));
    if (const TemporaryStack* t = AsTempStack(e)) {
      auto v = ResolveStackValue(t->cards);
      TD_INFO("  staged value {} ({} mode)", v.value, StackModeName(v.mode));
    }
  }

  // Heuristic layout only
  ContactResolver resolver(config);
  HeuristicLayout heuristic(config);

  // Replay a drag that starts in the hand and lifts over the 7C.
  DragTracker drag({0.f, 120.f});
  std::vector<TouchPoint> gesture = {
    {1, 200.f, 700.f, 0.f, 0.f, 1.f, TouchPhase::Began},
    {1, 150.f, 500.f, 0.f, 0.f, 1.f, TouchPhase::Moved},
    {1,  85.f, 262.f, 0.f, 0.f, 1.f, TouchPhase::Moved},
    {1,  84.f, 260.f, 0.f, 0.f, 1.f, TouchPhase::Ended},
  };
  const Card dragged = C(Rank::Seven,Suit::Hearts);
  for (const auto& p : gesture) {
    if (auto drop = drag.OnTouch(p))
      report("touch drag", drop->tablePos, table, resolver, dragged, heuristic);
  }

  report("onto build", {240.f, 90.f}, table, resolver, C(Rank::Eight,Suit::Hearts), heuristic);
  report("onto staged stack", {235.f, 235.f}, table, resolver, C(Rank::Nine,Suit::Clubs), heuristic);
  report("empty felt", {400.f, 400.f}, table, resolver, C(Rank::King,Suit::Clubs), heuristic);

  // Same drop once the renderer has recorded where it actually drew things.
  RecordedLayout recorded(config);
  recorded.Record(table[0], Rect{10.f, 20.f, config.cardSize.x, config.cardSize.y});
  recorded.Record(table[1], Rect{80.f, 20.f, config.cardSize.x, config.cardSize.y});
  recorded.Record(table[3], Rect{150.f, 20.f, config.cardSize.x, config.cardSize.y});
  ContactResolver rendered(recorded);
  report("recorded layout", {45.f, 60.f}, table, rendered, C(Rank::Seven,Suit::Hearts), recorded);

  return 0;
}
