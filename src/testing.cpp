#include "core/Log.h"
#include "input/DragTracker.h"
#include "TableDrop/ContactDetection.h"
#include "TableDrop/EntityLocator.h"
#include "TableDrop/Proximity.h"
#include "TableDrop/StackValue.h"
#include "TableDrop/TableLayout.h"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
using namespace TableDrop;

static Card C(Rank r, Suit s){ return Card{r,s}; }
static void Assert(bool ok, const char* what){ if(!ok){ std::cerr<<"[FAIL] "<<what<<"\n"; std::abort(); } }
static void AssertEq(int got,int want,const char* what){ if(got!=want){ std::cerr<<"[FAIL] "<<what<<" got="<<got<<" want="<<want<<"\n"; std::abort(); } }
static void AssertNear(float got,float want,const char* what){ if(std::fabs(got-want)>1e-4f){ std::cerr<<"[FAIL] "<<what<<" got="<<got<<" want="<<want<<"\n"; std::abort(); } }
static void AssertRect(const Rect& got,const Rect& want,const char* what){
  if(std::fabs(got.x-want.x)>1e-4f || std::fabs(got.y-want.y)>1e-4f ||
     std::fabs(got.w-want.w)>1e-4f || std::fabs(got.h-want.h)>1e-4f){
    std::cerr<<"[FAIL] "<<what<<" got={"<<got.x<<","<<got.y<<","<<got.w<<","<<got.h<<"}"
             <<" want={"<<want.x<<","<<want.y<<","<<want.w<<","<<want.h<<"}\n";
    std::abort();
  }
}

static Build MakeBuild(const std::string& id, int value, CardList cards){
  Build b; b.buildId=id; b.owner=0; b.value=value; b.cards=std::move(cards); return b;
}
static TemporaryStack MakeStack(const std::string& id, CardList cards){
  TemporaryStack t; t.stackId=id; t.owner=0; t.cards=std::move(cards); return t;
}

static void testGeometry() {
  Rect a{0,0,10,10}, b{5,5,10,10};
  AssertNear(OverlapArea(a,b), 25.f, "overlap area a,b");
  AssertNear(OverlapArea(b,a), 25.f, "overlap area is symmetric");
  AssertNear(OverlapPercentage(a,b), 0.25f, "overlap pct of smaller area");

  // small rect fully inside a big one is 100% regardless of the big one's size
  Rect inner{2,2,4,4}, outer{0,0,100,100};
  AssertNear(OverlapPercentage(inner,outer), 1.f, "containment is 100%");
  AssertNear(OverlapPercentage(outer,inner), 1.f, "containment is 100% either way");

  Rect far{20,20,5,5};
  AssertNear(OverlapArea(a,far), 0.f, "disjoint area");
  AssertNear(OverlapPercentage(a,far), 0.f, "disjoint pct");

  // shared edge is not an overlap
  Rect touching{10,0,10,10};
  AssertNear(OverlapArea(a,touching), 0.f, "edge contact area");
  Assert(!HasOverlap(a,touching), "edge contact is not overlap");
  Assert(HasOverlap(a,b), "HasOverlap a,b");

  Rect dot{5,5,0,0};
  AssertNear(OverlapPercentage(dot,a), 0.f, "zero-area rect gives 0, not NaN");
  Assert(!std::isnan(OverlapPercentage(dot,dot)), "0/0 guarded");

  for (const Rect& r : {a, b, inner, outer, far, touching}) {
    float p = OverlapPercentage(r, b);
    Assert(p >= 0.f && p <= 1.f, "pct within [0,1]");
  }

  AssertRect(DroppedBounds({90,100}), Rect{60,60,60,80}, "dropped bounds centred on point");
  AssertRect(DroppedBounds({0,0}, {20,40}), Rect{-10,-20,20,40}, "dropped bounds custom size");

  Assert(IsWithinBounds({-5,15}, a, 10.f), "within tolerance left of rect");
  Assert(!IsWithinBounds({-11,5}, a, 10.f), "outside tolerance");
  AssertNear(Distance({0,0},{3,4}), 5.f, "3-4-5 distance");
  AssertNear(Center(b).x, 10.f, "center x");

  Assert(a.Contains(0,0) && !a.Contains(10,5), "Contains is half-open");
}

static void testLocator() {
  Build b1 = MakeBuild("b1", 8, {C(Rank::Five,Suit::Clubs), C(Rank::Three,Suit::Hearts)});
  Build b2 = MakeBuild("b2", 10, {C(Rank::Four,Suit::Clubs), C(Rank::Six,Suit::Hearts)});
  TemporaryStack t1 = MakeStack("t1", {C(Rank::Nine,Suit::Hearts), C(Rank::Nine,Suit::Spades)});
  EntityList table = {
    C(Rank::Seven,Suit::Clubs), b1, C(Rank::Two,Suit::Spades), t1, b2, C(Rank::King,Suit::Diamonds)
  };

  // loose cards are placed by their ordinal among loose cards only
  AssertRect(*LocateEntity(table[0], table), Rect{50,100,60,80}, "loose #0");
  AssertRect(*LocateEntity(table[2], table), Rect{130,100,60,80}, "loose #1");
  AssertRect(*LocateEntity(table[5], table), Rect{210,100,60,80}, "loose #2");

  AssertRect(*LocateEntity(table[1], table), Rect{200,50,90,80}, "build #0");
  AssertRect(*LocateEntity(table[4], table), Rect{300,50,90,80}, "build #1");
  AssertRect(*LocateEntity(table[3], table), Rect{200,200,72,80}, "temp stack #0");

  AssertEq(IndexAmongKind(table[4], table), 1, "b2 is second build");

  Assert(!LocateEntity(C(Rank::Queen,Suit::Hearts), table), "missing loose card has no bounds");
  Assert(!LocateEntity(MakeBuild("gone", 5, {}), table), "removed build has no bounds");
  Assert(!LocateEntity(MakeStack("gone", {}), table), "removed stack has no bounds");

  // no id: matched by card sequence
  Build anon = MakeBuild("", 8, {C(Rank::Four,Suit::Hearts), C(Rank::Four,Suit::Spades)});
  EntityList withAnon = { b1, anon };
  AssertRect(*LocateEntity(anon, withAnon), Rect{300,50,90,80}, "id-less build found by cards");

  // duplicates resolve to the first match
  EntityList dup = { C(Rank::Two,Suit::Clubs), C(Rank::Two,Suit::Clubs) };
  AssertEq(IndexAmongKind(dup[1], dup), 0, "first matching loose card wins");

  ContactConfig scaled = ContactConfig{}.ScaledBy(2.f);
  AssertRect(*LocateEntity(table[0], table, scaled), Rect{100,200,120,160}, "locator honours scaled config");
}

static void testLayouts() {
  EntityList table = { C(Rank::Seven,Suit::Clubs), C(Rank::Two,Suit::Spades) };
  RecordedLayout layout;
  layout.Record(table[0], Rect{5,5,60,80});

  AssertRect(*layout.BoundsOf(table[0], table), Rect{5,5,60,80}, "recorded rect wins");
  AssertRect(*layout.BoundsOf(table[1], table), *LocateEntity(table[1], table), "unrecorded falls back");
  Assert(layout.IsAuthoritative(table[0]) && !layout.IsAuthoritative(table[1]), "authoritative only when recorded");

  // a stale record is ignored once the card has left the table
  EntityList afterCapture = { table[1] };
  Assert(!layout.BoundsOf(table[0], afterCapture), "recorded card no longer on table has no bounds");
  AssertRect(*layout.BoundsOf(table[1], afterCapture), Rect{50,100,60,80}, "remaining card re-estimated");

  layout.Record(MakeBuild("", 4, {}), Rect{0,0,1,1});
  AssertEq((int)layout.Size(), 1, "key-less entity not recorded");
  layout.Record(table[1], Rect{0,0,-1,5});
  AssertEq((int)layout.Size(), 1, "negative rect not recorded");

  Assert(layout.Forget(table[0]), "forget recorded");
  Assert(!layout.Forget(table[0]), "forget twice");
  AssertEq((int)layout.Size(), 0, "empty after forget");

  Assert(EntityKey(C(Rank::Ten,Suit::Hearts)) == "loose-10-H", "loose key");
  Assert(EntityKey(MakeStack("t9", {})) == "t9", "stack key");
  Assert(std::string(KindName(KindOf(MakeBuild("b", 2, {})))) == "build", "kind name");
}

// Renderer that has not drawn its builds yet.
class BuildlessLayout : public IBoundsProvider {
 public:
  std::optional<Rect> BoundsOf(const TableEntity& entity, const EntityList& entities) const override {
    if (KindOf(entity) == EntityKind::Build) return std::nullopt;
    return LocateEntity(entity, entities);
  }
};

static void testContact() {
  // Canonical locator x geometry case: drop (90,100) vs loose card #0.
  // dropped {60,60,60,80}, card {50,100,60,80}: (110-60)*(140-100)=2000 / 4800
  {
    EntityList table = { C(Rank::Seven,Suit::Clubs) };
    auto r = ResolveBestContact({90,100}, table);
    AssertRect(r.droppedBounds, Rect{60,60,60,80}, "e2e dropped bounds");
    AssertNear(r.overlapPercentage, 2000.f/4800.f, "e2e overlap");
    Assert(r.hasContact, "e2e contact");
    Assert(r.targetKind == EntityKind::LooseCard, "e2e target is loose card");
    Assert(*AsLooseCard(*r.target) == C(Rank::Seven,Suit::Clubs), "e2e target card");
    AssertRect(*r.tableBounds, Rect{50,100,60,80}, "e2e table bounds");
  }

  // empty table
  {
    auto r = ResolveBestContact({123,45}, {});
    Assert(!r.hasContact && !r.target && !r.tableBounds, "empty table has no contact");
    Assert(!r.targetKind, "no kind without contact");
    Assert(ResolveAllContacts({123,45}, {}).empty(), "empty table no contacts");
    Assert(!HasAnyContact({123,45}, {}), "empty table HasAnyContact");
  }

  // Threshold is strict: exactly 20% misses, a hair more hits.
  // card #0 {50,100,60,80}; drop (32,140) -> dropped {2,100,60,80}, 12*80 = 960 = 0.20
  {
    EntityList table = { C(Rank::Seven,Suit::Clubs) };
    auto exact = ResolveBestContact({32,140}, table);
    AssertNear(OverlapPercentage(exact.droppedBounds, Rect{50,100,60,80}), 0.20f, "exact threshold overlap");
    Assert(!exact.hasContact, "exactly 20% is not contact");
    Assert(ResolveAllContacts({32,140}, table).empty(), "exactly 20% not listed");

    Assert(HasAnyContact({32.5f,140}, table), "20%+eps is contact");
  }

  // Ties keep the first: overlaps [0.5, 0.3, 0.5]. Dropped rect is {0,0,60,80}.
  {
    EntityList table = { C(Rank::Ace,Suit::Clubs), C(Rank::Two,Suit::Clubs), C(Rank::Three,Suit::Clubs) };
    RecordedLayout layout;
    layout.Record(table[0], Rect{30,0,60,80});   // 30*80 = 0.5
    layout.Record(table[1], Rect{42,0,60,80});   // 18*80 = 0.3
    layout.Record(table[2], Rect{0,40,60,80});   // 60*40 = 0.5
    ContactResolver resolver(ContactConfig{}, layout);
    auto r = resolver.ResolveBestContact({30,40}, table);
    Assert(r.hasContact, "tie has contact");
    AssertNear(r.overlapPercentage, 0.5f, "tie overlap");
    Assert(*AsLooseCard(*r.target) == std::get<Card>(table[0]), "first of equal maxima wins");
  }

  // All contacts sorted: overlaps [0.3, 0.6, 0.45] -> [0.6, 0.45, 0.3]
  {
    EntityList table = { C(Rank::Ace,Suit::Clubs), C(Rank::Two,Suit::Clubs), C(Rank::Three,Suit::Clubs),
                         C(Rank::Four,Suit::Clubs) };
    RecordedLayout layout;
    layout.Record(table[0], Rect{42,0,60,80});   // 0.3
    layout.Record(table[1], Rect{24,0,60,80});   // 0.6
    layout.Record(table[2], Rect{33,0,60,80});   // 0.45
    layout.Record(table[3], Rect{500,0,60,80});  // nothing
    ContactResolver resolver(ContactConfig{}, layout);
    auto all = resolver.ResolveAllContacts({30,40}, table);
    AssertEq((int)all.size(), 3, "three contacts");
    Assert(std::get<Card>(all[0].entity) == std::get<Card>(table[1]), "0.6 first");
    Assert(std::get<Card>(all[1].entity) == std::get<Card>(table[2]), "0.45 second");
    Assert(std::get<Card>(all[2].entity) == std::get<Card>(table[0]), "0.3 third");
    AssertNear(all[0].overlapPercentage, 0.6f, "0.6 pct");
    AssertNear(all[2].overlapPercentage, 0.3f, "0.3 pct");
  }

  // Equal overlaps keep input order in the ranked list.
  {
    EntityList table = { C(Rank::Five,Suit::Clubs), C(Rank::Six,Suit::Clubs) };
    RecordedLayout layout;
    layout.Record(table[0], Rect{30,0,60,80});
    layout.Record(table[1], Rect{0,40,60,80});
    ContactResolver resolver(ContactConfig{}, layout);
    auto all = resolver.ResolveAllContacts({30,40}, table);
    AssertEq((int)all.size(), 2, "two equal contacts");
    Assert(std::get<Card>(all[0].entity) == std::get<Card>(table[0]), "stable order kept");
  }

  // Builds and staged stacks through the heuristic layout.
  {
    Build b8 = MakeBuild("b8", 8, {C(Rank::Five,Suit::Clubs), C(Rank::Three,Suit::Hearts)});
    TemporaryStack t = MakeStack("t1", {C(Rank::Nine,Suit::Hearts), C(Rank::Nine,Suit::Spades)});
    EntityList table = { C(Rank::Seven,Suit::Clubs), b8, t };

    auto onBuild = ResolveBestContact({245,90}, table);   // dropped {215,50,60,80} inside {200,50,90,80}
    Assert(onBuild.hasContact && *onBuild.targetKind == EntityKind::Build, "drop lands on build");
    AssertNear(onBuild.overlapPercentage, 1.f, "build fully covers dropped card");
    Assert(AsBuild(*onBuild.target)->buildId == "b8", "build id");

    auto onStack = ResolveBestContact({236,240}, table);  // dropped {206,200,60,80} inside {200,200,72,80}
    Assert(onStack.hasContact && onStack.targetKind == EntityKind::TemporaryStack, "drop lands on stack");
    Assert(AsTempStack(*onStack.target)->stackId == "t1", "stack id");

    auto none = ResolveBestContact({600,600}, table);
    Assert(!none.hasContact, "empty felt");
    Assert(!none.targetKind, "empty felt has no kind");
    AssertNear(none.overlapPercentage, 0.f, "no overlap recorded");
  }

  // Loose-card-only view drops builds/stacks but keeps ranking.
  {
    Build b = MakeBuild("b", 9, {C(Rank::Four,Suit::Clubs), C(Rank::Five,Suit::Hearts)});
    EntityList table = { b, C(Rank::Seven,Suit::Clubs) };
    RecordedLayout layout;
    layout.Record(table[0], Rect{20,0,90,80});   // 40*80/4800
    layout.Record(table[1], Rect{0,0,60,80});    // 1.0
    ContactResolver resolver(ContactConfig{}, layout);

    auto all = resolver.ResolveAllContacts({30,40}, table);
    AssertEq((int)all.size(), 2, "build and card both contact");
    auto loose = resolver.ResolveLooseContacts({30,40}, table);
    AssertEq((int)loose.size(), 1, "only the loose card remains");
    Assert(loose[0].card == C(Rank::Seven,Suit::Clubs), "loose card kept");
    AssertNear(loose[0].overlapPercentage, 1.f, "loose overlap");
  }

  // A graze below the threshold is an overlap but not a contact.
  {
    EntityList table = { C(Rank::Seven,Suit::Clubs) };   // {50,100,60,80}
    ContactResolver resolver;
    Assert(!resolver.HasAnyContact({25,140}, table), "5px graze is not contact");
    Assert(resolver.HasAnyOverlap({25,140}, table), "5px graze overlaps");
    Assert(!resolver.HasAnyOverlap({-100,140}, table), "far away does not overlap");
  }

  // Entities the layout cannot place are skipped, not guessed.
  {
    Build b8 = MakeBuild("b8", 8, {C(Rank::Five,Suit::Clubs), C(Rank::Three,Suit::Hearts)});
    EntityList table = { C(Rank::Seven,Suit::Clubs), b8 };
    BuildlessLayout layout;
    ContactResolver resolver(ContactConfig{}, layout);

    auto overBuild = resolver.ResolveBestContact({245,90}, table);
    Assert(!overBuild.hasContact && !overBuild.target && !overBuild.targetKind, "unplaced build is not a contact");
    Assert(!resolver.HasAnyOverlap({245,90}, table), "unplaced build does not overlap");

    auto overCard = resolver.ResolveBestContact({90,100}, table);
    Assert(overCard.hasContact && *overCard.targetKind == EntityKind::LooseCard, "loose card still found");
    AssertNear(overCard.overlapPercentage, 2000.f/4800.f, "loose card overlap unchanged");
    auto all = resolver.ResolveAllContacts({90,100}, table);
    AssertEq((int)all.size(), 1, "only the placed card is listed");
    Assert(std::get<Card>(all[0].entity) == C(Rank::Seven,Suit::Clubs), "listed card is 7C");
  }

  // A resolver over a recorded layout shares its config, so the dropped
  // rect and the fallback rects use the same scale.
  {
    EntityList table = { C(Rank::Seven,Suit::Clubs) };
    RecordedLayout layout(ContactConfig{}.ScaledBy(2.f));
    ContactResolver resolver(layout);
    AssertNear(resolver.Config().cardSize.x, 120.f, "resolver takes layout config");

    auto r = resolver.ResolveBestContact({160,280}, table);   // dropped {100,200,120,160}
    AssertRect(r.droppedBounds, Rect{100,200,120,160}, "dropped bounds at layout scale");
    AssertRect(*r.tableBounds, Rect{100,200,120,160}, "fallback bounds at layout scale");
    AssertNear(r.overlapPercentage, 1.f, "same scale, full overlap");
  }

  // Threshold is configuration.
  {
    EntityList table = { C(Rank::Seven,Suit::Clubs) };
    ContactConfig strict; strict.contactThreshold = 0.5f;
    Assert(!HasAnyContact({90,100}, table, strict), "41% misses a 50% threshold");
    Assert(HasAnyContact({90,100}, table), "41% hits the default threshold");
  }
}

static void testStackValue() {
  auto set = ResolveStackValue({C(Rank::Nine,Suit::Hearts), C(Rank::Nine,Suit::Spades)});
  Assert(set.mode == StackMode::Set, "9+9 is set mode");
  AssertEq(set.value, 9, "9+9 shows 9, not 18");

  auto sum = ResolveStackValue({C(Rank::Three,Suit::Hearts), C(Rank::Six,Suit::Spades)});
  Assert(sum.mode == StackMode::Sum, "3+6 is sum mode");
  AssertEq(sum.value, 9, "3+6 shows 9");

  AssertEq(StackDisplayValue({C(Rank::King,Suit::Clubs)}), 13, "single king");
  AssertEq(StackDisplayValue({C(Rank::Ace,Suit::Hearts), C(Rank::Ace,Suit::Diamonds),
                              C(Rank::Ace,Suit::Spades)}), 1, "three aces are a set of 1");
  AssertEq(StackDisplayValue({C(Rank::Two,Suit::Hearts), C(Rank::Three,Suit::Hearts),
                              C(Rank::Four,Suit::Hearts)}), 9, "2+3+4");
  Assert(StackLabel({C(Rank::Three,Suit::Hearts), C(Rank::Six,Suit::Spades)}) == "9", "label");
  AssertEq(CardSumValue({C(Rank::Jack,Suit::Hearts), C(Rank::Ace,Suit::Spades)}), 12, "J+A sum");
}

static void testProximity() {
  // loose cards estimated at x=50,130,210,290 (y=100, 60x80)
  EntityList table = { C(Rank::Ten,Suit::Hearts), C(Rank::Five,Suit::Spades),
                       C(Rank::Seven,Suit::Clubs), C(Rank::Ten,Suit::Diamonds) };
  const Card dropped = C(Rank::Ten,Suit::Clubs);
  auto same = FindSameRankCards(table, dropped);
  auto diff = FindDifferentRankCards(table, dropped);
  AssertEq((int)same.size(), 2, "two tens on table");
  AssertEq((int)diff.size(), 2, "two other ranks");

  auto est = EstimateCardPositions(table);
  AssertEq((int)est.size(), 4, "every loose card estimated");
  AssertRect(est[3].bounds, Rect{290,100,60,80}, "fourth estimate");

  // on the 10H centre: 5S is also in range but further away
  {
    auto p = DetectProximity({80,140}, table, dropped);
    Assert(p.nearSameRank && *p.nearSameRank == std::get<Card>(table[0]), "near 10H");
    Assert(p.nearDifferentRank && *p.nearDifferentRank == std::get<Card>(table[1]), "near 5S");
    Assert(p.confidence == Confidence::Medium, "estimates are medium confidence");
    auto intent = DetermineUserIntent(p, same, diff);
    Assert(intent.intent == Intent::Capture, "clearly closer to the ten");
    Assert(*intent.target == std::get<Card>(table[0]), "capture target 10H");
    Assert(intent.confidence == Confidence::Medium, "capture confidence");
  }

  // on the 5S centre
  {
    auto p = DetectProximity({160,140}, table, dropped);
    auto intent = DetermineUserIntent(p, same, diff);
    Assert(intent.intent == Intent::BuildAttempt, "clearly closer to the five");
    Assert(*intent.target == std::get<Card>(table[1]), "build target 5S");
  }

  // nowhere near anything
  {
    auto p = DetectProximity({1000,1000}, table, dropped);
    Assert(!p.nearSameRank && !p.nearDifferentRank, "nothing near");
    auto intent = DetermineUserIntent(p, same, diff);
    Assert(intent.intent == Intent::UnclearCapture, "tens exist but not near");
    Assert(*intent.target == same.front(), "first ten suggested");
    Assert(intent.confidence == Confidence::Low, "low confidence guess");

    CardList crowded = diff;
    crowded.push_back(C(Rank::Two,Suit::Clubs));
    crowded.push_back(C(Rank::Three,Suit::Clubs));
    auto trail = DetermineUserIntent(p, same, crowded);
    Assert(trail.intent == Intent::Trail && !trail.target, "crowded table trails");
    Assert(trail.confidence == Confidence::Medium, "crowded trail confidence");

    auto plain = DetermineUserIntent(p, {}, diff);
    Assert(plain.intent == Intent::Trail, "no same rank, nothing near: trail");
    Assert(plain.confidence == p.confidence, "trail keeps detection confidence");
  }

  // similar distances are ambiguous
  {
    const Card ten = std::get<Card>(table[0]), five = std::get<Card>(table[1]);
    ProximityResult p;
    p.confidence = Confidence::High;
    p.nearSameRank = ten;
    p.nearDifferentRank = five;
    p.sameRankDistances = {{ten, 30.f}};
    p.differentRankDistances = {{five, 35.f}};
    auto intent = DetermineUserIntent(p, same, diff);
    Assert(intent.intent == Intent::UnclearCapture, "ambiguous leans capture");
    Assert(intent.confidence == Confidence::Low, "ambiguous is low confidence");

    p.sameRankDistances = {{ten, 10.f}};
    Assert(DetermineUserIntent(p, same, diff).confidence == Confidence::High, "high stays high");
  }

  // renderer rectangles for every loose card raise confidence
  {
    RecordedLayout layout;
    for (size_t i = 0; i < table.size(); ++i)
      layout.Record(table[i], Rect{(float)i * 100.f, 0, 60, 80});
    auto p = DetectProximity({30,40}, table, dropped, layout);
    Assert(p.confidence == Confidence::High, "recorded layout is high confidence");
    Assert(p.nearSameRank && *p.nearSameRank == std::get<Card>(table[0]), "recorded 10H is nearest");

    layout.Forget(table[3]);
    auto partial = DetectProximity({30,40}, table, dropped, layout);
    Assert(partial.confidence == Confidence::Medium, "partial recording falls back to estimates");
  }
}

static void testDrag() {
  DragTracker drag({0.f, 120.f});
  Assert(!drag.OnTouch({1, 5, 5, 0, 0, 1, TouchPhase::Ended}), "stray Ended ignored");
  Assert(!drag.IsDragging(), "not dragging yet");

  Assert(!drag.OnTouch({1, 10, 200, 0, 0, 1, TouchPhase::Began}), "began");
  Assert(drag.IsDragging(), "dragging");
  Assert(!drag.OnTouch({1, 20, 220, 0, 0, 1, TouchPhase::Moved}), "moved");
  Assert(!drag.OnTouch({2, 99, 99, 0, 0, 1, TouchPhase::Ended}), "other finger ignored");
  Assert(drag.IsDragging(), "still dragging after other finger");
  AssertNear(drag.TablePosition().y, 100.f, "table position follows finger");

  auto drop = drag.OnTouch({1, 30, 240, 0, 0, 1, TouchPhase::Ended});
  Assert(drop.has_value(), "drop reported");
  AssertNear(drop->tablePos.x, 30.f, "drop table x");
  AssertNear(drop->tablePos.y, 120.f, "drop table y");
  AssertNear(drop->windowPos.y, 240.f, "drop window y");
  Assert(!drag.IsDragging(), "drag finished");

  drag.OnTouch(MouseTouch(10, 10, TouchPhase::Began));
  Assert(!drag.OnTouch(MouseTouch(10, 10, TouchPhase::Cancelled)), "cancel gives no drop");
  Assert(!drag.IsDragging(), "cancel ends drag");
}

static void testConfig() {
  ContactConfig c;
  Assert(c.Validate(), "defaults valid");
  AssertNear(c.cardSize.x, 60.f, "default card width");
  AssertNear(c.contactThreshold, 0.2f, "default threshold");

  ContactConfig bad = c; bad.contactThreshold = 1.f;
  Assert(!bad.Validate(), "threshold 1 rejected");
  bad = c; bad.cardSize = {0.f, 80.f};
  Assert(!bad.Validate(), "zero width rejected");

  ContactConfig hi = c.ScaledBy(2.f);
  AssertNear(hi.cardSize.y, 160.f, "scaled card height");
  AssertNear(hi.locator.buildSpacing, 200.f, "scaled build spacing");
  AssertNear(hi.contactThreshold, 0.2f, "threshold is not a length");
  AssertNear(c.ScaledBy(0.f).cardSize.x, 60.f, "bad dpr ignored");
}

static void testLog() {
  // a later Init still applies its level
  Log::Init(spdlog::level::err);
  Assert(Log::GetCoreLogger()->level() == spdlog::level::err, "re-init sets core level");
  Assert(Log::GetClientLogger()->level() == spdlog::level::err, "re-init sets client level");

  Log::SetLevel(spdlog::level::critical);
  Assert(Log::GetCoreLogger()->level() == spdlog::level::critical, "SetLevel core");
  Assert(Log::GetClientLogger()->level() == spdlog::level::critical, "SetLevel client");
}

int main() {
  Log::Init(spdlog::level::critical);

  testLog();
  testGeometry();
  testLocator();
  testLayouts();
  testContact();
  testStackValue();
  testProximity();
  testDrag();
  testConfig();

  std::cout << "All contact tests passed.\n";
  return 0;
}
