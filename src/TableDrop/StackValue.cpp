#include "TableDrop/StackValue.h"

#include <algorithm>
#include <cassert>

namespace TableDrop {

int CardSumValue(const CardList& cards) {
  int s=0; for (auto& c: cards) s += RankValue(c.rank); return s;
}

StackValue ResolveStackValue(const CardList& cards) {
  assert(!cards.empty() && "stack value of an empty stack");

  const Rank first = cards.front().rank;
  bool sameRank = std::all_of(cards.begin(), cards.end(),
                              [first](const Card& c) { return c.rank == first; });
  if (sameRank) return StackValue{StackMode::Set, RankValue(first)};
  return StackValue{StackMode::Sum, CardSumValue(cards)};
}

int StackDisplayValue(const CardList& cards) {
  return ResolveStackValue(cards).value;
}

std::string StackLabel(const CardList& cards) {
  return std::to_string(StackDisplayValue(cards));
}

const char* StackModeName(StackMode m) {
  return m == StackMode::Set ? "set" : "sum";
}

} // namespace TableDrop
