#include "TableDrop/TableEntity.h"
#include "TableDrop/StackValue.h"


namespace TableDrop {

// helper for std::visit with lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string ToString(const CardList& cards) {
  std::string s = "[";
  for (size_t i = 0; i < cards.size(); ++i) {
    if (i) s += ",";
    s += cards[i].ToString();
  }
  return s + "]";
}

EntityKind KindOf(const TableEntity& e) {
  return std::visit(overloaded{
      [](const Card&)           { return EntityKind::LooseCard; },
      [](const Build&)          { return EntityKind::Build; },
      [](const TemporaryStack&) { return EntityKind::TemporaryStack; },
    }, e);
}

const char* KindName(EntityKind k) {
  switch (k) {
  case EntityKind::Build:          return "build";
  case EntityKind::TemporaryStack: return "temporary_stack";
  default:                         return "loose_card";
  }
}

std::string EntityKey(const TableEntity& e) {
  return std::visit(overloaded{
      [](const Card& c)            { return "loose-" + c.Key(); },
      [](const Build& b)           { return b.buildId; },
      [](const TemporaryStack& t)  { return t.stackId; },
    }, e);
}

CardList EntityCards(const TableEntity& e) {
  return std::visit(overloaded{
      [](const Card& c)            { return CardList{c}; },
      [](const Build& b)           { return b.cards; },
      [](const TemporaryStack& t)  { return t.cards; },
    }, e);
}

std::string Describe(const TableEntity& e) {
  return std::visit(overloaded{
      [](const Card& c) { return c.ToString(); },
      [](const Build& b) {
        return "build " + b.buildId + " (" + std::to_string(b.value) + ") " + ToString(b.cards);
      },
      [](const TemporaryStack& t) {
        std::string label = t.cards.empty() ? "-" : StackLabel(t.cards);
        return "stack " + t.stackId + " (" + label + ") " + ToString(t.cards);
      },
    }, e);
}

} // namespace TableDrop
