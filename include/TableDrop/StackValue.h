#pragma once
#include "Card.h"

#include <cstdint>
#include <string>

namespace TableDrop {

enum class StackMode : uint8_t {
  Set,  // every card has the same rank: the stack is worth that rank
  Sum   // mixed ranks: the stack is worth the sum of rank values
};

struct StackValue {
  StackMode mode = StackMode::Sum;
  int value = 0;
};

// Value label for a staged stack: [9,9] shows 9, [3,6] shows 9.
// This is display metadata only; it does not check the stack is a legal build.
// Precondition: `cards` is not empty.
StackValue ResolveStackValue(const CardList& cards);
int StackDisplayValue(const CardList& cards);
std::string StackLabel(const CardList& cards);

const char* StackModeName(StackMode m);

int CardSumValue(const CardList& cards);

} // namespace TableDrop
