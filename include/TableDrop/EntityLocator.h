#pragma once
#include "ContactConfig.h"
#include "Geometry.h"
#include "TableEntity.h"

#include <optional>

namespace TableDrop {

// Best-effort rectangle for `entity` rebuilt from its position among the
// entities of the same kind in `entities`. Entities carry no screen
// geometry, so this is an approximation of the table layout, not a hit
// test against rendered pixels. Bounds only stay put while the list order
// and the per-kind counts do.
//
// Returns nullopt when the entity is no longer in the list.
std::optional<Rect> LocateEntity(const TableEntity& entity, const EntityList& entities,
                                 const ContactConfig& config = {});

// Ordinal of `entity` among entities of its own kind, or -1.
// Builds and stacks match by id; an empty id falls back to the card sequence.
// Loose cards match the first loose card with the same rank and suit.
int IndexAmongKind(const TableEntity& entity, const EntityList& entities);

} // namespace TableDrop
