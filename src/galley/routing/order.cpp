/**
 * @file order.cpp
 * @brief Effective tag computation for order items.
 */
#include "galley/routing/order.hpp"

namespace galley::routing {

const char* to_string(TagSource s) noexcept {
  switch (s) {
    case TagSource::None:     return "none";
    case TagSource::Item:     return "item";
    case TagSource::Category: return "category";
  }
  return "unknown";
}

EffectiveTags effective_tags(const OrderItem& item) {
  EffectiveTags out;
  if (!item.tags.empty()) {
    out.source = TagSource::Item;
    out.tags   = make_tag_set(item.tags, &out.rejected);
  } else if (!item.category_tags.empty()) {
    out.source = TagSource::Category;
    out.tags   = make_tag_set(item.category_tags, &out.rejected);
  }
  return out;
}

} // namespace galley::routing
