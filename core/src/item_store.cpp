#include <tabclust_core/item_store.hpp>

namespace tabclust {

  void InMemoryItemStore::add(Item item) {
    auto [it, inserted] = index_.emplace(item.id, items_.size());
    if (inserted) {
      items_.push_back(std::move(item));
    } else {
      items_[it->second] = std::move(item);
    }
  }

  void InMemoryItemStore::add_all(std::span<const Item> items) {
    for (const auto& item : items) add(item);
  }

  void InMemoryItemStore::clear() noexcept {
    items_.clear();
    index_.clear();
  }

  std::optional<Item> InMemoryItemStore::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return items_[it->second];
  }

}  // namespace tabclust
