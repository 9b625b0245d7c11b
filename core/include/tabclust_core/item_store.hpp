#pragma once
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "models.hpp"

namespace tabclust {

  // Item lookup by id
  class IItemStore {
  public:
    virtual ~IItemStore() = default;

    IItemStore(const IItemStore&) = delete;
    IItemStore& operator=(const IItemStore&) = delete;
    IItemStore(IItemStore&&) = delete;
    IItemStore& operator=(IItemStore&&) = delete;

    [[nodiscard]] virtual std::optional<Item> find(const std::string& id) const = 0;

  protected:
    IItemStore() = default;
  };

  // Items held in memory, iterated in insertion order. Not synchronized.
  class InMemoryItemStore : public IItemStore {
  public:
    InMemoryItemStore() = default;

    // Inserts or replaces the item with the same id
    void add(Item item);
    void add_all(std::span<const Item> items);
    void clear() noexcept;

    [[nodiscard]] std::optional<Item> find(const std::string& id) const override;
    [[nodiscard]] const std::vector<Item>& all() const noexcept { return items_; }
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }

  private:
    std::vector<Item> items_;
    std::unordered_map<std::string, size_t> index_;
  };

}  // namespace tabclust
