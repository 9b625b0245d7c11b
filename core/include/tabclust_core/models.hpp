#pragma once
#include <cstdint>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabclust {

  // A titled item (browser tab) as supplied by the caller
  struct Item {
    std::string id;
    std::string name;

    bool operator==(const Item&) const = default;
  };

  // One embedding vector per item id
  struct Embedding {
    std::string item_id;
    std::vector<float> vector;
    std::string model_name;
  };

  // Provenance values recorded on a cluster (method, parent_cluster, size, created_at, ...)
  using MetadataValue = std::variant<std::int64_t, double, std::string>;
  using Metadata = std::map<std::string, MetadataValue>;

  struct Cluster {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> member_ids;
    std::optional<std::vector<float>> centroid;
    std::string created_at;
    Metadata metadata;

    [[nodiscard]] std::size_t size() const noexcept { return member_ids.size(); }

    // Typed metadata access; std::nullopt when the key is absent or holds another type
    template <typename T> [[nodiscard]] std::optional<T> meta(const std::string& key) const {
      auto it = metadata.find(key);
      if (it == metadata.end()) return std::nullopt;
      if (const auto* value = std::get_if<T>(&it->second)) return *value;
      return std::nullopt;
    }
  };

  // Placeholder display name used until a namer supplies a real one
  [[nodiscard]] std::string placeholder_cluster_name(int sequence);

  void to_json(nlohmann::json& j, const Item& item);
  void from_json(const nlohmann::json& j, Item& item);

  void to_json(nlohmann::json& j, const Embedding& embedding);
  void from_json(const nlohmann::json& j, Embedding& embedding);

  void to_json(nlohmann::json& j, const Cluster& cluster);
  void from_json(const nlohmann::json& j, Cluster& cluster);

  // Parse a request body of the form [{"id": ..., "name": ...}, ...]
  [[nodiscard]] std::vector<Item> parse_items(const std::string& json_str);

  [[nodiscard]] std::vector<Embedding> parse_embeddings(const std::string& json_str);

}  // namespace tabclust
