#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <tabclust_core/errors.hpp>
#include <tabclust_core/models.hpp>

using json = nlohmann::json;

namespace tabclust {

  std::string placeholder_cluster_name(int sequence) {
    return fmt::format("Cluster {}", sequence);
  }

  // ============================================================================
  // JSON Serialization - Item
  // ============================================================================

  void to_json(json& j, const Item& item) { j = {{"id", item.id}, {"name", item.name}}; }

  void from_json(const json& j, Item& item) {
    j.at("id").get_to(item.id);
    j.at("name").get_to(item.name);
  }

  // ============================================================================
  // JSON Serialization - Embedding
  // ============================================================================

  void to_json(json& j, const Embedding& embedding) {
    j = {{"tab_id", embedding.item_id},
         {"vector", embedding.vector},
         {"model_name", embedding.model_name}};
  }

  void from_json(const json& j, Embedding& embedding) {
    j.at("tab_id").get_to(embedding.item_id);
    j.at("vector").get_to(embedding.vector);
    embedding.model_name = j.value("model_name", "");
  }

  // ============================================================================
  // JSON Serialization - Cluster
  // ============================================================================

  namespace {

    json metadata_to_json(const Metadata& metadata) {
      json j = json::object();
      for (const auto& [key, value] : metadata) {
        std::visit([&](const auto& v) { j[key] = v; }, value);
      }
      return j;
    }

    Metadata metadata_from_json(const json& j) {
      Metadata metadata;
      for (const auto& [key, value] : j.items()) {
        if (value.is_number_integer()) {
          metadata[key] = value.get<std::int64_t>();
        } else if (value.is_number_float()) {
          metadata[key] = value.get<double>();
        } else if (value.is_string()) {
          metadata[key] = value.get<std::string>();
        } else {
          throw std::invalid_argument(
              fmt::format("Unsupported metadata value for key '{}': {}", key, value.dump()));
        }
      }
      return metadata;
    }

  }  // namespace

  void to_json(json& j, const Cluster& cluster) {
    j = {{"id", cluster.id},
         {"name", cluster.name},
         {"tab_ids", cluster.member_ids},
         {"created_at", cluster.created_at},
         {"metadata", metadata_to_json(cluster.metadata)}};
    j["description"] = cluster.description ? json(*cluster.description) : json(nullptr);
    j["centroid_embedding"] = cluster.centroid ? json(*cluster.centroid) : json(nullptr);
  }

  void from_json(const json& j, Cluster& cluster) {
    j.at("id").get_to(cluster.id);
    j.at("name").get_to(cluster.name);
    cluster.member_ids = j.value("tab_ids", std::vector<std::string>{});
    cluster.created_at = j.value("created_at", "");

    if (j.contains("description") && !j["description"].is_null()) {
      cluster.description = j["description"].get<std::string>();
    } else {
      cluster.description.reset();
    }

    if (j.contains("centroid_embedding") && !j["centroid_embedding"].is_null()) {
      cluster.centroid = j["centroid_embedding"].get<std::vector<float>>();
    } else {
      cluster.centroid.reset();
    }

    cluster.metadata = j.contains("metadata") ? metadata_from_json(j["metadata"]) : Metadata{};
  }

  // ============================================================================
  // Request bodies
  // ============================================================================

  std::vector<Item> parse_items(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
      throw InvalidInputError("Request body is not valid JSON");
    }
    if (!j.is_array()) {
      throw InvalidInputError("Request body must be a JSON array of {id, name} records");
    }

    std::vector<Item> items;
    items.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
      const auto& record = j[i];
      if (!record.is_object() || !record.contains("id") || !record.contains("name")
          || !record["id"].is_string() || !record["name"].is_string()) {
        throw InvalidInputError(
            fmt::format("Item record {} must be an object with string 'id' and 'name'", i));
      }
      items.push_back(record.get<Item>());
    }
    return items;
  }

  std::vector<Embedding> parse_embeddings(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
      throw InvalidInputError("Embeddings must be a JSON array");
    }

    std::vector<Embedding> embeddings;
    embeddings.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
      try {
        embeddings.push_back(j[i].get<Embedding>());
      } catch (const json::exception& e) {
        throw InvalidInputError(fmt::format("Embedding record {} is malformed: {}", i, e.what()));
      }
    }
    return embeddings;
  }

}  // namespace tabclust
