#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <cstring>
#include <fstream>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>
#include <tabclust_core/result.hpp>
#include <unordered_set>

using json = nlohmann::json;

namespace tabclust {

  // ============================================================================
  // JSON Serialization - ClusteringMetrics
  // ============================================================================

  void to_json(json& j, const ClusteringMetrics& m) {
    j = {{"n_samples", m.n_samples},         {"n_noise", m.n_noise},
         {"n_reassigned", m.n_reassigned},   {"n_unclustered", m.n_unclustered},
         {"method", m.method},               {"n_splits", m.n_splits},
         {"cluster_sizes", m.cluster_sizes}};
    if (m.fallback_k) j["fallback_k"] = *m.fallback_k;
  }

  void from_json(const json& j, ClusteringMetrics& m) {
    m.n_samples = j.value("n_samples", 0);
    m.n_noise = j.value("n_noise", 0);
    m.n_reassigned = j.value("n_reassigned", 0);
    m.n_unclustered = j.value("n_unclustered", 0);
    m.method = j.value("method", METHOD_NONE);
    m.n_splits = j.value("n_splits", 0);
    m.cluster_sizes = j.value("cluster_sizes", std::vector<int>{});
    if (j.contains("fallback_k") && !j["fallback_k"].is_null()) {
      m.fallback_k = j["fallback_k"].get<int>();
    } else {
      m.fallback_k.reset();
    }
  }

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  ClusteringResult ClusteringResult::from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open result file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  ClusteringResult ClusteringResult::from_json_string(const std::string& json_str) {
    json j = json::parse(json_str);

    ClusteringResult result;
    result.version = j.value("version", RESULT_FORMAT_VERSION);
    result.created_at = j.value("created_at", "");

    result.clusters = j.at("clusters").get<std::vector<Cluster>>();
    result.unclustered_ids = j.value("unclustered_ids", std::vector<std::string>{});

    if (j.contains("config")) {
      result.config = j.at("config").get<ClusteringConfig>();
    }
    if (j.contains("metrics")) {
      result.metrics = j.at("metrics").get<ClusteringMetrics>();
    }

    return result;
  }

  std::string ClusteringResult::to_json_string() const {
    json j;

    j["version"] = version;
    j["created_at"] = created_at;

    j["clusters"] = clusters;
    j["unclustered_ids"] = unclustered_ids;

    j["config"] = config;
    j["metrics"] = metrics;

    return j.dump(2);
  }

  void ClusteringResult::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open result file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // MessagePack Serialization
  // ============================================================================

  namespace {

    using ObjectMap = std::map<std::string, msgpack::object>;

    class MappedFile {
    public:
      explicit MappedFile(const std::string& path) {
        fd_ = open(path.c_str(), O_RDONLY);
        if (fd_ == -1) {
          throw std::runtime_error(fmt::format("Failed to open msgpack file: {}", path));
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1) {
          close(fd_);
          throw std::runtime_error(fmt::format("Failed to stat msgpack file: {}", path));
        }
        size_ = static_cast<size_t>(sb.st_size);
        if (size_ == 0) return;

        data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (data_ == MAP_FAILED) {
          close(fd_);
          throw std::runtime_error(fmt::format("Failed to mmap msgpack file: {}", path));
        }
      }

      ~MappedFile() {
        if (data_ != nullptr) munmap(data_, size_);
        close(fd_);
      }

      MappedFile(const MappedFile&) = delete;
      MappedFile& operator=(const MappedFile&) = delete;

      [[nodiscard]] std::string contents() const {
        return data_ == nullptr ? std::string() : std::string(static_cast<const char*>(data_), size_);
      }

    private:
      int fd_ = -1;
      void* data_ = nullptr;
      size_t size_ = 0;
    };

    template <typename T> T get_or(const ObjectMap& map, const std::string& key, T fallback) {
      auto it = map.find(key);
      return it == map.end() || it->second.is_nil() ? fallback : it->second.as<T>();
    }

    void pack_floats(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<float>& values) {
      auto data_size = static_cast<uint32_t>(values.size() * sizeof(float));
      pk.pack_bin(data_size);
      pk.pack_bin_body(reinterpret_cast<const char*>(values.data()), data_size);
    }

    std::vector<float> unpack_floats(const msgpack::object& obj) {
      std::string bytes = obj.as<std::string>();
      if (bytes.size() % sizeof(float) != 0) {
        throw std::invalid_argument(fmt::format("centroid_embedding size {} is not a multiple of {}",
                                                bytes.size(), sizeof(float)));
      }
      std::vector<float> values(bytes.size() / sizeof(float));
      std::memcpy(values.data(), bytes.data(), bytes.size());
      return values;
    }

    void pack_metadata(msgpack::packer<msgpack::sbuffer>& pk, const Metadata& metadata) {
      pk.pack_map(static_cast<uint32_t>(metadata.size()));
      for (const auto& [key, value] : metadata) {
        pk.pack(key);
        std::visit([&](const auto& v) { pk.pack(v); }, value);
      }
    }

    Metadata unpack_metadata(const msgpack::object& obj) {
      Metadata metadata;
      for (const auto& [key, value] : obj.as<ObjectMap>()) {
        switch (value.type) {
          case msgpack::type::POSITIVE_INTEGER:
          case msgpack::type::NEGATIVE_INTEGER:
            metadata[key] = value.as<std::int64_t>();
            break;
          case msgpack::type::FLOAT32:
          case msgpack::type::FLOAT64:
            metadata[key] = value.as<double>();
            break;
          case msgpack::type::STR:
            metadata[key] = value.as<std::string>();
            break;
          default:
            throw std::invalid_argument(
                fmt::format("Unsupported metadata value for key '{}'", key));
        }
      }
      return metadata;
    }

    void pack_cluster(msgpack::packer<msgpack::sbuffer>& pk, const Cluster& cluster) {
      pk.pack_map(7);
      pk.pack("id");
      pk.pack(cluster.id);
      pk.pack("name");
      pk.pack(cluster.name);
      pk.pack("description");
      if (cluster.description) {
        pk.pack(*cluster.description);
      } else {
        pk.pack_nil();
      }
      pk.pack("tab_ids");
      pk.pack(cluster.member_ids);
      pk.pack("centroid_embedding");
      if (cluster.centroid) {
        pack_floats(pk, *cluster.centroid);
      } else {
        pk.pack_nil();
      }
      pk.pack("created_at");
      pk.pack(cluster.created_at);
      pk.pack("metadata");
      pack_metadata(pk, cluster.metadata);
    }

    Cluster unpack_cluster(const msgpack::object& obj) {
      auto map = obj.as<ObjectMap>();

      Cluster cluster;
      cluster.id = map.at("id").as<std::string>();
      cluster.name = map.at("name").as<std::string>();
      cluster.member_ids = get_or(map, "tab_ids", std::vector<std::string>{});
      cluster.created_at = get_or(map, "created_at", std::string());

      if (map.contains("description") && !map.at("description").is_nil()) {
        cluster.description = map.at("description").as<std::string>();
      }
      if (map.contains("centroid_embedding") && !map.at("centroid_embedding").is_nil()) {
        cluster.centroid = unpack_floats(map.at("centroid_embedding"));
      }
      if (map.contains("metadata")) {
        cluster.metadata = unpack_metadata(map.at("metadata"));
      }
      return cluster;
    }

    void pack_config(msgpack::packer<msgpack::sbuffer>& pk, const ClusteringConfig& c) {
      pk.pack_map(11);
      pk.pack("min_cluster_size");
      pk.pack(c.min_cluster_size);
      pk.pack("min_samples");
      pk.pack(c.min_samples);
      pk.pack("cluster_selection_epsilon");
      pk.pack(c.cluster_selection_epsilon);
      pk.pack("max_cluster_size");
      pk.pack(c.max_cluster_size);
      pk.pack("noise_similarity_threshold");
      pk.pack(c.noise_similarity_threshold);
      pk.pack("fallback_cluster_counts");
      pk.pack(c.fallback_cluster_counts);
      pk.pack("fallback_min_group_size");
      pk.pack(c.fallback_min_group_size);
      pk.pack("random_state");
      pk.pack(c.random_state);
      pk.pack("n_init");
      pk.pack(c.n_init);
      pk.pack("max_iter");
      pk.pack(c.max_iter);
      pk.pack("tol");
      pk.pack(c.tol);
    }

    ClusteringConfig unpack_config(const msgpack::object& obj) {
      auto map = obj.as<ObjectMap>();
      ClusteringConfig defaults;

      ClusteringConfig c;
      c.min_cluster_size = get_or(map, "min_cluster_size", defaults.min_cluster_size);
      c.min_samples = get_or(map, "min_samples", defaults.min_samples);
      c.cluster_selection_epsilon
          = get_or(map, "cluster_selection_epsilon", defaults.cluster_selection_epsilon);
      c.max_cluster_size = get_or(map, "max_cluster_size", defaults.max_cluster_size);
      c.noise_similarity_threshold
          = get_or(map, "noise_similarity_threshold", defaults.noise_similarity_threshold);
      c.fallback_cluster_counts
          = get_or(map, "fallback_cluster_counts", defaults.fallback_cluster_counts);
      c.fallback_min_group_size
          = get_or(map, "fallback_min_group_size", defaults.fallback_min_group_size);
      c.random_state = get_or(map, "random_state", defaults.random_state);
      c.n_init = get_or(map, "n_init", defaults.n_init);
      c.max_iter = get_or(map, "max_iter", defaults.max_iter);
      c.tol = get_or(map, "tol", defaults.tol);
      return c;
    }

    void pack_metrics(msgpack::packer<msgpack::sbuffer>& pk, const ClusteringMetrics& m) {
      pk.pack_map(m.fallback_k ? 8 : 7);
      pk.pack("n_samples");
      pk.pack(m.n_samples);
      pk.pack("n_noise");
      pk.pack(m.n_noise);
      pk.pack("n_reassigned");
      pk.pack(m.n_reassigned);
      pk.pack("n_unclustered");
      pk.pack(m.n_unclustered);
      pk.pack("method");
      pk.pack(m.method);
      pk.pack("n_splits");
      pk.pack(m.n_splits);
      pk.pack("cluster_sizes");
      pk.pack(m.cluster_sizes);
      if (m.fallback_k) {
        pk.pack("fallback_k");
        pk.pack(*m.fallback_k);
      }
    }

    ClusteringMetrics unpack_metrics(const msgpack::object& obj) {
      auto map = obj.as<ObjectMap>();

      ClusteringMetrics m;
      m.n_samples = get_or(map, "n_samples", 0);
      m.n_noise = get_or(map, "n_noise", 0);
      m.n_reassigned = get_or(map, "n_reassigned", 0);
      m.n_unclustered = get_or(map, "n_unclustered", 0);
      m.method = get_or(map, "method", std::string(METHOD_NONE));
      m.n_splits = get_or(map, "n_splits", 0);
      m.cluster_sizes = get_or(map, "cluster_sizes", std::vector<int>{});
      if (map.contains("fallback_k") && !map.at("fallback_k").is_nil()) {
        m.fallback_k = map.at("fallback_k").as<int>();
      }
      return m;
    }

  }  // namespace

  ClusteringResult ClusteringResult::from_msgpack(const std::string& path) {
    MappedFile file(path);
    return from_msgpack_string(file.contents());
  }

  ClusteringResult ClusteringResult::from_msgpack_string(const std::string& data) {
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<ObjectMap>();

    ClusteringResult result;
    result.version = get_or(map, "version", std::string(RESULT_FORMAT_VERSION));
    result.created_at = get_or(map, "created_at", std::string());

    for (const auto& cluster_obj : map.at("clusters").as<std::vector<msgpack::object>>()) {
      result.clusters.push_back(unpack_cluster(cluster_obj));
    }
    result.unclustered_ids = get_or(map, "unclustered_ids", std::vector<std::string>{});

    if (map.contains("config")) result.config = unpack_config(map.at("config"));
    if (map.contains("metrics")) result.metrics = unpack_metrics(map.at("metrics"));

    return result;
  }

  std::string ClusteringResult::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    // Top-level map with 6 keys
    pk.pack_map(6);

    pk.pack("version");
    pk.pack(version);
    pk.pack("created_at");
    pk.pack(created_at);

    pk.pack("clusters");
    pk.pack_array(static_cast<uint32_t>(clusters.size()));
    for (const auto& cluster : clusters) pack_cluster(pk, cluster);

    pk.pack("unclustered_ids");
    pk.pack(unclustered_ids);

    pk.pack("config");
    pack_config(pk, config);

    pk.pack("metrics");
    pack_metrics(pk, metrics);

    return std::string(buffer.data(), buffer.size());
  }

  void ClusteringResult::to_msgpack(const std::string& path) const {
    std::string binary_data = to_msgpack_string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open msgpack file for writing: {}", path));
    }
    file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
  }

  // ============================================================================
  // Validation
  // ============================================================================

  const Cluster* ClusteringResult::find_cluster(const std::string& id) const {
    for (const auto& cluster : clusters) {
      if (cluster.id == id) return &cluster;
    }
    return nullptr;
  }

  void ClusteringResult::validate() const {
    config.validate();

    if (metrics.method != METHOD_DENSITY && metrics.method != METHOD_FALLBACK
        && metrics.method != METHOD_NONE) {
      throw std::invalid_argument(fmt::format("Unknown clustering method '{}'", metrics.method));
    }
    if (metrics.fallback_k.has_value() != (metrics.method == METHOD_FALLBACK)) {
      throw std::invalid_argument(
          fmt::format("fallback_k must be set exactly when method is '{}'", METHOD_FALLBACK));
    }
    if (metrics.method == METHOD_NONE && !clusters.empty()) {
      throw std::invalid_argument("method 'none' cannot carry clusters");
    }

    std::unordered_set<std::string> cluster_ids;
    std::unordered_set<std::string> seen_members;
    std::optional<size_t> centroid_dim;
    size_t n_members = 0;

    for (size_t i = 0; i < clusters.size(); ++i) {
      const auto& cluster = clusters[i];

      if (cluster.id.empty()) {
        throw std::invalid_argument(fmt::format("Cluster {} has an empty id", i));
      }
      if (!cluster_ids.insert(cluster.id).second) {
        throw std::invalid_argument(fmt::format("Duplicate cluster id '{}'", cluster.id));
      }
      if (cluster.member_ids.empty()) {
        throw std::invalid_argument(fmt::format("Cluster '{}' has no members", cluster.id));
      }
      for (const auto& member : cluster.member_ids) {
        if (!seen_members.insert(member).second) {
          throw std::invalid_argument(
              fmt::format("Item '{}' appears in more than one cluster", member));
        }
      }
      n_members += cluster.member_ids.size();

      if (cluster.centroid) {
        if (cluster.centroid->empty()) {
          throw std::invalid_argument(fmt::format("Cluster '{}' has an empty centroid", cluster.id));
        }
        if (centroid_dim && *centroid_dim != cluster.centroid->size()) {
          throw std::invalid_argument(
              fmt::format("Cluster '{}' centroid dimension ({}) does not match ({})", cluster.id,
                          cluster.centroid->size(), *centroid_dim));
        }
        centroid_dim = cluster.centroid->size();
      }
    }

    for (const auto& id : unclustered_ids) {
      if (seen_members.contains(id)) {
        throw std::invalid_argument(
            fmt::format("Item '{}' is both clustered and unclustered", id));
      }
    }

    if (static_cast<size_t>(metrics.n_samples) != n_members + unclustered_ids.size()) {
      throw std::invalid_argument(
          fmt::format("n_samples ({}) does not match clustered + unclustered items ({})",
                      metrics.n_samples, n_members + unclustered_ids.size()));
    }
    if (static_cast<size_t>(metrics.n_unclustered) != unclustered_ids.size()) {
      throw std::invalid_argument(
          fmt::format("n_unclustered ({}) does not match unclustered_ids size ({})",
                      metrics.n_unclustered, unclustered_ids.size()));
    }
    if (metrics.cluster_sizes.size() != clusters.size()) {
      throw std::invalid_argument(
          fmt::format("cluster_sizes size ({}) does not match number of clusters ({})",
                      metrics.cluster_sizes.size(), clusters.size()));
    }
    for (size_t i = 0; i < clusters.size(); ++i) {
      if (static_cast<size_t>(metrics.cluster_sizes[i]) != clusters[i].size()) {
        throw std::invalid_argument(
            fmt::format("cluster_sizes[{}] ({}) does not match cluster '{}' size ({})", i,
                        metrics.cluster_sizes[i], clusters[i].id, clusters[i].size()));
      }
    }
  }

}  // namespace tabclust
