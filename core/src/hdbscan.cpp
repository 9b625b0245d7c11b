#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <spdlog/spdlog.h>
#include <tabclust_core/hdbscan.hpp>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace tabclust {

  namespace {

    // Lambda used for merges at zero distance (duplicate points)
    constexpr double kMaxLambda = 1e10;

    using DistanceMatrix = Eigen::MatrixXd;

    struct MstEdge {
      int a;
      int b;
      double weight;
    };

    // Internal node n + k of the single-linkage dendrogram
    struct LinkageNode {
      int left;
      int right;
      double distance;
      int size;
    };

    DistanceMatrix pairwise_distances(const EmbeddingMatrix& points) {
      const auto n = static_cast<int>(points.rows());
      const Eigen::MatrixXd p = points.cast<double>();
      DistanceMatrix d(n, n);

#ifdef _OPENMP
#  pragma omp parallel for schedule(static)
#endif
      for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
          d(i, j) = i == j ? 0.0 : (p.row(i) - p.row(j)).norm();
        }
      }
      return d;
    }

    // Distance to the k-th nearest other point, k = min(min_samples, n - 1)
    std::vector<double> core_distances(const DistanceMatrix& d, int min_samples) {
      const auto n = static_cast<int>(d.rows());
      const int k = std::min(min_samples, n - 1);
      std::vector<double> core(static_cast<size_t>(n), 0.0);
      if (k <= 0) return core;

      std::vector<double> others;
      others.reserve(static_cast<size_t>(n - 1));
      for (int i = 0; i < n; ++i) {
        others.clear();
        for (int j = 0; j < n; ++j) {
          if (j != i) others.push_back(d(i, j));
        }
        std::nth_element(others.begin(), others.begin() + (k - 1), others.end());
        core[static_cast<size_t>(i)] = others[static_cast<size_t>(k - 1)];
      }
      return core;
    }

    // Dense Prim's over mutual reachability distance, starting from point 0
    std::vector<MstEdge> mutual_reachability_mst(const DistanceMatrix& d,
                                                 const std::vector<double>& core) {
      const auto n = static_cast<int>(d.rows());
      std::vector<bool> in_tree(static_cast<size_t>(n), false);
      std::vector<double> best(static_cast<size_t>(n), std::numeric_limits<double>::infinity());
      std::vector<int> source(static_cast<size_t>(n), -1);
      std::vector<MstEdge> edges;
      edges.reserve(static_cast<size_t>(n - 1));

      int current = 0;
      in_tree[0] = true;
      for (int step = 1; step < n; ++step) {
        int next = -1;
        double next_weight = std::numeric_limits<double>::infinity();

        for (int j = 0; j < n; ++j) {
          auto uj = static_cast<size_t>(j);
          if (in_tree[uj]) continue;

          double mrd = std::max({core[static_cast<size_t>(current)], core[uj], d(current, j)});
          if (mrd < best[uj]) {
            best[uj] = mrd;
            source[uj] = current;
          }
          if (next == -1 || best[uj] < next_weight) {
            next_weight = best[uj];
            next = j;
          }
        }

        edges.push_back({source[static_cast<size_t>(next)], next, next_weight});
        in_tree[static_cast<size_t>(next)] = true;
        current = next;
      }
      return edges;
    }

    int find_root(std::vector<int>& parent, int x) {
      int root = x;
      while (parent[static_cast<size_t>(root)] != root) root = parent[static_cast<size_t>(root)];
      while (parent[static_cast<size_t>(x)] != root) {
        int up = parent[static_cast<size_t>(x)];
        parent[static_cast<size_t>(x)] = root;
        x = up;
      }
      return root;
    }

    std::vector<LinkageNode> single_linkage(std::vector<MstEdge> edges, int n) {
      std::stable_sort(edges.begin(), edges.end(),
                       [](const MstEdge& x, const MstEdge& y) { return x.weight < y.weight; });

      std::vector<int> parent(static_cast<size_t>(2 * n - 1));
      std::iota(parent.begin(), parent.end(), 0);
      std::vector<int> size(static_cast<size_t>(2 * n - 1), 1);

      std::vector<LinkageNode> hierarchy;
      hierarchy.reserve(edges.size());
      for (size_t k = 0; k < edges.size(); ++k) {
        int a = find_root(parent, edges[k].a);
        int b = find_root(parent, edges[k].b);
        int node = n + static_cast<int>(k);
        int merged = size[static_cast<size_t>(a)] + size[static_cast<size_t>(b)];

        hierarchy.push_back({a, b, edges[k].weight, merged});
        parent[static_cast<size_t>(a)] = node;
        parent[static_cast<size_t>(b)] = node;
        size[static_cast<size_t>(node)] = merged;
      }
      return hierarchy;
    }

    class Dendrogram {
    public:
      Dendrogram(const std::vector<LinkageNode>& hierarchy, int n)
          : hierarchy_(hierarchy), n_(n) {}

      [[nodiscard]] int root() const { return 2 * n_ - 2; }
      [[nodiscard]] bool is_leaf(int node) const { return node < n_; }
      [[nodiscard]] const LinkageNode& at(int node) const {
        return hierarchy_[static_cast<size_t>(node - n_)];
      }
      [[nodiscard]] int size(int node) const { return is_leaf(node) ? 1 : at(node).size; }

      [[nodiscard]] std::vector<int> bfs(int start) const {
        std::vector<int> order;
        std::deque<int> queue{start};
        while (!queue.empty()) {
          int node = queue.front();
          queue.pop_front();
          order.push_back(node);
          if (!is_leaf(node)) {
            queue.push_back(at(node).left);
            queue.push_back(at(node).right);
          }
        }
        return order;
      }

    private:
      const std::vector<LinkageNode>& hierarchy_;
      int n_;
    };

    std::vector<CondensedEdge> condense_tree(const Dendrogram& tree, int n, int min_cluster_size) {
      const size_t n_nodes = static_cast<size_t>(2 * n - 1);
      std::vector<int> relabel(n_nodes, -1);
      std::vector<bool> ignore(n_nodes, false);
      std::vector<CondensedEdge> condensed;

      int next_label = n + 1;
      relabel[static_cast<size_t>(tree.root())] = n;

      auto fall_out = [&](int parent_label, int subtree, double lambda) {
        for (int sub : tree.bfs(subtree)) {
          if (tree.is_leaf(sub)) condensed.push_back({parent_label, sub, lambda, 1});
          ignore[static_cast<size_t>(sub)] = true;
        }
      };

      for (int node : tree.bfs(tree.root())) {
        if (ignore[static_cast<size_t>(node)] || tree.is_leaf(node)) continue;

        const auto& link = tree.at(node);
        double lambda = link.distance > 0.0 ? 1.0 / link.distance : kMaxLambda;
        int label = relabel[static_cast<size_t>(node)];
        int left_count = tree.size(link.left);
        int right_count = tree.size(link.right);

        if (left_count >= min_cluster_size && right_count >= min_cluster_size) {
          relabel[static_cast<size_t>(link.left)] = next_label++;
          condensed.push_back({label, relabel[static_cast<size_t>(link.left)], lambda, left_count});
          relabel[static_cast<size_t>(link.right)] = next_label++;
          condensed.push_back(
              {label, relabel[static_cast<size_t>(link.right)], lambda, right_count});
        } else if (left_count < min_cluster_size && right_count < min_cluster_size) {
          fall_out(label, link.left, lambda);
          fall_out(label, link.right, lambda);
        } else if (left_count < min_cluster_size) {
          relabel[static_cast<size_t>(link.right)] = label;
          fall_out(label, link.left, lambda);
        } else {
          relabel[static_cast<size_t>(link.left)] = label;
          fall_out(label, link.right, lambda);
        }
      }
      return condensed;
    }

    // Cluster-level view of the condensed tree; clusters indexed from 0 (= root)
    struct ClusterTree {
      std::vector<int> parent;  // -1 for the root
      std::vector<std::vector<int>> children;
      std::vector<double> birth_lambda;
      std::vector<double> stability;

      [[nodiscard]] size_t size() const noexcept { return parent.size(); }

      [[nodiscard]] std::vector<int> descendants(int cluster) const {
        std::vector<int> out;
        std::deque<int> queue(children[static_cast<size_t>(cluster)].begin(),
                              children[static_cast<size_t>(cluster)].end());
        while (!queue.empty()) {
          int c = queue.front();
          queue.pop_front();
          out.push_back(c);
          for (int child : children[static_cast<size_t>(c)]) queue.push_back(child);
        }
        return out;
      }
    };

    ClusterTree build_cluster_tree(const std::vector<CondensedEdge>& condensed, int n) {
      int max_label = n;
      for (const auto& e : condensed) max_label = std::max({max_label, e.parent, e.child});
      const auto n_clusters = static_cast<size_t>(max_label - n + 1);

      ClusterTree tree;
      tree.parent.assign(n_clusters, -1);
      tree.children.assign(n_clusters, {});
      tree.birth_lambda.assign(n_clusters, 0.0);
      tree.stability.assign(n_clusters, 0.0);

      for (const auto& e : condensed) {
        if (e.child >= n) {
          auto child = static_cast<size_t>(e.child - n);
          tree.parent[child] = e.parent - n;
          tree.children[static_cast<size_t>(e.parent - n)].push_back(e.child - n);
          tree.birth_lambda[child] = e.lambda;
        }
      }
      for (const auto& e : condensed) {
        auto p = static_cast<size_t>(e.parent - n);
        tree.stability[p] += (e.lambda - tree.birth_lambda[p]) * e.child_size;
      }
      return tree;
    }

    // Excess of mass, bottom-up; the root is never a candidate
    std::set<int> select_eom(ClusterTree tree) {
      std::vector<bool> is_cluster(tree.size(), true);
      is_cluster[0] = false;

      for (int c = static_cast<int>(tree.size()) - 1; c >= 1; --c) {
        double subtree_stability = 0.0;
        for (int child : tree.children[static_cast<size_t>(c)]) {
          subtree_stability += tree.stability[static_cast<size_t>(child)];
        }

        if (subtree_stability > tree.stability[static_cast<size_t>(c)]) {
          is_cluster[static_cast<size_t>(c)] = false;
          tree.stability[static_cast<size_t>(c)] = subtree_stability;
        } else {
          for (int sub : tree.descendants(c)) is_cluster[static_cast<size_t>(sub)] = false;
        }
      }

      std::set<int> selected;
      for (size_t c = 1; c < tree.size(); ++c) {
        if (is_cluster[c]) selected.insert(static_cast<int>(c));
      }
      return selected;
    }

    int traverse_upwards(const ClusterTree& tree, double epsilon, int leaf) {
      int parent = tree.parent[static_cast<size_t>(leaf)];
      if (parent == 0) return leaf;

      double parent_eps = 1.0 / tree.birth_lambda[static_cast<size_t>(parent)];
      if (parent_eps > epsilon) return parent;
      return traverse_upwards(tree, epsilon, parent);
    }

    // Replace clusters born below the slack radius by their nearest wider ancestor
    std::set<int> epsilon_search(const ClusterTree& tree, const std::set<int>& leaves,
                                 double epsilon) {
      std::set<int> selected;
      std::set<int> processed;

      for (int leaf : leaves) {
        double eps = 1.0 / tree.birth_lambda[static_cast<size_t>(leaf)];
        if (eps < epsilon) {
          if (processed.contains(leaf)) continue;
          int chosen = traverse_upwards(tree, epsilon, leaf);
          selected.insert(chosen);
          for (int sub : tree.descendants(chosen)) processed.insert(sub);
        } else {
          selected.insert(leaf);
        }
      }
      return selected;
    }

  }  // namespace

  // =============================================================================
  // DensityBackend
  // =============================================================================

  DensityBackend::DensityBackend(DensitySpec spec) : spec_(spec) {
    if (spec_.min_cluster_size < 1 || spec_.min_samples < 1) [[unlikely]] {
      throw std::invalid_argument("min_cluster_size and min_samples must be positive");
    }
    if (spec_.cluster_selection_epsilon < 0.0f) [[unlikely]] {
      throw std::invalid_argument("cluster_selection_epsilon must be non-negative");
    }
  }

  PartitionResult DensityBackend::partition(const EmbeddingMatrix& points) {
    const auto n = static_cast<int>(points.rows());
    condensed_.clear();

    PartitionResult result;
    result.labels.assign(static_cast<size_t>(n), kNoiseLabel);
    if (n < 2) return result;

    const int min_cluster_size = std::max(spec_.min_cluster_size, 2);

    auto distances = pairwise_distances(points);
    auto core = core_distances(distances, spec_.min_samples);
    auto hierarchy = single_linkage(mutual_reachability_mst(distances, core), n);

    Dendrogram dendrogram(hierarchy, n);
    condensed_ = condense_tree(dendrogram, n, min_cluster_size);

    auto tree = build_cluster_tree(condensed_, n);
    auto selected = select_eom(tree);
    if (spec_.cluster_selection_epsilon > 0.0f && tree.size() > 1) {
      selected = epsilon_search(tree, selected, spec_.cluster_selection_epsilon);
    }

    std::map<int, int> label_of;
    for (int c : selected) label_of.emplace(c, static_cast<int>(label_of.size()));

    std::vector<int> point_parent(static_cast<size_t>(n), 0);
    for (const auto& e : condensed_) {
      if (e.child < n) point_parent[static_cast<size_t>(e.child)] = e.parent - n;
    }

    for (int p = 0; p < n; ++p) {
      int c = point_parent[static_cast<size_t>(p)];
      while (c != 0 && !label_of.contains(c)) c = tree.parent[static_cast<size_t>(c)];
      if (c != 0) result.labels[static_cast<size_t>(p)] = label_of.at(c);
    }
    result.n_clusters = static_cast<int>(label_of.size());

    spdlog::debug("HDBSCAN: {} points, {} condensed clusters, {} selected, {} noise", n,
                  tree.size(), result.n_clusters, result.noise_count());
    return result;
  }

}  // namespace tabclust
