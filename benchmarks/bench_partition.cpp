#include <benchmark/benchmark.h>

#include <tabclust_core/centroid_index.hpp>
#include <tabclust_core/hdbscan.hpp>
#include <tabclust_core/kmeans.hpp>
#include <tabclust_core/normalizer.hpp>

#include "bench_utils.hpp"

using namespace tabclust;

// =============================================================================
// Density Clustering Benchmarks
// =============================================================================

static void BM_DensityPartition(benchmark::State& state) {
  const int n_items = static_cast<int>(state.range(0));
  const int dim = static_cast<int>(state.range(1));
  bench_utils::SilenceLogs();

  auto set = normalize_embeddings(bench_utils::GenerateBlobs(n_items / 10, 10, dim));
  DensityBackend backend(DensitySpec{});

  for (auto _ : state) {
    auto result = backend.partition(set.vectors);
    benchmark::DoNotOptimize(result);
  }

  state.SetLabel(std::to_string(n_items) + "n/" + std::to_string(dim) + "d");
}

static void PartitionArgs(benchmark::internal::Benchmark* b) {
  std::vector<int> sizes = {20, 50, 100, 200};
  std::vector<int> dimensions = {128, 384, 768};

  for (int n : sizes) {
    for (int dim : dimensions) {
      b->Args({n, dim});
    }
  }

  b->Unit(benchmark::kMillisecond);
}

BENCHMARK(BM_DensityPartition)->Apply(PartitionArgs);

// =============================================================================
// k-means Benchmarks
// =============================================================================

static void BM_KMeansPartition(benchmark::State& state) {
  const int n_items = static_cast<int>(state.range(0));
  const int dim = static_cast<int>(state.range(1));
  bench_utils::SilenceLogs();

  auto points = bench_utils::GenerateMatrix(n_items, dim);
  KMeansBackend backend(CentroidSpec{.n_clusters = 5});

  for (auto _ : state) {
    auto result = backend.partition(points);
    benchmark::DoNotOptimize(result);
  }

  state.SetLabel(std::to_string(n_items) + "n/" + std::to_string(dim) + "d/k5");
}

BENCHMARK(BM_KMeansPartition)->Apply(PartitionArgs);

// =============================================================================
// Nearest-Centroid Benchmarks
// =============================================================================

static void BM_CentroidAssignBatch(benchmark::State& state) {
  const int batch_size = static_cast<int>(state.range(0));
  const int n_clusters = static_cast<int>(state.range(1));
  const int dim = static_cast<int>(state.range(2));

  CentroidIndex index;
  index.load_centroids(bench_utils::GenerateMatrix(n_clusters, dim, 7));
  auto queries = bench_utils::GenerateMatrix(batch_size, dim);

  for (auto _ : state) {
    auto assignment = index.assign_batch(queries);
    benchmark::DoNotOptimize(assignment);
  }

  state.SetItemsProcessed(state.iterations() * batch_size);
  state.SetLabel(std::to_string(batch_size) + "q/" + std::to_string(n_clusters) + "c/"
                 + std::to_string(dim) + "d");
}

BENCHMARK(BM_CentroidAssignBatch)
    ->Args({100, 5, 384})
    ->Args({100, 20, 384})
    ->Args({1000, 20, 768})
    ->Unit(benchmark::kMicrosecond);
