#include <benchmark/benchmark.h>

#include <tabclust_core/tabclust.hpp>

#include "bench_utils.hpp"

using namespace tabclust;

// =============================================================================
// End-to-End Clustering Benchmarks
// =============================================================================

static void BM_ClusterTabs(benchmark::State& state) {
  const int n_items = static_cast<int>(state.range(0));
  const int dim = static_cast<int>(state.range(1));
  bench_utils::SilenceLogs();

  auto embeddings = bench_utils::GenerateBlobs(n_items / 10, 10, dim);
  TabClusterer clusterer;

  for (auto _ : state) {
    auto result = clusterer.cluster(embeddings);
    benchmark::DoNotOptimize(result);
  }

  state.SetItemsProcessed(state.iterations() * n_items);
  state.SetLabel(std::to_string(n_items) + " tabs/" + std::to_string(dim) + "d");
}

BENCHMARK(BM_ClusterTabs)
    ->Args({20, 384})
    ->Args({50, 384})
    ->Args({100, 384})
    ->Args({100, 768})
    ->Args({300, 768})
    ->Unit(benchmark::kMillisecond);

// Orthogonal input defeats the density step and exercises the k-means fallback
static void BM_ClusterTabs_Fallback(benchmark::State& state) {
  const int n_items = static_cast<int>(state.range(0));
  bench_utils::SilenceLogs();

  std::vector<Embedding> embeddings;
  for (int k = 0; k < n_items; ++k) {
    std::vector<float> v(static_cast<size_t>(n_items), 0.0f);
    v[static_cast<size_t>(k)] = 1.0f;
    embeddings.push_back(Embedding{"tab_" + std::to_string(k), std::move(v), "bench-model"});
  }
  TabClusterer clusterer;

  for (auto _ : state) {
    auto result = clusterer.cluster(embeddings);
    benchmark::DoNotOptimize(result);
  }

  state.SetLabel(std::to_string(n_items) + " orthogonal tabs");
}

BENCHMARK(BM_ClusterTabs_Fallback)->Arg(10)->Arg(40)->Unit(benchmark::kMillisecond);

static void BM_ResultSerialization(benchmark::State& state) {
  const bool binary = state.range(0) == 1;
  bench_utils::SilenceLogs();

  auto result = TabClusterer().cluster(bench_utils::GenerateBlobs(20, 10, 384));

  for (auto _ : state) {
    auto data = binary ? result.to_msgpack_string() : result.to_json_string();
    benchmark::DoNotOptimize(data);
  }

  state.SetLabel(binary ? "msgpack" : "json");
}

BENCHMARK(BM_ResultSerialization)->Arg(0)->Arg(1)->Unit(benchmark::kMicrosecond);
