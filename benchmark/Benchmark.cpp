#include <Trove/Trove.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <new>
#include <random>
#include <unordered_map>
#include <vector>

namespace
{
    using Storage = Trove::TypedMap<std::uint64_t, std::uint64_t>;

    Storage MakeStorage(std::size_t capacity = 0)
    {
        auto created = Trove::MakeTypedMap<std::uint64_t, std::uint64_t>(capacity);
        if (!created)
        {
            throw std::bad_alloc();
        }
        return std::move(created).Value();
    }

    std::vector<std::uint64_t> RandomKeys(std::size_t count, std::uint64_t seed)
    {
        std::mt19937_64 rng(seed);
        std::vector<std::uint64_t> keys(count);
        for (auto& key : keys)
        {
            key = rng();
        }
        return keys;
    }
}

static void BM_InsertSequential(benchmark::State& state)
{
    const std::size_t count = state.range(0);

    for (auto _ : state)
    {
        Storage storage = MakeStorage();
        auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
        for (std::size_t i = 0; i < count; ++i)
        {
            if (!map.Insert(i, i))
            {
                state.SkipWithError("Insert failed");
                break;
            }
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_InsertReserved(benchmark::State& state)
{
    const std::size_t count = state.range(0);
    const auto keys = RandomKeys(count, 1);

    for (auto _ : state)
    {
        Storage storage = MakeStorage(count);
        auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
        for (std::uint64_t key : keys)
        {
            if (!map.Insert(key, key))
            {
                state.SkipWithError("Insert failed");
                break;
            }
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_LookupHit(benchmark::State& state)
{
    const std::size_t count = state.range(0);
    const auto keys = RandomKeys(count, 2);

    Storage storage = MakeStorage(count);
    auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
    for (std::uint64_t key : keys)
    {
        if (!map.Insert(key, key))
        {
            state.SkipWithError("Insert failed");
            break;
        }
    }

    for (auto _ : state)
    {
        for (std::uint64_t key : keys)
        {
            benchmark::DoNotOptimize(map.Get(key));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_LookupMiss(benchmark::State& state)
{
    const std::size_t count = state.range(0);
    const auto keys = RandomKeys(count, 3);
    const auto misses = RandomKeys(count, 4);

    Storage storage = MakeStorage(count);
    auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
    for (std::uint64_t key : keys)
    {
        if (!map.Insert(key, key))
        {
            state.SkipWithError("Insert failed");
            break;
        }
    }

    for (auto _ : state)
    {
        for (std::uint64_t key : misses)
        {
            benchmark::DoNotOptimize(map.Get(key));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_EraseInsertChurn(benchmark::State& state)
{
    const std::size_t count = state.range(0);

    Storage storage = MakeStorage(count);
    auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
    std::uint64_t next = 0;
    for (; next < count; ++next)
    {
        if (!map.Insert(next, next))
        {
            state.SkipWithError("Insert failed");
            break;
        }
    }

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(map.Delete(next - count));
        if (!map.Insert(next, next))
        {
            state.SkipWithError("Insert failed");
            break;
        }
        ++next;
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_Iterate(benchmark::State& state)
{
    const std::size_t count = state.range(0);

    Storage storage = MakeStorage(count);
    auto map = storage.AsMap<std::uint64_t, std::uint64_t>();
    for (std::uint64_t i = 0; i < count; ++i)
    {
        if (!map.Insert(i, i))
        {
            state.SkipWithError("Insert failed");
            break;
        }
    }

    for (auto _ : state)
    {
        std::uint64_t sum = 0;
        for (auto [key, value] : map)
        {
            TROVE_UNUSED(key);
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Baseline
static void BM_StdUnorderedMapLookupHit(benchmark::State& state)
{
    const std::size_t count = state.range(0);
    const auto keys = RandomKeys(count, 2);

    std::unordered_map<std::uint64_t, std::uint64_t> map;
    map.reserve(count);
    for (std::uint64_t key : keys)
    {
        map.emplace(key, key);
    }

    for (auto _ : state)
    {
        for (std::uint64_t key : keys)
        {
            benchmark::DoNotOptimize(map.find(key));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_InsertSequential)->Arg(1000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_InsertReserved)->Arg(1000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_LookupHit)->Arg(1000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_LookupMiss)->Arg(1000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_EraseInsertChurn)->Arg(1000)->Arg(100000);
BENCHMARK(BM_Iterate)->Arg(1000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_StdUnorderedMapLookupHit)->Arg(1000)->Arg(100000)->Arg(1000000);

BENCHMARK_MAIN();
