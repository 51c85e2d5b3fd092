#include "rdaemon/sync/wake_event.hpp"
#include "rdaemon/core/lockfree_queue.hpp"

#include <benchmark/benchmark.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace rdaemon;

static void BM_WakeEventSetClear(benchmark::State& state) {
  auto event = make_wake_event(static_cast<WakeEventKind>(state.range(0)));

  for (auto _ : state) {
    event->set();
    benchmark::DoNotOptimize(event->clear());
  }

  state.SetItemsProcessed(state.iterations());
}

static void BM_WakeEventPingPong(benchmark::State& state) {
  auto kind = static_cast<WakeEventKind>(state.range(0));
  auto ping = make_wake_event(kind);
  auto pong = make_wake_event(kind);

  std::thread responder([&] {
    while (!ping->is_terminated()) {
      if (ping->wait_and_clear(std::chrono::milliseconds(100))) {
        pong->set();
      }
    }
  });

  for (auto _ : state) {
    ping->set();
    while (!pong->wait_and_clear(std::chrono::milliseconds(100))) {
    }
  }

  ping->terminate();
  responder.join();
  state.SetItemsProcessed(state.iterations());
}

static void BM_LogQueuePushPop(benchmark::State& state) {
  BoundedMPSCQueue<int> queue(static_cast<std::size_t>(state.range(0)));

  for (auto _ : state) {
    benchmark::DoNotOptimize(queue.push(1));
    benchmark::DoNotOptimize(queue.try_pop());
  }

  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_WakeEventSetClear)
    ->Arg(static_cast<int>(WakeEventKind::Thread))
    ->Arg(static_cast<int>(WakeEventKind::Shared));
BENCHMARK(BM_WakeEventPingPong)
    ->Arg(static_cast<int>(WakeEventKind::Thread))
    ->Arg(static_cast<int>(WakeEventKind::Shared))
    ->UseRealTime();
BENCHMARK(BM_LogQueuePushPop)->Arg(1024)->Arg(8192);
