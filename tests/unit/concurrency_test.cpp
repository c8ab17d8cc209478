#include "dirimg/cancellation.hpp"
#include "dirimg/errors.hpp"
#include "dirimg/progress.hpp"

#include "../../src/core/bounded_queue.hpp"
#include "../../src/core/error_group.hpp"
#include "../test_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void RunScenarioQueueFifoAndClose() {
  dirimg::tests::Log("scenario: queue is FIFO and drains after close");
  dirimg::core::BoundedQueue<int> queue(3);
  const dirimg::CancellationToken token;
  Require(queue.Push(1, token) && queue.Push(2, token) && queue.Push(3, token), "pushes within capacity must succeed");
  Require(queue.size() == 3, "queue must hold three items");
  queue.Close();
  Require(!queue.Push(4, token), "push after close must fail");
  Require(queue.Pop() == 1 && queue.Pop() == 2 && queue.Pop() == 3, "items must come out in order");
  Require(!queue.Pop().has_value(), "closed and drained queue must report end");
}

void RunScenarioCancelledPushUnblocks() {
  dirimg::tests::Log("scenario: push blocked on a full queue returns once cancelled");
  dirimg::core::BoundedQueue<int> queue(1);
  dirimg::CancellationToken token;
  Require(queue.Push(1, token), "first push must succeed");

  std::atomic<bool> returned{false};
  bool accepted = true;
  std::thread producer([&]() {
    accepted = queue.Push(2, token);
    returned.store(true);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  Require(!returned.load(), "push must block while the queue is full");
  token.Cancel();
  producer.join();
  Require(!accepted, "cancelled push must not enqueue");
  Require(queue.size() == 1, "cancelled push must leave the queue unchanged");
}

void RunScenarioProducerConsumerTransfer() {
  dirimg::tests::Log("scenario: items cross threads through a small queue");
  constexpr int kItems = 2000;
  dirimg::core::BoundedQueue<int> queue(2);
  const dirimg::CancellationToken token;
  std::atomic<long long> sum{0};
  std::vector<std::thread> consumers{};
  for (int i = 0; i < 4; ++i) {
    consumers.emplace_back([&]() {
      while (auto item = queue.Pop()) {
        sum.fetch_add(*item);
      }
    });
  }
  {
    dirimg::core::QueueCloser<int> closer(queue);
    for (int i = 1; i <= kItems; ++i) {
      Require(queue.Push(i, token), "push must succeed");
    }
  }
  for (auto& consumer : consumers) {
    consumer.join();
  }
  Require(sum.load() == static_cast<long long>(kItems) * (kItems + 1) / 2, "every item must be consumed exactly once");
}

void RunScenarioErrorGroupFirstErrorWins() {
  dirimg::tests::Log("scenario: error group rethrows the first failure and cancels its token");
  dirimg::core::ErrorGroup group;
  std::atomic<bool> observed_cancel{false};
  group.Go([]() { throw std::system_error(std::make_error_code(std::errc::permission_denied), "first"); });
  group.Go([&]() {
    while (!group.token().IsCancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    observed_cancel.store(true);
    throw std::runtime_error("second");
  });

  bool threw = false;
  try {
    group.Wait();
  } catch (const std::system_error& ex) {
    threw = ex.code() == std::errc::permission_denied;
  }
  Require(threw, "first error must be rethrown");
  Require(observed_cancel.load(), "sibling task must observe cancellation");
  Require(group.failed(), "group must report failure");
}

void RunScenarioEarlyUnwindReleasesWorkers() {
  dirimg::tests::Log("scenario: unwinding before the producer starts releases waiting workers");
  std::atomic<int> finished_workers{0};
  bool threw = false;
  try {
    dirimg::core::BoundedQueue<int> jobs(2);
    dirimg::core::ErrorGroup group;
    dirimg::core::QueueCloser<int> close_jobs(jobs);
    for (int i = 0; i < 2; ++i) {
      group.Go([&]() {
        while (jobs.Pop()) {
        }
        finished_workers.fetch_add(1);
      });
    }
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again), "producer start failed");
  } catch (const std::system_error&) {
    threw = true;
  }
  Require(threw, "setup error must propagate");
  Require(finished_workers.load() == 2, "both workers must leave Pop and be joined");
}

void RunScenarioCancellationHierarchy() {
  dirimg::tests::Log("scenario: child tokens observe parents, not the reverse");
  dirimg::CancellationToken parent;
  dirimg::CancellationToken child(&parent);
  child.Cancel();
  Require(child.IsCancelled() && !parent.IsCancelled(), "child cancel must not leak to parent");

  dirimg::CancellationToken other_child(&parent);
  parent.Cancel();
  Require(other_child.IsCancelled(), "parent cancel must reach children");
  bool threw = false;
  try {
    other_child.ThrowIfCancelled();
  } catch (const dirimg::CancelledError&) {
    threw = true;
  }
  Require(threw, "ThrowIfCancelled must raise CancelledError");
}

void RunScenarioProgressChannelIsLossy() {
  dirimg::tests::Log("scenario: progress channel keeps one update and drops the rest");
  dirimg::ProgressChannel channel;
  Require(channel.TrySend({.bytes_processed = 1, .bytes_total = 10}), "first send must land");
  Require(!channel.TrySend({.bytes_processed = 2, .bytes_total = 10}), "second send must be dropped");
  Require(channel.dropped_count() == 1, "one update must be counted as dropped");
  const auto update = channel.TryReceive();
  Require(update.has_value() && update->bytes_processed == 1, "first update must be delivered");
  Require(!channel.TryReceive().has_value(), "slot must be empty after receive");
  Require(!channel.Receive(std::chrono::milliseconds(5)).has_value(), "receive on empty slot must time out");
  Require(channel.TrySend({.bytes_processed = 3, .bytes_total = 10}), "send after drain must land");
}

void RunScenarioTransientErrorClassification() {
  dirimg::tests::Log("scenario: only connection reset and broken pipe are transient");
  Require(dirimg::IsTransientNetworkError(std::system_error(std::make_error_code(std::errc::connection_reset))),
          "connection reset must be transient");
  Require(dirimg::IsTransientNetworkError(std::system_error(std::make_error_code(std::errc::broken_pipe))),
          "broken pipe must be transient");
  Require(!dirimg::IsTransientNetworkError(std::system_error(std::make_error_code(std::errc::no_space_on_device))),
          "disk full must be permanent");
  Require(!dirimg::IsTransientNetworkError(std::runtime_error("boom")), "plain errors must be permanent");
}

}  // namespace

int main() {
  try {
    dirimg::tests::Log("concurrency_test: start");
    RunScenarioQueueFifoAndClose();
    RunScenarioCancelledPushUnblocks();
    RunScenarioProducerConsumerTransfer();
    RunScenarioErrorGroupFirstErrorWins();
    RunScenarioEarlyUnwindReleasesWorkers();
    RunScenarioCancellationHierarchy();
    RunScenarioProgressChannelIsLossy();
    RunScenarioTransientErrorClassification();
    dirimg::tests::Log("concurrency_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    dirimg::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
