#include "internal/events/event_bus.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using muse::events::DomainEvent;
using muse::events::EventBus;
using muse::events::EventBusOptions;
using muse::events::PublishContext;

DomainEvent Event(const std::string& type) {
  return muse::events::MakeEvent(type, "agg-1", muse::events::aggregate_types::kOperation, {});
}

void TestFailingHandlerReportedWhileSiblingRuns() {
  EventBus bus;

  std::atomic<int>         sibling_calls{0};
  std::mutex               errors_mutex;
  std::vector<std::string> errors;

  auto a = bus.Subscribe("operation.completed", [](const DomainEvent&) { throw std::runtime_error("handler exploded"); });
  auto b = bus.Subscribe("operation.completed", [&](const DomainEvent&) { ++sibling_calls; });
  bus.OnError([&](const DomainEvent& event, const std::string& error) {
    std::lock_guard lock(errors_mutex);
    errors.push_back(event.event_type + ":" + error);
  });

  bus.Publish(Event("operation.completed"));

  assert(sibling_calls == 1);
  assert(errors.size() == 1);
  assert(errors[0] == "operation.completed:handler exploded");
}

void TestOnlyMatchingTypeIsDelivered() {
  EventBus         bus;
  std::atomic<int> completed{0};
  std::atomic<int> failed{0};

  auto a = bus.Subscribe("operation.completed", [&](const DomainEvent&) { ++completed; });
  auto b = bus.Subscribe("operation.failed", [&](const DomainEvent&) { ++failed; });

  bus.PublishMany({Event("operation.completed"), Event("operation.completed"), Event("content.saved")});

  assert(completed == 2);
  assert(failed == 0);
}

void TestHandlerCapPerType() {
  EventBus bus(EventBusOptions{2});

  auto a = bus.Subscribe("content.saved", [](const DomainEvent&) {});
  auto b = bus.Subscribe("content.saved", [](const DomainEvent&) {});

  bool exhausted = false;
  try {
    (void)bus.Subscribe("content.saved", [](const DomainEvent&) {});
  } catch (const muse::util::ResourceExhausted&) {
    exhausted = true;
  }
  assert(exhausted);

  // other types have their own budget
  auto c = bus.Subscribe("config.updated", [](const DomainEvent&) {});
  assert(bus.HandlerCount("content.saved") == 2);
  assert(bus.HandlerCount() == 3);

  a();
  auto d = bus.Subscribe("content.saved", [](const DomainEvent&) {});
  assert(bus.HandlerCount("content.saved") == 2);
}

void TestUnsubscribeStopsDelivery() {
  EventBus         bus;
  std::atomic<int> calls{0};

  auto unsubscribe = bus.Subscribe("activity.logged", [&](const DomainEvent&) { ++calls; });
  bus.Publish(Event("activity.logged"));
  unsubscribe();
  unsubscribe();
  bus.Publish(Event("activity.logged"));

  assert(calls == 1);
  assert(bus.HandlerCount("activity.logged") == 0);
}

void TestSubscribeManyRollsBackOnCap() {
  EventBus bus(EventBusOptions{1});
  auto     existing = bus.Subscribe("b", [](const DomainEvent&) {});

  bool exhausted = false;
  try {
    (void)bus.SubscribeMany({"a", "b", "c"}, [](const DomainEvent&) {});
  } catch (const muse::util::ResourceExhausted&) {
    exhausted = true;
  }
  assert(exhausted);
  assert(bus.HandlerCount("a") == 0);
  assert(bus.HandlerCount() == 1);

  auto both = bus.SubscribeMany({"x", "y"}, [](const DomainEvent&) {});
  assert(bus.HandlerCount() == 3);
  both();
  assert(bus.HandlerCount() == 1);
}

void TestMiddlewareRunsInOrderAndCanAbort() {
  EventBus                 bus;
  std::vector<std::string> order;
  std::atomic<int>         delivered{0};

  bus.Use([&](const DomainEvent&, const PublishContext&) { order.push_back("first"); });
  bus.Use([&](const DomainEvent& event, const PublishContext&) {
    order.push_back("second");
    if (event.event_type == "rejected") throw std::runtime_error("log write failed");
  });
  auto sub = bus.Subscribe("rejected", [&](const DomainEvent&) { ++delivered; });

  bool propagated = false;
  try {
    bus.Publish(Event("rejected"));
  } catch (const std::runtime_error&) {
    propagated = true;
  }

  assert(propagated);
  assert(delivered == 0);
  assert((order == std::vector<std::string>{"first", "second"}));
}

void TestUnsubscribeOutlivesBus() {
  muse::events::Unsubscribe unsubscribe;
  {
    EventBus bus;
    unsubscribe = bus.Subscribe("operation.failed", [](const DomainEvent&) {});
  }
  unsubscribe();
}

void TestMakeEventAssignsIdentity() {
  auto first  = Event("operation.updated");
  auto second = Event("operation.updated");
  assert(!first.event_id.empty());
  assert(first.event_id != second.event_id);
  assert(first.metadata.timestamp_ms > 0);
  assert(first.sequence == 0);
}

} // namespace

int main() {
  TestFailingHandlerReportedWhileSiblingRuns();
  TestOnlyMatchingTypeIsDelivered();
  TestHandlerCapPerType();
  TestUnsubscribeStopsDelivery();
  TestSubscribeManyRollsBackOnCap();
  TestMiddlewareRunsInOrderAndCanAbort();
  TestUnsubscribeOutlivesBus();
  TestMakeEventAssignsIdentity();

  std::cout << "muse_unit_event_bus: pass\n";
  return 0;
}
