#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/events/domain_event.hpp"

namespace muse::db {
class Connection;
}

namespace muse::events {

// Ambient state for one publish call. A non-null connection is the
// caller's open transaction; log writes go through it.
struct PublishContext {
  db::Connection* connection = nullptr;
};

using Handler      = std::function<void(const DomainEvent&)>;
using Middleware   = std::function<void(const DomainEvent&, const PublishContext&)>;
using ErrorHandler = std::function<void(const DomainEvent&, const std::string& error)>;
using Unsubscribe  = std::function<void()>;

struct EventBusOptions {
  std::size_t max_handlers_per_type = 64;
};

/*
  EventBus

  Publish runs the middlewares in registration order, then every handler
  subscribed to the event type, concurrently. Publish returns once all of
  them settled.

  - A middleware that throws aborts the publish and the exception
    propagates to the publisher.
  - A handler that throws is reported to the error listeners; siblings
    and the publisher are unaffected.
  - Unsubscribe handles stay safe to call after the bus is destroyed.
*/
class EventBus {
 public:
  explicit EventBus(EventBusOptions options = {});

  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Throws ResourceExhausted when the type already has the maximum number
  // of handlers.
  Unsubscribe Subscribe(const std::string& event_type, Handler handler);
  Unsubscribe SubscribeMany(const std::vector<std::string>& event_types, Handler handler);

  void Use(Middleware middleware);
  void OnError(ErrorHandler handler);

  void Publish(const DomainEvent& event, const PublishContext& context = {});
  void PublishMany(const std::vector<DomainEvent>& events, const PublishContext& context = {});

  std::size_t HandlerCount(const std::string& event_type) const;
  std::size_t HandlerCount() const;

 private:
  struct Registry {
    std::mutex                                                  mutex;
    std::map<std::string, std::map<uint64_t, std::shared_ptr<Handler>>> handlers;
    uint64_t                                                    next_id = 1;
  };

  void ReportError(const DomainEvent& event, const std::string& error);

  EventBusOptions           options_;
  std::shared_ptr<Registry> registry_;

  mutable std::mutex        hooks_mutex_;
  std::vector<Middleware>   middlewares_;
  std::vector<ErrorHandler> error_handlers_;
};

} // namespace muse::events
