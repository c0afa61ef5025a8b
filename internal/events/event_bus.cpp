#include "event_bus.hpp"

#include <exception>
#include <future>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace muse::events {

EventBus::EventBus(EventBusOptions options) : options_(options), registry_(std::make_shared<Registry>()) {
}

Unsubscribe EventBus::Subscribe(const std::string& event_type, Handler handler) {
  uint64_t id = 0;
  {
    std::lock_guard lock(registry_->mutex);
    auto&           slot = registry_->handlers[event_type];
    if (slot.size() >= options_.max_handlers_per_type) {
      throw util::ResourceExhausted("too many handlers for event type '" + event_type + "'");
    }
    id = registry_->next_id++;
    slot.emplace(id, std::make_shared<Handler>(std::move(handler)));
  }

  std::weak_ptr<Registry> weak = registry_;
  return [weak, event_type, id] {
    auto registry = weak.lock();
    if (!registry) return;
    std::lock_guard lock(registry->mutex);
    auto            it = registry->handlers.find(event_type);
    if (it == registry->handlers.end()) return;
    it->second.erase(id);
    if (it->second.empty()) registry->handlers.erase(it);
  };
}

Unsubscribe EventBus::SubscribeMany(const std::vector<std::string>& event_types, Handler handler) {
  std::vector<Unsubscribe> subscriptions;
  subscriptions.reserve(event_types.size());
  try {
    for (const auto& type : event_types) {
      subscriptions.push_back(Subscribe(type, handler));
    }
  } catch (const util::ResourceExhausted&) {
    for (auto& unsubscribe : subscriptions) unsubscribe();
    throw;
  }

  return [subscriptions = std::move(subscriptions)] {
    for (const auto& unsubscribe : subscriptions) unsubscribe();
  };
}

void EventBus::Use(Middleware middleware) {
  std::lock_guard lock(hooks_mutex_);
  middlewares_.push_back(std::move(middleware));
}

void EventBus::OnError(ErrorHandler handler) {
  std::lock_guard lock(hooks_mutex_);
  error_handlers_.push_back(std::move(handler));
}

void EventBus::Publish(const DomainEvent& event, const PublishContext& context) {
  std::vector<Middleware> middlewares;
  {
    std::lock_guard lock(hooks_mutex_);
    middlewares = middlewares_;
  }
  for (const auto& middleware : middlewares) {
    middleware(event, context);
  }

  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard lock(registry_->mutex);
    auto            it = registry_->handlers.find(event.event_type);
    if (it != registry_->handlers.end()) {
      for (const auto& [id, handler] : it->second) handlers.push_back(handler);
    }
  }
  if (handlers.empty()) return;

  std::vector<std::future<void>> running;
  running.reserve(handlers.size());
  for (const auto& handler : handlers) {
    running.push_back(std::async(std::launch::async, [handler, &event] { (*handler)(event); }));
  }

  for (auto& future : running) {
    try {
      future.get();
    } catch (const std::exception& e) {
      ReportError(event, e.what());
    } catch (...) {
      ReportError(event, "unknown handler error");
    }
  }
}

void EventBus::PublishMany(const std::vector<DomainEvent>& events, const PublishContext& context) {
  for (const auto& event : events) Publish(event, context);
}

std::size_t EventBus::HandlerCount(const std::string& event_type) const {
  std::lock_guard lock(registry_->mutex);
  auto            it = registry_->handlers.find(event_type);
  return it == registry_->handlers.end() ? 0 : it->second.size();
}

std::size_t EventBus::HandlerCount() const {
  std::lock_guard lock(registry_->mutex);
  std::size_t     total = 0;
  for (const auto& [type, handlers] : registry_->handlers) total += handlers.size();
  return total;
}

void EventBus::ReportError(const DomainEvent& event, const std::string& error) {
  std::vector<ErrorHandler> listeners;
  {
    std::lock_guard lock(hooks_mutex_);
    listeners = error_handlers_;
  }

  if (listeners.empty()) {
    MUSE_LOG_WARN("event handler failed",
                  {observability::StringField("event_type", event.event_type), observability::StringField("event_id", event.event_id),
                   observability::StringField("error", error)});
    return;
  }

  for (const auto& listener : listeners) {
    try {
      listener(event, error);
    } catch (const std::exception& e) {
      MUSE_LOG_ERROR("event error listener failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace muse::events
