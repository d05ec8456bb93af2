#include "in_process_transport.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace waveq::status {

bool InProcessTransport::Matches(const std::string& filter, const std::string& topic) {
  if (!filter.empty() && filter.back() == '#') {
    return topic.compare(0, filter.size() - 1, filter, 0, filter.size() - 1) == 0;
  }
  return filter == topic;
}

bool InProcessTransport::Publish(const std::string& topic, const std::string& payload) {
  std::vector<Handler> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, sub] : subscriptions_) {
      if (Matches(sub.filter, topic)) targets.push_back(sub.handler);
    }
  }

  // handlers run unlocked so they may subscribe or unsubscribe
  bool delivered = true;
  for (const auto& handler : targets) {
    try {
      handler(topic, payload);
    } catch (const std::exception& e) {
      WAVEQ_LOG_WARN("subscriber failed", {observability::StringField("topic", topic), observability::StringField("error", e.what())});
      delivered = false;
    }
  }
  return delivered;
}

Transport::SubscriptionId InProcessTransport::Subscribe(const std::string& topic, Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.emplace(id, Subscription{topic, std::move(handler)});
  return id;
}

void InProcessTransport::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscriptions_.erase(id);
}

} // namespace waveq::status
