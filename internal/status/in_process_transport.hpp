#pragma once

#include <map>
#include <mutex>

#include "transport.hpp"

namespace waveq::status {

// Synchronous in-process broker.
class InProcessTransport final : public Transport {
 public:
  bool           Publish(const std::string& topic, const std::string& payload) override;
  SubscriptionId Subscribe(const std::string& topic, Handler handler) override;
  void           Unsubscribe(SubscriptionId id) override;

 private:
  struct Subscription {
    std::string filter;
    Handler     handler;
  };

  static bool Matches(const std::string& filter, const std::string& topic);

  std::mutex                             mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId                         next_id_ = 1;
};

} // namespace waveq::status
