#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace waveq::status {

/*
  Topic pub/sub.

  Publish returns false when the message could not be handed off; callers
  decide whether to retry. Handlers run on the publishing thread.
*/
class Transport {
 public:
  using Handler        = std::function<void(const std::string& topic, const std::string& payload)>;
  using SubscriptionId = uint64_t;

  virtual ~Transport() = default;

  virtual bool Publish(const std::string& topic, const std::string& payload) = 0;

  // Exact topic, or a prefix ending in '#' ("audio/status/#").
  virtual SubscriptionId Subscribe(const std::string& topic, Handler handler) = 0;

  virtual void Unsubscribe(SubscriptionId id) = 0;
};

} // namespace waveq::status
