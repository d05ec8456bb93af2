#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/store/request_store.hpp"
#include "transport.hpp"

namespace waveq::status {

struct PublisherOptions {
  uint32_t publish_attempts = 3;
  bool     progress_events  = true;
};

/*
  Emits full-state snapshots on audio/status/<id>.

  Delivery is at-least-once: a failed hand-off is retried up to
  publish_attempts times, so subscribers must tolerate duplicates.
*/
class StatusPublisher {
 public:
  static constexpr const char* kTopicPrefix = "audio/status/";

  StatusPublisher(std::shared_ptr<Transport> transport, PublisherOptions options);

  static std::string Topic(const std::string& request_id);

  static waveq::engine::v1::StatusEvent BuildEvent(const db::model::RequestRecord& record, const std::optional<store::StepMarker>& step);

  static std::string                    ToJson(const waveq::engine::v1::StatusEvent& event);
  static waveq::engine::v1::StatusEvent FromJson(const std::string& json);

  bool Publish(const std::string& request_id, const waveq::engine::v1::StatusEvent& event);

  // Store transition listener.
  void OnTransition(const store::RequestEvent& event);

 private:
  std::shared_ptr<Transport> transport_;
  PublisherOptions           options_;
};

} // namespace waveq::status
