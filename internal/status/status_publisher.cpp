#include "status_publisher.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace waveq::status {

using observability::IntField;
using observability::RequestField;
using observability::StringField;
using namespace waveq::engine::v1;

StatusPublisher::StatusPublisher(std::shared_ptr<Transport> transport, PublisherOptions options)
    : transport_(std::move(transport)), options_(options) {
  if (options_.publish_attempts == 0) {
    options_.publish_attempts = 1;
  }
}

std::string StatusPublisher::Topic(const std::string& request_id) {
  return kTopicPrefix + request_id;
}

StatusEvent StatusPublisher::BuildEvent(const db::model::RequestRecord& record, const std::optional<store::StepMarker>& step) {
  StatusEvent event;
  event.set_id(record.id);
  event.set_status(record.status);
  event.set_total_steps(static_cast<int32_t>(record.operations.size()));
  event.set_updated_at_ms(record.updated_at_ms);

  if (step) {
    event.set_has_step(true);
    event.set_current_step(step->index);
    event.set_current_kind(step->kind);
  }

  if (!record.result_ref.empty()) {
    event.set_result_ref(record.result_ref);
  }
  if (record.error) {
    *event.mutable_error() = *record.error;
  }
  return event;
}

std::string StatusPublisher::ToJson(const StatusEvent& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode status event: " + std::string(status.message()));
  }
  return json;
}

StatusEvent StatusPublisher::FromJson(const std::string& json) {
  StatusEvent event;
  auto        status = google::protobuf::util::JsonStringToMessage(json, &event);
  if (!status.ok()) {
    throw std::runtime_error("decode status event: " + std::string(status.message()));
  }
  return event;
}

bool StatusPublisher::Publish(const std::string& request_id, const StatusEvent& event) {
  const auto topic   = Topic(request_id);
  const auto payload = ToJson(event);

  for (uint32_t attempt = 1; attempt <= options_.publish_attempts; ++attempt) {
    if (transport_->Publish(topic, payload)) {
      return true;
    }
    WAVEQ_LOG_WARN("status publish failed", {StringField("topic", topic), IntField("attempt", attempt)});
  }

  WAVEQ_LOG_ERROR("status event dropped", {StringField("topic", topic), IntField("attempts", options_.publish_attempts)});
  return false;
}

void StatusPublisher::OnTransition(const store::RequestEvent& event) {
  if (event.progress && !options_.progress_events) {
    return;
  }
  try {
    Publish(event.record.id, BuildEvent(event.record, event.step));
  } catch (const std::exception& e) {
    // the transition is committed either way; a lost event is logged
    WAVEQ_LOG_ERROR("status event not published", {RequestField(event.record.id), StringField("error", e.what())});
  }
}

} // namespace waveq::status
