#include "intake_listener.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/status/status_publisher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace waveq::service {

using namespace waveq::engine::v1;
using waveq::observability::IntField;
using waveq::observability::RequestField;
using waveq::observability::StringField;

IntakeListener::IntakeListener(std::shared_ptr<RequestService> service, std::shared_ptr<waveq::status::Transport> transport, std::string topic)
    : service_(std::move(service)), transport_(std::move(transport)), topic_(std::move(topic)) {
}

IntakeListener::~IntakeListener() {
  Stop();
}

void IntakeListener::Start() {
  if (subscription_ != 0) {
    return;
  }
  subscription_ = transport_->Subscribe(topic_, [this](const std::string&, const std::string& payload) { OnMessage(payload); });
  WAVEQ_LOG_INFO("Intake listener subscribed", {StringField("topic", topic_)});
}

void IntakeListener::Stop() {
  if (subscription_ == 0) {
    return;
  }
  transport_->Unsubscribe(subscription_);
  subscription_ = 0;
}

void IntakeListener::OnMessage(const std::string& payload) {
  SubmitRequest req;
  auto          parsed = google::protobuf::util::JsonStringToMessage(payload, &req);
  if (!parsed.ok()) {
    WAVEQ_LOG_WARN("Intake message rejected", {StringField("topic", topic_), StringField("error", std::string(parsed.message()))});
    return;
  }

  try {
    auto resp = service_->Submit(req);
    WAVEQ_LOG_DEBUG("Intake message submitted", {RequestField(resp.request().id())});
  } catch (const waveq::util::ValidationError& ex) {
    Reject(req.id(), ERROR_KIND_VALIDATION, ex.what(), ex.operation_index());
  } catch (const waveq::util::AdmissionError& ex) {
    Reject(req.id(), ERROR_KIND_ADMISSION, ex.what(), -1);
  } catch (const waveq::util::AlreadyExists& ex) {
    WAVEQ_LOG_WARN("Intake message rejected", {RequestField(req.id()), StringField("error", ex.what())});
  }
}

void IntakeListener::Reject(const std::string& id, ErrorKind kind, const std::string& message, int operation_index) {
  if (id.empty()) {
    WAVEQ_LOG_WARN("Intake message rejected", {StringField("error", message), IntField("operation_index", operation_index)});
    return;
  }

  StatusEvent event;
  event.set_id(id);
  event.set_status(REQUEST_STATUS_ERROR);
  event.set_updated_at_ms(waveq::util::NowMillis());
  auto* error = event.mutable_error();
  error->set_kind(kind);
  error->set_message(message);
  error->set_operation_index(operation_index);

  const auto topic = waveq::status::StatusPublisher::Topic(id);
  if (!transport_->Publish(topic, waveq::status::StatusPublisher::ToJson(event))) {
    WAVEQ_LOG_ERROR("Intake rejection not delivered", {RequestField(id), StringField("error", message)});
  }
}

}
