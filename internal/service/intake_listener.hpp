#pragma once

#include <memory>
#include <string>

#include "internal/status/transport.hpp"
#include "request_service.hpp"

namespace waveq::service {

/*
  Accepts JSON SubmitRequest messages on the intake topic.

  Each message goes through RequestService::Submit. A rejected message that
  carries an id gets an error snapshot on audio/status/<id>; one without an
  id can only be logged.
*/
class IntakeListener {
public:
  IntakeListener(std::shared_ptr<RequestService> service, std::shared_ptr<waveq::status::Transport> transport, std::string topic);
  ~IntakeListener();

  void Start();
  void Stop();

  // Handles one message; exposed for direct use by tests.
  void OnMessage(const std::string& payload);

private:
  void Reject(const std::string& id, waveq::engine::v1::ErrorKind kind, const std::string& message, int operation_index);

  std::shared_ptr<RequestService>           service_;
  std::shared_ptr<waveq::status::Transport> transport_;
  std::string                               topic_;

  waveq::status::Transport::SubscriptionId subscription_ = 0;
};

}
