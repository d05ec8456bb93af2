#pragma once

#include <memory>

namespace waveq::catalog { class OperationCatalog; }
namespace waveq::interpreter { class InstructionInterpreter; }
namespace waveq::scheduler { class RequestScheduler; }
namespace waveq::status { class StatusPublisher; class Transport; }
namespace waveq::storage { class AudioStore; }
namespace waveq::store { class RequestStore; }

namespace waveq::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  const waveq::catalog::OperationCatalog*                  catalog = nullptr;
  std::shared_ptr<waveq::interpreter::InstructionInterpreter> interpreter;
  std::shared_ptr<waveq::store::RequestStore>              store;
  std::shared_ptr<waveq::scheduler::RequestScheduler>      scheduler;
  std::shared_ptr<waveq::storage::AudioStore>              audio_store;
  std::shared_ptr<waveq::status::StatusPublisher>          publisher;
  std::shared_ptr<waveq::status::Transport>                transport;
};

}
