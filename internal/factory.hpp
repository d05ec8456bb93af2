#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/interpreter/instruction_interpreter.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/scheduler/request_scheduler.hpp"
#include "internal/service/intake_listener.hpp"
#include "internal/service/request_service.hpp"
#include "internal/status/status_publisher.hpp"
#include "internal/storage/audio_store.hpp"
#include "internal/store/request_store.hpp"

namespace waveq::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<store::RequestStore>            store;
  std::shared_ptr<scheduler::RequestScheduler>    scheduler;
  std::shared_ptr<storage::AudioStore>            audio_store;
  std::shared_ptr<status::Transport>              transport;
  std::shared_ptr<status::StatusPublisher>        publisher;
  std::shared_ptr<interpreter::InstructionInterpreter> interpreter;
  std::shared_ptr<pipeline::PipelineExecutor>     executor;
  std::shared_ptr<pipeline::WorkerPool>           workers;
  std::shared_ptr<service::RequestService>        request_service;
  std::shared_ptr<service::IntakeListener>        intake;

  std::vector<std::unique_ptr<grpc::Service>> grpc_services;

  // Workers first, then intake, so intake traffic is dispatched at once.
  void Start();
  void Stop();
};

/*
  Build

  Constructs the entire engine based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
Application Build(const waveq::runtime::config::RuntimeConfig& config);

// Memory unless the sqlite backend is configured.
std::shared_ptr<db::Repository> BuildRepository(const waveq::runtime::config::DatabaseConfig& database);

}
