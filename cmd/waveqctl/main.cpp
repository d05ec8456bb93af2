#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "internal/catalog/operation_catalog.hpp"
#include "internal/interpreter/flow_loader.hpp"
#include "internal/model/state_machine.hpp"
#include "waveq/engine/v1.hpp"

using namespace waveq::engine::v1;

// Matches the engine's default server.max_message_bytes.
constexpr int kMaxMessageBytes = 64 * 1024 * 1024;

static void Usage() {
  std::cout << "Usage:\n"
            << "  waveqctl <addr> submit <src[,src...]> '<operations json>' [priority] [client_id]\n"
            << "  waveqctl <addr> ask <src[,src...]> '<instruction>' [priority] [client_id]\n"
            << "  waveqctl <addr> submit-flow <flow.yaml>\n"
            << "  waveqctl <addr> get <id>\n"
            << "  waveqctl <addr> list [client_id] [status] [limit]\n"
            << "  waveqctl <addr> cancel <id>\n"
            << "  waveqctl <addr> delete <id>\n"
            << "  waveqctl <addr> stats\n"
            << "  waveqctl <addr> describe\n"
            << "  waveqctl <addr> upload <file.wav>\n"
            << "  waveqctl <addr> fetch <id> <out_file>\n"
            << "  waveqctl <addr> watch <id>\n"
            << "\n"
            << "priority: 1..5 or urgent|high|normal|low|background\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static void AddSources(const std::string& list, SubmitRequest* req) {
  std::stringstream ss(list);
  std::string       source;
  while (std::getline(ss, source, ',')) {
    if (!source.empty()) req->add_sources(source);
  }
}

static void SetPriority(const std::string& value, SubmitRequest* req) {
  if (!value.empty() && value.find_first_not_of("0123456789") == std::string::npos) {
    req->set_priority(std::stoi(value));
  } else {
    req->set_priority_name(value);
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static int Submit(RequestService::Stub& stub, const SubmitRequest& req) {
  grpc::ClientContext ctx;
  SubmitResponse      resp;

  auto status = stub.Submit(&ctx, req, &resp);
  if (!status.ok()) {
    return Fail(status);
  }

  std::cout << "id=" << resp.request().id() << "\n";
  std::cout << "priority=" << resp.request().priority() << "\n";
  std::cout << "operations=" << resp.request().operations_size() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  grpc::ChannelArguments channel_args;
  channel_args.SetMaxReceiveMessageSize(kMaxMessageBytes);
  channel_args.SetMaxSendMessageSize(kMaxMessageBytes);
  auto channel = grpc::CreateCustomChannel(addr, grpc::InsecureChannelCredentials(), channel_args);
  auto stub    = RequestService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) return 1;

    SubmitRequest req;
    auto          parsed = google::protobuf::util::JsonStringToMessage("{\"operations\":" + std::string(argv[4]) + "}", &req);
    if (!parsed.ok()) {
      std::cerr << "invalid operations json: " << parsed.message() << "\n";
      return 1;
    }
    AddSources(argv[3], &req);
    if (argc >= 6) SetPriority(argv[5], &req);
    if (argc >= 7) req.set_client_id(argv[6]);

    return Submit(*stub, req);
  }

  // ------------------------------------------------------------

  if (cmd == "ask") {
    if (argc < 5) return 1;

    SubmitRequest req;
    AddSources(argv[3], &req);
    req.set_instruction(argv[4]);
    if (argc >= 6) SetPriority(argv[5], &req);
    if (argc >= 7) req.set_client_id(argv[6]);

    return Submit(*stub, req);
  }

  // ------------------------------------------------------------

  if (cmd == "submit-flow") {
    if (argc < 4) return 1;

    SubmitRequest req;
    try {
      waveq::interpreter::FlowLoader loader(waveq::catalog::OperationCatalog::Default());
      req = loader.LoadFile(argv[3]);
    } catch (const std::exception& e) {
      std::cerr << "invalid flow: " << e.what() << "\n";
      return 1;
    }

    return Submit(*stub, req);
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRequestRequest req;
    req.set_id(argv[3]);

    GetRequestResponse resp;

    auto status = stub->GetRequest(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << ToJson(resp.request()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListRequestsRequest req;
    if (argc >= 4) req.set_client_id(argv[3]);
    if (argc >= 5) {
      auto status_filter = waveq::model::ParseStatus(argv[4]);
      if (status_filter == REQUEST_STATUS_UNSPECIFIED) {
        std::cerr << "unknown status: " << argv[4] << "\n";
        return 1;
      }
      req.set_status(status_filter);
    }
    if (argc >= 6) req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

    ListRequestsResponse resp;

    auto status = stub->ListRequests(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& request : resp.requests()) {
      std::cout << request.id() << " " << waveq::model::StatusName(request.status()) << " priority=" << request.priority()
                << " client=" << request.client_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelRequestRequest req;
    req.set_id(argv[3]);

    CancelRequestResponse resp;

    auto status = stub->CancelRequest(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "status=" << waveq::model::StatusName(resp.request().status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteRequestRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = stub->DeleteRequest(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->GetStats(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "total=" << resp.total() << "\n";
    std::cout << "queued=" << resp.queued() << "\n";
    std::cout << "processing=" << resp.processing() << "\n";
    std::cout << "completed=" << resp.completed() << "\n";
    std::cout << "failed=" << resp.failed() << "\n";
    std::cout << "cancelled=" << resp.cancelled() << "\n";
    std::cout << "avg_processing_ms=" << resp.avg_processing_ms() << "\n";
    std::cout << "success_rate=" << resp.success_rate() << "\n";
    std::cout << "queue_depth=" << resp.queue_depth() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "describe") {
    DescribeOperationsRequest  req;
    DescribeOperationsResponse resp;

    auto status = stub->DescribeOperations(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& op : resp.operations()) {
      std::cout << ToJson(op) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3], std::ios::binary);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }

    UploadAudioRequest req;
    req.set_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));

    UploadAudioResponse resp;

    auto status = stub->UploadAudio(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "source_ref=" << resp.source_ref() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (argc < 5) return 1;

    FetchResultRequest req;
    req.set_id(argv[3]);

    FetchResultResponse resp;

    auto status = stub->FetchResult(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::ofstream out(argv[4], std::ios::binary | std::ios::trunc);
    out.write(resp.data().data(), static_cast<std::streamsize>(resp.data().size()));
    if (!out) {
      std::cerr << "cannot write " << argv[4] << "\n";
      return 1;
    }

    std::cout << "result_ref=" << resp.result_ref() << " bytes=" << resp.data().size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) return 1;

    WatchStatusRequest req;
    req.set_id(argv[3]);

    auto        reader = stub->WatchStatus(&ctx, req);
    StatusEvent event;
    while (reader->Read(&event)) {
      std::cout << ToJson(event) << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      return Fail(status);
    }
    return 0;
  }

  Usage();
  return 1;
}
