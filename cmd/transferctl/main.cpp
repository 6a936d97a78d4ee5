#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "transfer/manager/services/v1/transfer_service.grpc.pb.h"
#include "transfer/manager/v1.hpp"

using namespace transfer::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  transferctl <addr> initiate-client <connector_addr> <source_path> <dest_path> [protocol=grpc]\n"
            << "  transferctl <addr> initiate-provider <source_path> <dest_path>\n"
            << "  transferctl <addr> get <process_id>\n"
            << "  transferctl <addr> list [state] [limit]\n";
}

static DataAddress FileAddress(const std::string& path) {
  DataAddress address;
  address.set_type("file");
  (*address.mutable_properties())["path"] = path;
  return address;
}

static DataRequest MakeFileRequest(const std::string& source_path, const std::string& dest_path) {
  DataRequest request;
  request.set_destination_type("file");
  *request.mutable_data_entry()->mutable_catalog_address() = FileAddress(source_path);
  *request.mutable_data_destination()                      = FileAddress(dest_path);
  return request;
}

static std::optional<TransferProcessState> ParseState(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  TransferProcessState state;
  if (!TransferProcessState_Parse("TRANSFER_PROCESS_STATE_" + value, &state)) {
    return std::nullopt;
  }
  return state;
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int PrintInitiate(const grpc::Status& status, const TransferInitiateResponse& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  std::cout << "id=" << resp.id() << " status=" << ResponseStatus_Name(resp.status()) << "\n";
  return resp.status() == RESPONSE_STATUS_OK ? 0 : 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TransferService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "initiate-client") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    InitiateTransferRequest req;
    *req.mutable_data_request() = MakeFileRequest(argv[4], argv[5]);
    req.mutable_data_request()->set_connector_address(argv[3]);
    req.mutable_data_request()->set_protocol(argc >= 7 ? argv[6] : "grpc");

    TransferInitiateResponse resp;
    return PrintInitiate(stub->InitiateClientRequest(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "initiate-provider") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    InitiateTransferRequest req;
    *req.mutable_data_request() = MakeFileRequest(argv[3], argv[4]);

    TransferInitiateResponse resp;
    return PrintInitiate(stub->InitiateProviderRequest(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetTransferProcessRequest req;
    req.set_id(argv[3]);

    GetTransferProcessResponse resp;

    auto status = stub->GetTransferProcess(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintJson(resp.process());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListTransferProcessesRequest req;
    if (argc >= 4) {
      auto state = ParseState(argv[3]);
      if (!state) {
        std::cerr << "unknown state: " << argv[3] << "\n";
        return 1;
      }
      req.set_state(*state);
    }
    if (argc >= 5) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));
    }

    ListTransferProcessesResponse resp;

    auto status = stub->ListTransferProcesses(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& process : resp.processes()) {
      std::cout << process.id() << " " << TransferType_Name(process.type()) << " " << TransferProcessState_Name(process.state());
      if (!process.error_detail().empty()) {
        std::cout << " error=\"" << process.error_detail() << "\"";
      }
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
