#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "warranty/services/v1/barcode_service.grpc.pb.h"
#include "warranty/services/v1/batch_service.grpc.pb.h"
#include "warranty/services/v1/claim_service.grpc.pb.h"
#include "warranty/services/v1/public_warranty_service.grpc.pb.h"
#include "warranty/v1.hpp"

using namespace warranty::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  warrantyctl <addr> batch create <product_id> <quantity> [prefix]\n"
            << "  warrantyctl <addr> batch start <batch_id>\n"
            << "  warrantyctl <addr> batch progress <batch_id>\n"
            << "  warrantyctl <addr> batch cancel <batch_id> [reason] [--force]\n"
            << "  warrantyctl <addr> batch list [status]\n"
            << "  warrantyctl <addr> barcode activate <barcode> <customer_id> <customer_email>\n"
            << "  warrantyctl <addr> barcode revoke <barcode> <reason>\n"
            << "  warrantyctl <addr> barcode get <barcode>\n"
            << "  warrantyctl <addr> validate <barcode> [sku]\n"
            << "  warrantyctl <addr> coverage <barcode> <issue_type>\n"
            << "  warrantyctl <addr> claim get <claim_id>\n"
            << "  warrantyctl <addr> claim timeline <claim_id>\n"
            << "\n"
            << "The caller is WARRANTYCTL_ACTOR (default warrantyctl) with role WARRANTYCTL_ROLE (default admin).\n";
}

static std::string EnvOr(const char* name, const char* fallback) {
  const char* value = std::getenv(name);
  return value && *value ? value : fallback;
}

static RequestMeta Meta() {
  RequestMeta meta;
  meta.mutable_caller()->set_actor_id(EnvOr("WARRANTYCTL_ACTOR", "warrantyctl"));
  meta.mutable_caller()->add_roles(EnvOr("WARRANTYCTL_ROLE", "admin"));
  return meta;
}

static int Print(const ::grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    ErrorDetail detail;
    if (detail.ParseFromString(status.error_details()) && !detail.kind().empty()) {
      std::cerr << detail.kind() << ": " << status.error_message() << "\n";
      for (const auto& v : detail.violations()) std::cerr << "  " << v.field() << ": " << v.message() << "\n";
      if (!detail.current_state().empty()) std::cerr << "  current_state=" << detail.current_state() << "\n";
    } else {
      std::cerr << status.error_message() << "\n";
    }
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(resp, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];
  const std::string sub  = argc > 3 ? argv[3] : "";

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto batch_stub   = BatchService::NewStub(channel);
  auto barcode_stub = BarcodeService::NewStub(channel);
  auto claim_stub   = ClaimService::NewStub(channel);
  auto public_stub  = PublicWarrantyService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "batch") {
    if (sub == "create" && argc >= 6) {
      CreateBatchRequest req;
      *req.mutable_meta() = Meta();
      req.set_product_id(argv[4]);
      req.set_quantity(static_cast<uint32_t>(std::stoul(argv[5])));
      if (argc >= 7) req.set_prefix(argv[6]);
      CreateBatchResponse resp;
      return Print(batch_stub->CreateBatch(&ctx, req, &resp), resp);
    }
    if (sub == "start" && argc >= 5) {
      StartBatchRequest req;
      *req.mutable_meta() = Meta();
      req.set_batch_id(argv[4]);
      StartBatchResponse resp;
      return Print(batch_stub->StartBatch(&ctx, req, &resp), resp);
    }
    if (sub == "progress" && argc >= 5) {
      GetBatchProgressRequest req;
      *req.mutable_meta() = Meta();
      req.set_batch_id(argv[4]);
      GetBatchProgressResponse resp;
      return Print(batch_stub->GetBatchProgress(&ctx, req, &resp), resp);
    }
    if (sub == "cancel" && argc >= 5) {
      CancelBatchRequest req;
      *req.mutable_meta() = Meta();
      req.set_batch_id(argv[4]);
      for (int i = 5; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--force") {
          req.set_force(true);
        } else {
          req.set_reason(arg);
        }
      }
      CancelBatchResponse resp;
      return Print(batch_stub->CancelBatch(&ctx, req, &resp), resp);
    }
    if (sub == "list") {
      ListBatchesRequest req;
      *req.mutable_meta() = Meta();
      if (argc >= 5) req.set_status(argv[4]);
      ListBatchesResponse resp;
      return Print(batch_stub->ListBatches(&ctx, req, &resp), resp);
    }
  }

  // ------------------------------------------------------------

  if (cmd == "barcode") {
    if (sub == "activate" && argc >= 7) {
      ActivateWarrantyRequest req;
      *req.mutable_meta() = Meta();
      req.set_barcode(argv[4]);
      req.set_customer_id(argv[5]);
      req.set_customer_email(argv[6]);
      ActivateWarrantyResponse resp;
      return Print(barcode_stub->ActivateWarranty(&ctx, req, &resp), resp);
    }
    if (sub == "revoke" && argc >= 6) {
      RevokeBarcodeRequest req;
      *req.mutable_meta() = Meta();
      req.set_barcode(argv[4]);
      req.set_reason(argv[5]);
      RevokeBarcodeResponse resp;
      return Print(barcode_stub->RevokeBarcode(&ctx, req, &resp), resp);
    }
    if (sub == "get" && argc >= 5) {
      GetBarcodeRequest req;
      *req.mutable_meta() = Meta();
      req.set_barcode(argv[4]);
      GetBarcodeResponse resp;
      return Print(barcode_stub->GetBarcode(&ctx, req, &resp), resp);
    }
  }

  // ------------------------------------------------------------

  if (cmd == "validate" && argc >= 4) {
    ValidateWarrantyRequest req;
    req.set_barcode(argv[3]);
    if (argc >= 5) req.set_sku(argv[4]);
    ValidateWarrantyResponse resp;
    return Print(public_stub->ValidateWarranty(&ctx, req, &resp), resp);
  }

  if (cmd == "coverage" && argc >= 5) {
    CheckCoverageRequest req;
    req.set_barcode(argv[3]);
    req.set_issue_type(argv[4]);
    CheckCoverageResponse resp;
    return Print(public_stub->CheckCoverage(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    if (sub == "get" && argc >= 5) {
      GetClaimRequest req;
      *req.mutable_meta() = Meta();
      req.set_claim_id(argv[4]);
      GetClaimResponse resp;
      return Print(claim_stub->GetClaim(&ctx, req, &resp), resp);
    }
    if (sub == "timeline" && argc >= 5) {
      GetClaimTimelineRequest req;
      *req.mutable_meta() = Meta();
      req.set_claim_id(argv[4]);
      GetClaimTimelineResponse resp;
      return Print(claim_stub->GetClaimTimeline(&ctx, req, &resp), resp);
    }
  }

  Usage();
  return 1;
}
