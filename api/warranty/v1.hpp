#pragma once

#include "warranty/core/v1/attachment.pb.h"
#include "warranty/core/v1/barcode.pb.h"
#include "warranty/core/v1/batch.pb.h"
#include "warranty/core/v1/claim.pb.h"
#include "warranty/core/v1/common.pb.h"
#include "warranty/core/v1/public.pb.h"
#include "warranty/core/v1/repair.pb.h"

#include "warranty/services/v1/attachment_service.pb.h"
#include "warranty/services/v1/barcode_service.pb.h"
#include "warranty/services/v1/batch_service.pb.h"
#include "warranty/services/v1/claim_service.pb.h"
#include "warranty/services/v1/public_warranty_service.pb.h"
#include "warranty/services/v1/repair_ticket_service.pb.h"

#include "warranty/services/v1/attachment_service.grpc.pb.h"
#include "warranty/services/v1/barcode_service.grpc.pb.h"
#include "warranty/services/v1/batch_service.grpc.pb.h"
#include "warranty/services/v1/claim_service.grpc.pb.h"
#include "warranty/services/v1/public_warranty_service.grpc.pb.h"
#include "warranty/services/v1/repair_ticket_service.grpc.pb.h"

namespace warranty::v1 {
using namespace ::warranty::core::v1;
using namespace ::warranty::services::v1;
}
