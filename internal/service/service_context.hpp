#pragma once

#include <memory>

namespace warranty::core {
class BatchEngine;
class WarrantyRegistry;
class ClaimWorkflow;
class RepairTicketEngine;
class AttachmentCustodian;
class PublicValidator;
}
namespace warranty::util { class Clock; }

namespace warranty::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<warranty::core::BatchEngine>         batches;
  std::shared_ptr<warranty::core::WarrantyRegistry>    registry;
  std::shared_ptr<warranty::core::ClaimWorkflow>       claims;
  std::shared_ptr<warranty::core::RepairTicketEngine>  tickets;
  std::shared_ptr<warranty::core::AttachmentCustodian> attachments;
  std::shared_ptr<warranty::core::PublicValidator>     validator;
  std::shared_ptr<warranty::util::Clock>               clock;
};

}
