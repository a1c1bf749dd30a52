#pragma once

#include <string>

namespace warranty::attachment {

/*
  A queued malware scan.

  storage_ref is the opaque blob reference the uploader handed in.
*/
struct ScanTask {
  std::string attachment_id;
  std::string storage_ref;
};

} // namespace warranty::attachment
