// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tpm_hierarchy_probe/tpm_handle.h"

#include <fcntl.h>
#include <unistd.h>

#include <vector>

#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>

#include "tpm_hierarchy_probe/tpm_constants.h"

namespace tpm_hierarchy_probe {

TpmHandle::TpmHandle(const base::FilePath& device_path)
    : device_path_(device_path) {}

bool TpmHandle::Init() {
  if (fd_.is_valid()) {
    return true;
  }
  fd_.reset(
      HANDLE_EINTR(open(device_path_.value().c_str(), O_RDWR | O_CLOEXEC)));
  if (!fd_.is_valid()) {
    PLOG(ERROR) << "Failed to open " << device_path_.value();
    return false;
  }
  VLOG(1) << "Opened " << device_path_.value();
  return true;
}

bool TpmHandle::SendCommandAndWait(const std::string& command,
                                   std::string* response) {
  if (!fd_.is_valid()) {
    LOG(ERROR) << "TPM device " << device_path_.value() << " is not open";
    return false;
  }

  ssize_t written =
      HANDLE_EINTR(write(fd_.get(), command.data(), command.size()));
  if (written < 0) {
    PLOG(ERROR) << "Failed to write command to " << device_path_.value();
    return false;
  }
  if (static_cast<size_t>(written) != command.size()) {
    LOG(ERROR) << "Short write to " << device_path_.value() << ": "
               << written << " of " << command.size() << " bytes";
    return false;
  }
  VLOG(1) << "Sent " << written << " bytes";

  std::vector<char> buffer(kTpmBufferSize);
  ssize_t read_size =
      HANDLE_EINTR(read(fd_.get(), buffer.data(), buffer.size()));
  if (read_size < 0) {
    PLOG(ERROR) << "Failed to read response from " << device_path_.value();
    return false;
  }
  VLOG(1) << "Received " << read_size << " bytes";

  response->assign(buffer.data(), read_size);
  return true;
}

}  // namespace tpm_hierarchy_probe
