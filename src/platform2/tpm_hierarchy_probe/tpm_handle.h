// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TPM_HIERARCHY_PROBE_TPM_HANDLE_H_
#define TPM_HIERARCHY_PROBE_TPM_HANDLE_H_

#include <string>

#include <base/files/file_path.h>
#include <base/files/scoped_file.h>
#include <brillo/brillo_export.h>

namespace tpm_hierarchy_probe {

// Synchronous command/response exchange with a TPM.
class TpmHandleInterface {
 public:
  virtual ~TpmHandleInterface() = default;

  // Opens the underlying device. Returns false if it cannot be opened.
  virtual bool Init() = 0;

  // Writes |command| in a single write and stores what a single read returns
  // in |response|. Returns false on any transport failure, in which case
  // |response| is left untouched.
  virtual bool SendCommandAndWait(const std::string& command,
                                  std::string* response) = 0;
};

// TpmHandleInterface backed by a TPM character device such as /dev/tpmrm0.
// The descriptor is closed when the handle goes out of scope.
class BRILLO_EXPORT TpmHandle : public TpmHandleInterface {
 public:
  explicit TpmHandle(const base::FilePath& device_path);
  TpmHandle(const TpmHandle&) = delete;
  TpmHandle& operator=(const TpmHandle&) = delete;

  ~TpmHandle() override = default;

  bool Init() override;
  bool SendCommandAndWait(const std::string& command,
                          std::string* response) override;

 private:
  const base::FilePath device_path_;
  base::ScopedFD fd_;
};

}  // namespace tpm_hierarchy_probe

#endif  // TPM_HIERARCHY_PROBE_TPM_HANDLE_H_
