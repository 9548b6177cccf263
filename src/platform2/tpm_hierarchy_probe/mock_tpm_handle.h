// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TPM_HIERARCHY_PROBE_MOCK_TPM_HANDLE_H_
#define TPM_HIERARCHY_PROBE_MOCK_TPM_HANDLE_H_

#include <string>

#include <gmock/gmock.h>

#include "tpm_hierarchy_probe/tpm_handle.h"

namespace tpm_hierarchy_probe {

class MockTpmHandle : public TpmHandleInterface {
 public:
  MockTpmHandle() = default;
  ~MockTpmHandle() override = default;

  MOCK_METHOD(bool, Init, (), (override));
  MOCK_METHOD(bool,
              SendCommandAndWait,
              (const std::string&, std::string*),
              (override));
};

}  // namespace tpm_hierarchy_probe

#endif  // TPM_HIERARCHY_PROBE_MOCK_TPM_HANDLE_H_
