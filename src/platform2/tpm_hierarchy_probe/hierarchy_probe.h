// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TPM_HIERARCHY_PROBE_HIERARCHY_PROBE_H_
#define TPM_HIERARCHY_PROBE_HIERARCHY_PROBE_H_

#include <cstdint>
#include <optional>
#include <string>

#include <brillo/brillo_export.h>

#include "tpm_hierarchy_probe/tpm_handle.h"

namespace tpm_hierarchy_probe {

enum class ProbeResult {
  // The TPM refused the command with one of kExpectedResponseCodes.
  kSucceeded,
  // The TPM answered with any other code, TPM_RC_SUCCESS included.
  kUnexpectedResponse,
  // The response was too short to carry a response code.
  kInvalidResponseLength,
};

struct ProbeOutcome {
  ProbeResult result;
  // Only meaningful unless |result| is kInvalidResponseLength.
  uint32_t response_code = 0;
};

// Returns the serialized TPM2_Clear(TPM_RH_PLATFORM) command.
BRILLO_EXPORT std::string GetClearPlatformCommand();

// Reads the big-endian response code at bytes 6-9 of |response|. Returns
// std::nullopt if the response is shorter than the 10-byte header.
BRILLO_EXPORT std::optional<uint32_t> ParseResponseCode(
    const std::string& response);

BRILLO_EXPORT bool IsExpectedResponseCode(uint32_t response_code);

BRILLO_EXPORT ProbeOutcome ClassifyResponseCode(uint32_t response_code);

BRILLO_EXPORT ProbeOutcome ClassifyResponse(const std::string& response);

// The single line reported to the caller, without a trailing newline.
BRILLO_EXPORT std::string FormatOutcome(const ProbeOutcome& outcome);

// Checks that the platform hierarchy cannot be used from this side of the
// TPM by issuing TPM2_Clear against it once.
class BRILLO_EXPORT PlatformHierarchyProbe {
 public:
  // |tpm_handle| must outlive this object and already be initialized.
  explicit PlatformHierarchyProbe(TpmHandleInterface* tpm_handle);
  PlatformHierarchyProbe(const PlatformHierarchyProbe&) = delete;
  PlatformHierarchyProbe& operator=(const PlatformHierarchyProbe&) = delete;

  // Sends the command once. Returns std::nullopt if the exchange with the
  // device failed; no retry is attempted.
  std::optional<ProbeOutcome> Run();

 private:
  TpmHandleInterface* tpm_handle_;
};

}  // namespace tpm_hierarchy_probe

#endif  // TPM_HIERARCHY_PROBE_HIERARCHY_PROBE_H_
