// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tpm_hierarchy_probe/hierarchy_probe.h"

#include <algorithm>

#include <base/check.h>
#include <base/logging.h>
#include <base/notreached.h>
#include <base/strings/stringprintf.h>

#include "tpm_hierarchy_probe/response_code.h"
#include "tpm_hierarchy_probe/tpm_constants.h"

namespace tpm_hierarchy_probe {

std::string GetClearPlatformCommand() {
  return std::string(kClearPlatformCommand.begin(),
                     kClearPlatformCommand.end());
}

std::optional<uint32_t> ParseResponseCode(const std::string& response) {
  std::optional<ResponseHeader> header = ParseResponseHeader(response);
  if (!header) {
    return std::nullopt;
  }
  return header->response_code;
}

bool IsExpectedResponseCode(uint32_t response_code) {
  return std::find(kExpectedResponseCodes.begin(), kExpectedResponseCodes.end(),
                   response_code) != kExpectedResponseCodes.end();
}

ProbeOutcome ClassifyResponseCode(uint32_t response_code) {
  return {.result = IsExpectedResponseCode(response_code)
                        ? ProbeResult::kSucceeded
                        : ProbeResult::kUnexpectedResponse,
          .response_code = response_code};
}

ProbeOutcome ClassifyResponse(const std::string& response) {
  std::optional<uint32_t> response_code = ParseResponseCode(response);
  if (!response_code) {
    return {.result = ProbeResult::kInvalidResponseLength};
  }
  return ClassifyResponseCode(*response_code);
}

std::string FormatOutcome(const ProbeOutcome& outcome) {
  switch (outcome.result) {
    case ProbeResult::kSucceeded:
      return "succeeded";
    case ProbeResult::kUnexpectedResponse:
      return base::StringPrintf("failed - unexpected response: 0x%08X",
                                outcome.response_code);
    case ProbeResult::kInvalidResponseLength:
      return "failed - invalid response length";
  }
  NOTREACHED();
  return std::string();
}

PlatformHierarchyProbe::PlatformHierarchyProbe(TpmHandleInterface* tpm_handle)
    : tpm_handle_(tpm_handle) {
  CHECK(tpm_handle_);
}

std::optional<ProbeOutcome> PlatformHierarchyProbe::Run() {
  std::string response;
  if (!tpm_handle_->SendCommandAndWait(GetClearPlatformCommand(),
                                       &response)) {
    LOG(ERROR) << "TPM2_Clear(TPM_RH_PLATFORM) could not be sent";
    return std::nullopt;
  }

  std::optional<ResponseHeader> header = ParseResponseHeader(response);
  if (!header) {
    LOG(WARNING) << "Response of " << response.size()
                 << " bytes is shorter than the TPM response header";
    return ProbeOutcome{.result = ProbeResult::kInvalidResponseLength};
  }
  VLOG(1) << "Response tag=0x" << std::hex << header->tag
          << " size=" << std::dec << header->size
          << " code=" << DescribeResponseCode(header->response_code);

  ProbeOutcome outcome = ClassifyResponseCode(header->response_code);
  if (outcome.result == ProbeResult::kSucceeded) {
    LOG(INFO) << "Platform hierarchy rejected TPM2_Clear with "
              << DescribeResponseCode(outcome.response_code);
  } else {
    LOG(ERROR) << "Platform hierarchy answered TPM2_Clear with "
               << DescribeResponseCode(outcome.response_code);
  }
  return outcome;
}

}  // namespace tpm_hierarchy_probe
