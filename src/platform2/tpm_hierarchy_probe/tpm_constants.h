// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TPM_HIERARCHY_PROBE_TPM_CONSTANTS_H_
#define TPM_HIERARCHY_PROBE_TPM_CONSTANTS_H_

#include <array>
#include <cstddef>
#include <cstdint>

namespace tpm_hierarchy_probe {

// Resource-managed TPM character device.
inline constexpr char kDefaultTpmDevicePath[] = "/dev/tpmrm0";

// Largest command or response the TPM is allowed to produce.
inline constexpr size_t kTpmBufferSize = 4096;

// Every TPM 2.0 response starts with tag(2) + size(4) + responseCode(4).
inline constexpr size_t kResponseHeaderSize = 10;
inline constexpr size_t kResponseCodeOffset = 6;

inline constexpr uint16_t TPM_ST_NO_SESSIONS = 0x8001;
inline constexpr uint32_t TPM_CC_Clear = 0x00000126;
inline constexpr uint32_t TPM_RH_PLATFORM = 0x4000000C;

// Response codes, TPM 2.0 Part 2 section 6.6.
inline constexpr uint32_t TPM_RC_SUCCESS = 0x000;
inline constexpr uint32_t TPM_RC_HIERARCHY = 0x085;
inline constexpr uint32_t TPM_RC_AUTH_FAIL = 0x08E;
inline constexpr uint32_t TPM_RC_COMMAND_CODE = 0x143;

// Qualifier bits combined into TPM_RC_HIERARCHY_P1 below. These are the
// values the guest acceptance test has always used; response_code.h decodes
// codes with the TPM 2.0 Part 2 layout instead.
inline constexpr uint32_t TPM_RC_FORMAT_ONE_MASK = 0x080;
inline constexpr uint32_t TPM_RC_P = 0x100;
inline constexpr uint32_t TPM_RC_H = 0x000;
inline constexpr uint32_t TPM_RC_S = 0x800;
inline constexpr uint32_t TPM_RC_1 = 0x001;

// TPM_RC_HIERARCHY reported against parameter 1, the platform handle.
inline constexpr uint32_t TPM_RC_HIERARCHY_P1 =
    TPM_RC_HIERARCHY | TPM_RC_FORMAT_ONE_MASK | TPM_RC_P | TPM_RC_1;
static_assert(TPM_RC_HIERARCHY_P1 == 0x185,
              "TPM_RC_HIERARCHY_P1 must be 0x0185");

// TPM2_Clear(authHandle = TPM_RH_PLATFORM) without sessions.
inline constexpr std::array<uint8_t, 14> kClearPlatformCommand = {
    0x80, 0x01,              // TPM_ST_NO_SESSIONS
    0x00, 0x00, 0x00, 0x0E,  // commandSize = 14
    0x00, 0x00, 0x01, 0x26,  // TPM_CC_Clear
    0x40, 0x00, 0x00, 0x0C,  // TPM_RH_PLATFORM
};
static_assert(kClearPlatformCommand.size() == 0x0E,
              "commandSize must match the buffer length");

// Response codes accepted as "the platform hierarchy is not reachable".
inline constexpr std::array<uint32_t, 4> kExpectedResponseCodes = {
    TPM_RC_HIERARCHY,
    TPM_RC_HIERARCHY_P1,
    TPM_RC_AUTH_FAIL,
    TPM_RC_COMMAND_CODE,
};

}  // namespace tpm_hierarchy_probe

#endif  // TPM_HIERARCHY_PROBE_TPM_CONSTANTS_H_
