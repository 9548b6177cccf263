// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tpm_hierarchy_probe/response_code.h"

#include <base/big_endian.h>
#include <base/strings/stringprintf.h>

#include "tpm_hierarchy_probe/tpm_constants.h"

namespace tpm_hierarchy_probe {

namespace {

// TPM 2.0 Part 2, table 16.
constexpr uint32_t kRcVer1 = 0x100;
constexpr uint32_t kRcFmt1 = 0x080;
constexpr uint32_t kRcWarn = 0x900;
constexpr uint32_t kRcVendorBit = 0x400;
constexpr uint32_t kFmt1BaseMask = 0x0BF;
constexpr uint32_t kFmt1ParameterBit = 0x040;
constexpr uint32_t kFmt1SessionBit = 0x800;
constexpr uint32_t kFmt1NumberShift = 8;
constexpr uint32_t kFmt1ParameterNumberMask = 0xF;
constexpr uint32_t kFmt1HandleNumberMask = 0x7;

const char* FormatOneName(uint32_t base_code) {
  switch (base_code) {
    case 0x081:
      return "TPM_RC_ASYMMETRIC";
    case 0x082:
      return "TPM_RC_ATTRIBUTES";
    case 0x083:
      return "TPM_RC_HASH";
    case 0x084:
      return "TPM_RC_VALUE";
    case TPM_RC_HIERARCHY:
      return "TPM_RC_HIERARCHY";
    case 0x087:
      return "TPM_RC_KEY_SIZE";
    case 0x08A:
      return "TPM_RC_TYPE";
    case 0x08B:
      return "TPM_RC_HANDLE";
    case 0x08D:
      return "TPM_RC_RANGE";
    case TPM_RC_AUTH_FAIL:
      return "TPM_RC_AUTH_FAIL";
    case 0x08F:
      return "TPM_RC_NONCE";
    case 0x090:
      return "TPM_RC_PP";
    case 0x095:
      return "TPM_RC_SIZE";
    case 0x097:
      return "TPM_RC_TAG";
    case 0x09A:
      return "TPM_RC_INSUFFICIENT";
    case 0x09D:
      return "TPM_RC_POLICY_FAIL";
    case 0x0A2:
      return "TPM_RC_BAD_AUTH";
  }
  return nullptr;
}

const char* FormatZeroName(uint32_t code) {
  switch (code) {
    case TPM_RC_SUCCESS:
      return "TPM_RC_SUCCESS";
    case 0x100:
      return "TPM_RC_INITIALIZE";
    case 0x101:
      return "TPM_RC_FAILURE";
    case 0x120:
      return "TPM_RC_DISABLED";
    case 0x124:
      return "TPM_RC_AUTH_TYPE";
    case 0x125:
      return "TPM_RC_AUTH_MISSING";
    case 0x126:
      return "TPM_RC_POLICY";
    case 0x12F:
      return "TPM_RC_AUTH_UNAVAILABLE";
    case 0x142:
      return "TPM_RC_COMMAND_SIZE";
    case TPM_RC_COMMAND_CODE:
      return "TPM_RC_COMMAND_CODE";
    case 0x144:
      return "TPM_RC_AUTHSIZE";
    case 0x153:
      return "TPM_RC_NEEDS_TEST";
    case 0x903:
      return "TPM_RC_SESSION_MEMORY";
    case 0x904:
      return "TPM_RC_MEMORY";
    case 0x908:
      return "TPM_RC_YIELDED";
    case 0x909:
      return "TPM_RC_CANCELED";
    case 0x90A:
      return "TPM_RC_TESTING";
    case 0x921:
      return "TPM_RC_LOCKOUT";
    case 0x922:
      return "TPM_RC_RETRY";
  }
  return nullptr;
}

std::string FormatOneQualifier(uint32_t code) {
  uint32_t number = code >> kFmt1NumberShift;
  if (code & kFmt1ParameterBit) {
    return base::StringPrintf(" (parameter %u)",
                              number & kFmt1ParameterNumberMask);
  }
  number &= kFmt1HandleNumberMask;
  if (code & kFmt1SessionBit) {
    return base::StringPrintf(" (session %u)", number);
  }
  if (number == 0) {
    return std::string();
  }
  return base::StringPrintf(" (handle %u)", number);
}

}  // namespace

std::optional<ResponseHeader> ParseResponseHeader(
    const std::string& response) {
  if (response.size() < kResponseHeaderSize) {
    return std::nullopt;
  }
  const uint8_t* data = reinterpret_cast<const uint8_t*>(response.data());
  ResponseHeader header{};
  base::ReadBigEndian(data, &header.tag);
  base::ReadBigEndian(data + sizeof(header.tag), &header.size);
  base::ReadBigEndian(data + kResponseCodeOffset, &header.response_code);
  return header;
}

bool IsFormatOne(uint32_t code) {
  return (code & kRcFmt1) != 0;
}

uint32_t GetFormatOneBase(uint32_t code) {
  if (!IsFormatOne(code)) {
    return code;
  }
  return code & kFmt1BaseMask;
}

std::string DescribeResponseCode(uint32_t code) {
  if (code & ~0xFFFu) {
    return base::StringPrintf("unknown TPM response code 0x%08X", code);
  }
  if (IsFormatOne(code)) {
    const uint32_t base_code = GetFormatOneBase(code);
    const char* name = FormatOneName(base_code);
    if (name) {
      return name + FormatOneQualifier(code);
    }
    return base::StringPrintf("unknown format-one TPM error 0x%03X",
                              base_code) +
           FormatOneQualifier(code);
  }

  const char* name = FormatZeroName(code);
  if (name) {
    return name;
  }
  if (!(code & kRcVer1)) {
    return base::StringPrintf("TPM 1.2 response code 0x%03X", code);
  }
  if (code & kRcVendorBit) {
    return base::StringPrintf("vendor-defined TPM response code 0x%03X", code);
  }
  if ((code & kRcWarn) == kRcWarn) {
    return base::StringPrintf("unknown TPM warning 0x%03X", code);
  }
  return base::StringPrintf("unknown TPM error 0x%03X", code);
}

}  // namespace tpm_hierarchy_probe
