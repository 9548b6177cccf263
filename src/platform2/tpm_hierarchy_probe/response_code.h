// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TPM_HIERARCHY_PROBE_RESPONSE_CODE_H_
#define TPM_HIERARCHY_PROBE_RESPONSE_CODE_H_

#include <cstdint>
#include <optional>
#include <string>

#include <brillo/brillo_export.h>

namespace tpm_hierarchy_probe {

// The fixed header at the start of every TPM 2.0 response.
struct ResponseHeader {
  uint16_t tag;
  uint32_t size;
  uint32_t response_code;
};

// Decodes the big-endian header of |response|. Returns std::nullopt if the
// response is shorter than kResponseHeaderSize.
BRILLO_EXPORT std::optional<ResponseHeader> ParseResponseHeader(
    const std::string& response);

// True if |code| uses the format-one layout (bit 7 set).
BRILLO_EXPORT bool IsFormatOne(uint32_t code);

// Strips the handle, session or parameter qualifier from a format-one code,
// e.g. 0x985 -> TPM_RC_HIERARCHY. Format-zero codes are returned unchanged.
BRILLO_EXPORT uint32_t GetFormatOneBase(uint32_t code);

// Human-readable rendering of a TPM response code, for logging only. Known
// codes are named after TPM 2.0 Part 2, e.g. "TPM_RC_HIERARCHY (handle 1)".
BRILLO_EXPORT std::string DescribeResponseCode(uint32_t code);

}  // namespace tpm_hierarchy_probe

#endif  // TPM_HIERARCHY_PROBE_RESPONSE_CODE_H_
