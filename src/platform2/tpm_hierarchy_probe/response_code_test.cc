// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tpm_hierarchy_probe/response_code.h"

#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "tpm_hierarchy_probe/tpm_constants.h"

namespace tpm_hierarchy_probe {
namespace {

TEST(ResponseCodeTest, ParseHeader) {
  const std::string response("\x80\x01\x00\x00\x00\x0c"
                             "\x00\x00\x09\x8e"
                             "\xab\xcd",
                             12);
  std::optional<ResponseHeader> header = ParseResponseHeader(response);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->tag, TPM_ST_NO_SESSIONS);
  EXPECT_EQ(header->size, 12u);
  EXPECT_EQ(header->response_code, 0x98Eu);
}

TEST(ResponseCodeTest, ParseHeaderHighBytes) {
  const std::string response("\xff\xfe\x87\x65\x43\x21"
                             "\xde\xad\xbe\xef",
                             kResponseHeaderSize);
  std::optional<ResponseHeader> header = ParseResponseHeader(response);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->tag, 0xFFFE);
  EXPECT_EQ(header->size, 0x87654321u);
  EXPECT_EQ(header->response_code, 0xDEADBEEFu);
}

TEST(ResponseCodeTest, ParseHeaderTooShort) {
  EXPECT_FALSE(ParseResponseHeader(std::string()).has_value());
  EXPECT_FALSE(
      ParseResponseHeader(std::string("\x80\x01\x00\x00\x00\x0a\x00\x00\x01",
                                      kResponseHeaderSize - 1))
          .has_value());
}

TEST(ResponseCodeTest, FormatOneBase) {
  EXPECT_TRUE(IsFormatOne(TPM_RC_HIERARCHY));
  EXPECT_TRUE(IsFormatOne(TPM_RC_HIERARCHY_P1));
  EXPECT_FALSE(IsFormatOne(TPM_RC_COMMAND_CODE));
  EXPECT_FALSE(IsFormatOne(TPM_RC_SUCCESS));

  EXPECT_EQ(GetFormatOneBase(0x985), TPM_RC_HIERARCHY);
  EXPECT_EQ(GetFormatOneBase(0x1C5), TPM_RC_HIERARCHY);
  EXPECT_EQ(GetFormatOneBase(0x98E), TPM_RC_AUTH_FAIL);
  EXPECT_EQ(GetFormatOneBase(TPM_RC_COMMAND_CODE), TPM_RC_COMMAND_CODE);
}

TEST(ResponseCodeTest, DescribeKnownCodes) {
  EXPECT_EQ(DescribeResponseCode(TPM_RC_SUCCESS), "TPM_RC_SUCCESS");
  EXPECT_EQ(DescribeResponseCode(TPM_RC_HIERARCHY), "TPM_RC_HIERARCHY");
  EXPECT_EQ(DescribeResponseCode(TPM_RC_AUTH_FAIL), "TPM_RC_AUTH_FAIL");
  EXPECT_EQ(DescribeResponseCode(TPM_RC_COMMAND_CODE), "TPM_RC_COMMAND_CODE");
  EXPECT_EQ(DescribeResponseCode(0x922), "TPM_RC_RETRY");
}

TEST(ResponseCodeTest, DescribeQualifiedCodes) {
  EXPECT_EQ(DescribeResponseCode(TPM_RC_HIERARCHY_P1),
            "TPM_RC_HIERARCHY (handle 1)");
  EXPECT_EQ(DescribeResponseCode(0x1C5), "TPM_RC_HIERARCHY (parameter 1)");
  EXPECT_EQ(DescribeResponseCode(0x98E), "TPM_RC_AUTH_FAIL (session 1)");
}

TEST(ResponseCodeTest, DescribeUnknownCodes) {
  EXPECT_EQ(DescribeResponseCode(0x003), "TPM 1.2 response code 0x003");
  EXPECT_EQ(DescribeResponseCode(0x500),
            "vendor-defined TPM response code 0x500");
  EXPECT_EQ(DescribeResponseCode(0x960), "unknown TPM warning 0x960");
  EXPECT_EQ(DescribeResponseCode(0x15F), "unknown TPM error 0x15F");
  EXPECT_EQ(DescribeResponseCode(0xDEADBEEF),
            "unknown TPM response code 0xDEADBEEF");
}

}  // namespace
}  // namespace tpm_hierarchy_probe
