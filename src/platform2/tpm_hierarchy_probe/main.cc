// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//
// Guest-side check that the TPM platform hierarchy is not reachable. Sends
// TPM2_Clear(TPM_RH_PLATFORM) once and prints a single verdict line on
// stdout: "succeeded" when the TPM refused it, "failed - ..." otherwise.

#include <sysexits.h>

#include <iostream>
#include <optional>

#include <base/files/file_path.h>
#include <base/logging.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "tpm_hierarchy_probe/hierarchy_probe.h"
#include "tpm_hierarchy_probe/tpm_constants.h"
#include "tpm_hierarchy_probe/tpm_handle.h"

int main(int argc, char** argv) {
  DEFINE_string(device, tpm_hierarchy_probe::kDefaultTpmDevicePath,
                "TPM character device to send TPM2_Clear to.");
  DEFINE_bool(quiet, false, "Only log to syslog.");
  brillo::FlagHelper::Init(argc, argv,
                           "Checks that the TPM platform hierarchy is "
                           "disabled for this guest.");
  if (FLAGS_quiet) {
    brillo::InitLog(brillo::kLogToSyslog);
  } else {
    brillo::InitLog(brillo::kLogToSyslog | brillo::kLogToStderrIfTty);
  }

  tpm_hierarchy_probe::TpmHandle tpm_handle{base::FilePath(FLAGS_device)};
  if (!tpm_handle.Init()) {
    return EX_NOINPUT;
  }

  tpm_hierarchy_probe::PlatformHierarchyProbe probe(&tpm_handle);
  std::optional<tpm_hierarchy_probe::ProbeOutcome> outcome = probe.Run();
  if (!outcome) {
    LOG(ERROR) << "Failed to exchange TPM2_Clear with " << FLAGS_device;
    return EX_IOERR;
  }

  std::cout << tpm_hierarchy_probe::FormatOutcome(*outcome) << std::endl;
  return EX_OK;
}
