// Reads certificate JSON back into a CalibrationCertificate for auditing.

#ifndef CALIB_CERTIFICATE_CERTIFICATE_READER_H
#define CALIB_CERTIFICATE_CERTIFICATE_READER_H

#include <string>

#include "certificate/calibration_certificate.h"

namespace calib {

/// @brief Parse the JSON written by certificateToJson().
///
/// Every field the writer emits is restored, so verifyCertificate() on the
/// result replays the trace and recomputes the instance id exactly as it
/// would on the certificate that was written. Interaction terms recover
/// their layers from the "(@a,@b)" label and their rationale from the
/// interaction breakdown.
///
/// @param text Certificate JSON, pretty or compact.
/// @param out Receives the certificate on success.
/// @param error Receives "certificate.<path>: reason" on failure.
/// @return True on success.
bool parseCertificateJson(const std::string& text, CalibrationCertificate& out,
                          std::string& error);

/// @brief Read a certificate file and parse it.
bool loadCertificateFile(const std::string& path, CalibrationCertificate& out,
                         std::string& error);

}  // namespace calib

#endif  // CALIB_CERTIFICATE_CERTIFICATE_READER_H
