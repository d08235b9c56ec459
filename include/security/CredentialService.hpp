#pragma once

#include <string>

namespace cdp::security {

/// API key generation and fingerprinting for the deployed service.
/// Key material never leaves this process except through Secret Manager stdin.
/// Class abbreviation: N/A (static interface)
class CredentialService {
 public:
  /// 32 random bytes from RAND_bytes as 64 lowercase hex characters.
  static std::string generateApiKey();

  /// SHA-256 hash -> 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

  /// Short, non-reversible identifier recorded in the credential reference:
  /// "sha256:" followed by the first 16 hex characters of the key digest.
  static std::string fingerprint(const std::string& sApiKey);

  /// Zero the buffer with OPENSSL_cleanse and clear it.
  static void cleanse(std::string& sSecret);

 private:
  static std::string hexEncode(const unsigned char* pData, size_t nLen);
};

}  // namespace cdp::security
