#include "security/CredentialService.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace cdp::security {

namespace {
constexpr int kApiKeyBytes = 32;           // 32 random bytes -> 64 hex chars
constexpr size_t kFingerprintHexChars = 16;
}  // namespace

std::string CredentialService::hexEncode(const unsigned char* pData, size_t nLen) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < nLen; ++i) {
    oss << std::setw(2) << static_cast<int>(pData[i]);
  }
  return oss.str();
}

// ── API Key Generation ─────────────────────────────────────────────────────

std::string CredentialService::generateApiKey() {
  std::vector<unsigned char> vBytes(kApiKeyBytes);
  if (RAND_bytes(vBytes.data(), kApiKeyBytes) != 1) {
    throw std::runtime_error("Failed to generate random bytes for API key");
  }
  std::string sKey = hexEncode(vBytes.data(), vBytes.size());
  OPENSSL_cleanse(vBytes.data(), vBytes.size());
  return sKey;
}

// ── SHA-256 ────────────────────────────────────────────────────────────────

std::string CredentialService::sha256Hex(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return hexEncode(vHash, uHashLen);
}

std::string CredentialService::fingerprint(const std::string& sApiKey) {
  return "sha256:" + sha256Hex(sApiKey).substr(0, kFingerprintHexChars);
}

void CredentialService::cleanse(std::string& sSecret) {
  if (!sSecret.empty()) {
    OPENSSL_cleanse(sSecret.data(), sSecret.size());
  }
  sSecret.clear();
}

}  // namespace cdp::security
