#pragma once

#include "selfspy/common/result.hpp"

#include <array>
#include <filesystem>
#include <string>

namespace selfspy::capture {

using SecretKey = std::array<unsigned char, 32>;

inline constexpr const char *DEFAULT_KEY_SALT = "selfspy-salt";
inline constexpr int DEFAULT_KDF_ITERATIONS = 100'000;
inline constexpr const char *KEY_CHECK_TOKEN = "selfspy-v2-verification-token";

[[nodiscard]] SecretKey generate_key();

/// PBKDF2-HMAC-SHA256 over the user's password.
[[nodiscard]] common::Result<SecretKey> derive_key(const std::string &password,
                                                   const std::string &salt = DEFAULT_KEY_SALT,
                                                   int iterations = DEFAULT_KDF_ITERATIONS);

/// ChaCha20-Poly1305 with a random nonce per message; output is
/// base64(nonce || ciphertext || tag).
[[nodiscard]] common::Result<std::string> encrypt(const std::string &plaintext,
                                                  const SecretKey &key);
[[nodiscard]] common::Result<std::string> decrypt(const std::string &ciphertext,
                                                  const SecretKey &key);

class Codec {
public:
  explicit Codec(const SecretKey &key) : key_(key) {}

  [[nodiscard]] common::Result<std::string> encrypt(const std::string &plaintext) const;
  [[nodiscard]] common::Result<std::string> decrypt(const std::string &ciphertext) const;

private:
  SecretKey key_;
};

/// Checks `codec` against the token stored at `path`, writing the token when
/// the file does not exist yet. Fails with ErrorKind::Encryption on a key
/// mismatch.
[[nodiscard]] common::Status verify_or_create_key_check(const Codec &codec,
                                                        const std::filesystem::path &path);

} // namespace selfspy::capture
