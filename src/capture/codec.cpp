#include "selfspy/capture/codec.hpp"

#include "selfspy/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace selfspy::capture {

namespace {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

using Bytes = std::vector<unsigned char>;
using Nonce = std::array<unsigned char, NONCE_SIZE>;
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

common::Result<Bytes> crypto_failure(const std::string &message) {
  return common::Result<Bytes>::failure(common::ErrorKind::Encryption, message);
}

std::string b64_encode(const Bytes &bytes) {
  std::string output(4 * ((bytes.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return output;
}

common::Result<Bytes> b64_decode(const std::string &text) {
  if (text.empty() || text.size() % 4 != 0) {
    return crypto_failure("Invalid base64 input");
  }

  Bytes decoded(text.size());
  const int len = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0) {
    return crypto_failure("Invalid base64 input");
  }

  // EVP_DecodeBlock counts '=' padding as zero bytes.
  const std::size_t padding =
      static_cast<std::size_t>(std::count(text.end() - 2, text.end(), '='));
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<Bytes>::success(std::move(decoded));
}

common::Result<Bytes> seal(const SecretKey &key, const Nonce &nonce,
                           const std::string &plaintext) {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (ctx == nullptr) {
    return crypto_failure("Failed to create cipher context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    return crypto_failure("Encrypt init failed");
  }

  Bytes out(plaintext.size() + TAG_SIZE);
  int out_len = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data(), &out_len,
                        reinterpret_cast<const unsigned char *>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    return crypto_failure("Encrypt update failed");
  }
  int total = out_len;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &out_len) != 1) {
    return crypto_failure("Encrypt final failed");
  }
  total += out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, out.data() + total) != 1) {
    return crypto_failure("Failed to get tag");
  }
  out.resize(static_cast<std::size_t>(total) + TAG_SIZE);
  return common::Result<Bytes>::success(std::move(out));
}

common::Result<std::string> unseal(const SecretKey &key, const Nonce &nonce,
                                   const unsigned char *data, std::size_t size) {
  using StringResult = common::Result<std::string>;
  const std::size_t body_size = size - TAG_SIZE;
  Bytes tag(data + body_size, data + size);

  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (ctx == nullptr) {
    return StringResult::failure(common::ErrorKind::Encryption, "Failed to create cipher context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    return StringResult::failure(common::ErrorKind::Encryption, "Decrypt init failed");
  }

  Bytes plain(body_size + TAG_SIZE);
  int out_len = 0;
  if (EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len, data, static_cast<int>(body_size)) !=
      1) {
    return StringResult::failure(common::ErrorKind::Encryption, "Decrypt update failed");
  }
  int total = out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_SIZE, tag.data()) != 1) {
    return StringResult::failure(common::ErrorKind::Encryption, "Failed to set tag");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &out_len) != 1) {
    return StringResult::failure(common::ErrorKind::Encryption,
                                 "Decryption failed: wrong key or tampered payload");
  }
  total += out_len;

  return StringResult::success(
      std::string(reinterpret_cast<const char *>(plain.data()), static_cast<std::size_t>(total)));
}

} // namespace

SecretKey generate_key() {
  SecretKey key{};
  RAND_bytes(key.data(), static_cast<int>(key.size()));
  return key;
}

common::Result<SecretKey> derive_key(const std::string &password, const std::string &salt,
                                     const int iterations) {
  if (password.empty()) {
    return common::Result<SecretKey>::failure(common::ErrorKind::InvalidArgument,
                                              "password must not be empty");
  }
  if (iterations <= 0) {
    return common::Result<SecretKey>::failure(common::ErrorKind::InvalidArgument,
                                              "iterations must be positive");
  }

  SecretKey key{};
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        reinterpret_cast<const unsigned char *>(salt.data()),
                        static_cast<int>(salt.size()), iterations, EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    return common::Result<SecretKey>::failure(common::ErrorKind::Encryption,
                                              "PBKDF2 key derivation failed");
  }
  return common::Result<SecretKey>::success(key);
}

common::Result<std::string> encrypt(const std::string &plaintext, const SecretKey &key) {
  Nonce nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return common::Result<std::string>::failure(common::ErrorKind::Encryption,
                                                "Failed to generate nonce");
  }

  auto sealed = seal(key, nonce, plaintext);
  if (!sealed.ok()) {
    return common::Result<std::string>::failure(sealed.kind(), sealed.error());
  }

  Bytes blob;
  blob.reserve(NONCE_SIZE + sealed.value().size());
  blob.insert(blob.end(), nonce.begin(), nonce.end());
  blob.insert(blob.end(), sealed.value().begin(), sealed.value().end());
  return common::Result<std::string>::success(b64_encode(blob));
}

common::Result<std::string> decrypt(const std::string &ciphertext, const SecretKey &key) {
  const auto decoded = b64_decode(ciphertext);
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(decoded.kind(), decoded.error());
  }

  const Bytes &blob = decoded.value();
  if (blob.size() < NONCE_SIZE + TAG_SIZE) {
    return common::Result<std::string>::failure(common::ErrorKind::Encryption,
                                                "Ciphertext too short");
  }

  Nonce nonce{};
  std::copy_n(blob.begin(), NONCE_SIZE, nonce.begin());
  return unseal(key, nonce, blob.data() + NONCE_SIZE, blob.size() - NONCE_SIZE);
}

common::Result<std::string> Codec::encrypt(const std::string &plaintext) const {
  return capture::encrypt(plaintext, key_);
}

common::Result<std::string> Codec::decrypt(const std::string &ciphertext) const {
  return capture::decrypt(ciphertext, key_);
}

common::Status verify_or_create_key_check(const Codec &codec, const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    const auto token = codec.encrypt(KEY_CHECK_TOKEN);
    if (!token.ok()) {
      return common::Status::error(token.kind(), token.error());
    }
    auto written = common::write_file_atomic(path, token.value());
    if (!written.ok()) {
      return written;
    }
#ifndef _WIN32
    chmod(path.c_str(), 0600);
#endif
    return common::Status::success();
  }

  const auto stored = common::read_file(path);
  if (!stored.ok()) {
    return common::Status::error(stored.kind(), stored.error());
  }
  const auto decrypted = codec.decrypt(common::trim(stored.value()));
  if (!decrypted.ok() || decrypted.value() != KEY_CHECK_TOKEN) {
    return common::Status::error(common::ErrorKind::Encryption,
                                 "encryption key does not match " + path.string());
  }
  return common::Status::success();
}

} // namespace selfspy::capture
