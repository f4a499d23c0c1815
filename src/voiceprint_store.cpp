#include "voiceprint_store.h"
#include "logger.h"
#include "utils.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace voxgate {

namespace {

constexpr int kFormatVersion = 1;
constexpr size_t kNonceBytes = 12;
constexpr size_t kTagBytes = 16;
constexpr size_t kFingerprintBytes = 16;

const char* kEncLabel = "voxgate/voiceprint/enc/v1";
const char* kFingerprintLabel = "voxgate/voiceprint/fingerprint/v1";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool hmac_sha256(const std::string& secret, const char* label, unsigned char out[32]) {
    unsigned int out_len = 0;
    const unsigned char* result = HMAC(EVP_sha256(),
                                       secret.data(), static_cast<int>(secret.size()),
                                       reinterpret_cast<const unsigned char*>(label), std::strlen(label),
                                       out, &out_len);
    return result != nullptr && out_len == 32;
}

std::vector<uint8_t> serialize_embedding(const EmbeddingVector& embedding) {
    std::vector<uint8_t> out;
    out.reserve(embedding.size() * 4);
    for (float value : embedding) {
        uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        out.push_back(static_cast<uint8_t>(bits & 0xff));
        out.push_back(static_cast<uint8_t>((bits >> 8) & 0xff));
        out.push_back(static_cast<uint8_t>((bits >> 16) & 0xff));
        out.push_back(static_cast<uint8_t>((bits >> 24) & 0xff));
    }
    return out;
}

EmbeddingVector deserialize_embedding(const std::vector<uint8_t>& bytes) {
    EmbeddingVector out;
    out.reserve(bytes.size() / 4);
    for (size_t i = 0; i + 3 < bytes.size(); i += 4) {
        uint32_t bits = static_cast<uint32_t>(bytes[i]) |
                        (static_cast<uint32_t>(bytes[i + 1]) << 8) |
                        (static_cast<uint32_t>(bytes[i + 2]) << 16) |
                        (static_cast<uint32_t>(bytes[i + 3]) << 24);
        float value = 0.0f;
        std::memcpy(&value, &bits, sizeof(value));
        out.push_back(value);
    }
    return out;
}

std::string associated_data(const std::string& owner_id, const std::string& fingerprint, int64_t created_at) {
    return owner_id + "|" + fingerprint + "|" + std::to_string(created_at) + "|v" + std::to_string(kFormatVersion);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

Result<std::vector<uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) {
        return make_parse_error("base64 length is not a multiple of 4");
    }
    std::vector<uint8_t> out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return make_parse_error("invalid base64");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (text.size() >= 1 && text[text.size() - 1] == '=') padding++;
    if (text.size() >= 2 && text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// VoiceKey
// ---------------------------------------------------------------------------

Result<VoiceKey> VoiceKey::from_secret(const std::string& secret) {
    if (secret.empty()) {
        return make_error(ErrorType::MissingKey, "voice key secret is empty");
    }

    VoiceKey key;
    unsigned char fp[32];
    if (!hmac_sha256(secret, kEncLabel, key.enc_key_.data()) ||
        !hmac_sha256(secret, kFingerprintLabel, fp)) {
        OPENSSL_cleanse(key.enc_key_.data(), key.enc_key_.size());
        return make_error(ErrorType::Unknown, "key derivation failed");
    }
    key.fingerprint_ = utils::to_hex(fp, kFingerprintBytes);
    OPENSSL_cleanse(fp, sizeof(fp));
    return key;
}

Result<VoiceKey> VoiceKey::from_env(const std::string& env_var) {
    const char* value = std::getenv(env_var.c_str());
    if (!value || value[0] == '\0') {
        return make_error(ErrorType::MissingKey, "missing voice key environment variable: " + env_var);
    }
    return from_secret(value);
}

// ---------------------------------------------------------------------------
// VoiceprintStore
// ---------------------------------------------------------------------------

VoiceprintStore::VoiceprintStore(std::string path) : path_(std::move(path)) {}

bool VoiceprintStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec) && !ec;
}

Result<Voiceprint> VoiceprintStore::seal(const std::string& owner_id,
                                         const EmbeddingVector& embedding,
                                         const VoiceKey& key,
                                         int64_t created_at) {
    if (key.empty()) {
        return make_error(ErrorType::MissingKey, "enrollment requires an explicit voice key");
    }
    if (embedding.empty()) {
        return make_error(ErrorType::InvalidArgs, "cannot enroll an empty embedding");
    }
    if (owner_id.empty()) {
        return make_error(ErrorType::InvalidArgs, "owner id must not be empty");
    }

    Voiceprint vp;
    vp.version = kFormatVersion;
    vp.owner_id = owner_id;
    vp.key_fingerprint = key.fingerprint();
    vp.created_at = created_at;
    vp.nonce.resize(kNonceBytes);
    if (RAND_bytes(vp.nonce.data(), static_cast<int>(vp.nonce.size())) != 1) {
        return make_error(ErrorType::Unknown, "RAND_bytes failed");
    }

    std::vector<uint8_t> plaintext = serialize_embedding(embedding);
    std::string aad = associated_data(vp.owner_id, vp.key_fingerprint, vp.created_at);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return make_error(ErrorType::Unknown, "EVP_CIPHER_CTX_new failed");
    }

    vp.ciphertext.resize(plaintext.size() + kTagBytes);
    int len = 0;
    int total = 0;
    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.enc_key_.data(), vp.nonce.data()) == 1 &&
              EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                                reinterpret_cast<const unsigned char*>(aad.data()), static_cast<int>(aad.size())) == 1 &&
              EVP_EncryptUpdate(ctx.get(), vp.ciphertext.data(), &len,
                                plaintext.data(), static_cast<int>(plaintext.size())) == 1;
    if (ok) {
        total = len;
        ok = EVP_EncryptFinal_ex(ctx.get(), vp.ciphertext.data() + total, &len) == 1;
        total += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes),
                                 vp.ciphertext.data() + total) == 1;
    }
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    if (!ok) {
        return make_error(ErrorType::Unknown, "voiceprint encryption failed");
    }
    vp.ciphertext.resize(static_cast<size_t>(total) + kTagBytes);
    return vp;
}

Result<EmbeddingVector> VoiceprintStore::open(const Voiceprint& voiceprint, const VoiceKey& key) {
    if (key.empty()) {
        return make_error(ErrorType::MissingKey, "loading a voiceprint requires an explicit voice key");
    }
    if (voiceprint.key_fingerprint != key.fingerprint()) {
        return make_error(ErrorType::KeyMismatch,
                          "voiceprint was sealed under key " + voiceprint.key_fingerprint +
                          " but the configured key is " + key.fingerprint() +
                          "; re-enroll the owner with the current key");
    }
    if (voiceprint.nonce.size() != kNonceBytes || voiceprint.ciphertext.size() < kTagBytes) {
        return make_parse_error("voiceprint nonce or ciphertext has the wrong size");
    }

    size_t body_len = voiceprint.ciphertext.size() - kTagBytes;
    std::vector<uint8_t> tag(voiceprint.ciphertext.begin() + static_cast<std::ptrdiff_t>(body_len),
                             voiceprint.ciphertext.end());
    std::vector<uint8_t> plaintext(body_len + 1);
    std::string aad = associated_data(voiceprint.owner_id, voiceprint.key_fingerprint, voiceprint.created_at);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return make_error(ErrorType::Unknown, "EVP_CIPHER_CTX_new failed");
    }

    int len = 0;
    int total = 0;
    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.enc_key_.data(), voiceprint.nonce.data()) == 1 &&
              EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                                reinterpret_cast<const unsigned char*>(aad.data()), static_cast<int>(aad.size())) == 1 &&
              EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                                voiceprint.ciphertext.data(), static_cast<int>(body_len)) == 1;
    if (ok) {
        total = len;
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), tag.data()) == 1 &&
             EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) == 1;
        total += len;
    }
    if (!ok) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        // Fingerprint matched, so this is a damaged or edited artifact, not a rotated key
        return make_parse_error("voiceprint failed authentication (corrupt or tampered artifact)");
    }

    plaintext.resize(static_cast<size_t>(total));
    if (plaintext.empty() || plaintext.size() % 4 != 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return make_parse_error("voiceprint payload has an invalid length");
    }
    EmbeddingVector embedding = deserialize_embedding(plaintext);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return embedding;
}

std::string VoiceprintStore::to_json(const Voiceprint& voiceprint) {
    json j;
    j["version"] = voiceprint.version;
    j["owner_id"] = voiceprint.owner_id;
    j["ciphertext"] = base64_encode(voiceprint.ciphertext);
    j["nonce"] = base64_encode(voiceprint.nonce);
    j["key_fingerprint"] = voiceprint.key_fingerprint;
    j["created_at"] = voiceprint.created_at;
    return j.dump(2);
}

Result<Voiceprint> VoiceprintStore::from_json(const std::string& text) {
    Voiceprint vp;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return make_parse_error("voiceprint artifact is not a JSON object");
        }
        for (const char* field : {"version", "owner_id", "ciphertext", "nonce", "key_fingerprint", "created_at"}) {
            if (!j.contains(field)) {
                return make_parse_error(std::string("voiceprint artifact missing field: ") + field);
            }
        }
        vp.version = j["version"].get<int>();
        if (vp.version != kFormatVersion) {
            return make_parse_error("unsupported voiceprint format version " + std::to_string(vp.version));
        }
        vp.owner_id = j["owner_id"].get<std::string>();
        vp.key_fingerprint = j["key_fingerprint"].get<std::string>();
        vp.created_at = j["created_at"].get<int64_t>();

        auto ciphertext = base64_decode(j["ciphertext"].get<std::string>());
        if (!ciphertext) return ciphertext.error();
        auto nonce = base64_decode(j["nonce"].get<std::string>());
        if (!nonce) return nonce.error();
        vp.ciphertext = std::move(ciphertext.value());
        vp.nonce = std::move(nonce.value());
    } catch (const json::exception& e) {
        return make_parse_error("malformed voiceprint artifact: " + std::string(e.what()));
    }
    return vp;
}

Result<Voiceprint> VoiceprintStore::read() const {
    std::error_code ec;
    if (!fs::exists(path_, ec) && !ec) {
        return make_error(ErrorType::NotEnrolled, "no voiceprint at " + path_ + "; enroll the owner first");
    }
    if (!fs::is_regular_file(path_, ec)) {
        return make_io_error("voiceprint path " + path_ + " is not a readable file");
    }
    std::ifstream file(path_);
    if (!file.is_open()) {
        return make_io_error("cannot open voiceprint at " + path_);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return make_io_error("failed reading voiceprint at " + path_);
    }
    return from_json(contents.str());
}

VoidResult VoiceprintStore::save(const Voiceprint& voiceprint) const {
    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_io_error("cannot create directory for " + path_ + ": " + ec.message());
        }
    }

    // Write then rename so a crash never leaves a half-written artifact
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return make_io_error("cannot write voiceprint to " + tmp_path);
        }
        file << to_json(voiceprint);
        file.flush();
        if (!file) {
            return make_io_error("failed writing voiceprint to " + tmp_path);
        }
    }
    fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        Logger::warn("Could not restrict permissions on " + tmp_path + ": " + ec.message());
    }
    fs::rename(tmp_path, target, ec);
    if (ec) {
        return make_io_error("cannot move voiceprint into place at " + path_ + ": " + ec.message());
    }
    return {};
}

Result<Voiceprint> VoiceprintStore::enroll(const std::string& owner_id,
                                           const EmbeddingVector& embedding,
                                           const VoiceKey& key) const {
    auto sealed = seal(owner_id, embedding, key, unix_now());
    if (!sealed) {
        return sealed.error();
    }
    auto saved = save(sealed.value());
    if (!saved) {
        return saved.error();
    }
    LOG_VERIFY("Enrolled owner '" + owner_id + "' (key " + key.fingerprint() + ", " +
               std::to_string(embedding.size()) + " dims) at " + path_);
    return sealed;
}

Result<EmbeddingVector> VoiceprintStore::load(const VoiceKey& key) const {
    if (key.empty()) {
        return make_error(ErrorType::MissingKey, "loading a voiceprint requires an explicit voice key");
    }
    auto vp = read();
    if (!vp) {
        return vp.error();
    }
    auto embedding = open(vp.value(), key);
    if (!embedding && embedding.error().type == ErrorType::KeyMismatch) {
        Logger::error("[Verify] " + embedding.error().message);
    }
    return embedding;
}

} // namespace voxgate
