#pragma once

/**
 * @file voiceprint_store.h
 * @brief Encrypted-at-rest owner voiceprint storage
 *
 * On-disk artifact (JSON):
 *   { "version": 1, "owner_id": "...", "ciphertext": b64, "nonce": b64,
 *     "key_fingerprint": hex, "created_at": unix_seconds }
 *
 * The embedding is sealed with AES-256-GCM. owner_id, key_fingerprint and
 * created_at are bound as associated data, so editing any of them breaks
 * authentication. The raw key and the secret it was derived from are never
 * written; the fingerprint only identifies which key epoch sealed the
 * artifact so a rotated key is reported as KeyMismatch rather than as a
 * decode failure.
 */

#include "common.h"
#include "errors.h"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace voxgate {

/**
 * @brief Process-wide voiceprint key material
 *
 * Built once at startup and passed explicitly to the components that need
 * it. Immutable; has no stream operator.
 */
class VoiceKey {
public:
    /// Empty key; enroll/load reject it with MissingKey
    VoiceKey() = default;

    /**
     * @brief Derive encryption key and fingerprint from an operator secret
     * @return MissingKey if the secret is empty
     */
    static Result<VoiceKey> from_secret(const std::string& secret);

    /**
     * @brief Read the secret from an environment variable
     * @return MissingKey if the variable is unset or empty
     */
    static Result<VoiceKey> from_env(const std::string& env_var);

    bool empty() const { return fingerprint_.empty(); }

    /// Hex fingerprint identifying the key epoch (safe to persist and log)
    const std::string& fingerprint() const { return fingerprint_; }

private:
    friend class VoiceprintStore;

    std::array<unsigned char, 32> enc_key_{};
    std::string fingerprint_;
};

/**
 * @brief One enrolled, encrypted embedding
 */
struct Voiceprint {
    int version = 1;
    std::string owner_id;
    std::vector<uint8_t> ciphertext;  ///< AES-GCM output followed by the 16-byte tag
    std::vector<uint8_t> nonce;       ///< 96-bit GCM nonce
    std::string key_fingerprint;
    int64_t created_at = 0;           ///< Unix seconds
};

/**
 * @brief Reads and writes the voiceprint artifact at one operator-chosen path
 */
class VoiceprintStore {
public:
    explicit VoiceprintStore(std::string path);

    const std::string& path() const { return path_; }

    bool exists() const;

    /**
     * @brief Seal an embedding and persist it, replacing any previous artifact
     * @return MissingKey for an empty key, InvalidArgs for an empty embedding,
     *         IOError if the file cannot be written
     */
    Result<Voiceprint> enroll(const std::string& owner_id,
                              const EmbeddingVector& embedding,
                              const VoiceKey& key) const;

    /**
     * @brief Read and decrypt the stored embedding
     * @return MissingKey, NotEnrolled, IOError, ParseError (malformed or tampered),
     *         KeyMismatch (artifact sealed under a different key)
     */
    Result<EmbeddingVector> load(const VoiceKey& key) const;

    /**
     * @brief Read the artifact without decrypting (owner id, fingerprint, created_at)
     * @return NotEnrolled if nothing is stored, IOError if the path cannot be read
     */
    Result<Voiceprint> read() const;

    /// Write an already sealed artifact
    VoidResult save(const Voiceprint& voiceprint) const;

    /// Encrypt in memory; does not touch disk
    static Result<Voiceprint> seal(const std::string& owner_id,
                                   const EmbeddingVector& embedding,
                                   const VoiceKey& key,
                                   int64_t created_at);

    /// Decrypt in memory; fingerprint is checked before any decryption
    static Result<EmbeddingVector> open(const Voiceprint& voiceprint, const VoiceKey& key);

    static std::string to_json(const Voiceprint& voiceprint);
    static Result<Voiceprint> from_json(const std::string& text);

private:
    std::string path_;
};

} // namespace voxgate
