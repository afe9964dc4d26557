/**
 * @file digest.h
 * @brief SHA-256 digests for chunk and whole-file integrity
 */

#ifndef CHUNKED_UPLOAD_CORE_DIGEST_H
#define CHUNKED_UPLOAD_CORE_DIGEST_H

#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

// Opaque OpenSSL context type
struct evp_md_ctx_st;

namespace chunked_upload {

/**
 * @brief Incremental SHA-256 over data fed in order
 *
 * Used for the whole-file digest, which is accumulated while the planner
 * reads chunks and recomputed from the source when a session completes.
 */
class sha256_stream {
public:
    sha256_stream();
    ~sha256_stream();

    sha256_stream(const sha256_stream&) = delete;
    auto operator=(const sha256_stream&) -> sha256_stream& = delete;
    sha256_stream(sha256_stream&&) noexcept;
    auto operator=(sha256_stream&&) noexcept -> sha256_stream&;

    /**
     * @brief Feed the next run of bytes
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest; the stream cannot be updated afterward
     */
    [[nodiscard]] auto finalize() -> result<std::string>;

private:
    struct ctx_deleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ctx_deleter> ctx_;
    bool finalized_{false};
};

/**
 * @brief SHA-256 helpers (OpenSSL EVP)
 */
class digest {
public:
    /**
     * @brief SHA-256 of a byte span as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief SHA-256 of an entire source, read sequentially
     * @param source Source to read
     * @param buffer_size Read granularity
     */
    [[nodiscard]] static auto sha256_source(const byte_source& source,
                                            std::size_t buffer_size = 1024 * 1024)
        -> result<std::string>;

    /**
     * @brief SHA-256 of a file on disk
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Compare two hex digests, ignoring case
     */
    [[nodiscard]] static auto equals(const std::string& lhs, const std::string& rhs) -> bool;

    /**
     * @brief Convert raw digest bytes to lowercase hex
     */
    [[nodiscard]] static auto to_hex(std::span<const unsigned char> bytes) -> std::string;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_DIGEST_H
