/**
 * @file digest.cpp
 * @brief SHA-256 implementation on OpenSSL EVP
 */

#include "chunked_upload/core/digest.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunked_upload {

void sha256_stream::ctx_deleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

sha256_stream::sha256_stream() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ctx_.reset();
    }
}

sha256_stream::~sha256_stream() = default;
sha256_stream::sha256_stream(sha256_stream&&) noexcept = default;
auto sha256_stream::operator=(sha256_stream&&) noexcept -> sha256_stream& = default;

auto sha256_stream::update(std::span<const std::byte> data) -> result<void> {
    if (!ctx_) {
        return unexpected{error{error_code::internal_error,
                                "SHA-256 context initialization failed"}};
    }
    if (finalized_) {
        return unexpected{error{error_code::internal_error,
                                "SHA-256 stream already finalized"}};
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        return unexpected{error{error_code::internal_error, "EVP_DigestUpdate failed"}};
    }
    return {};
}

auto sha256_stream::finalize() -> result<std::string> {
    if (!ctx_) {
        return unexpected{error{error_code::internal_error,
                                "SHA-256 context initialization failed"}};
    }
    if (finalized_) {
        return unexpected{error{error_code::internal_error,
                                "SHA-256 stream already finalized"}};
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1) {
        return unexpected{error{error_code::internal_error, "EVP_DigestFinal_ex failed"}};
    }
    finalized_ = true;

    return digest::to_hex(std::span<const unsigned char>(hash, len));
}

auto digest::sha256(std::span<const std::byte> data) -> std::string {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(std::span<const unsigned char>(hash, SHA256_DIGEST_LENGTH));
}

auto digest::sha256_source(const byte_source& source, std::size_t buffer_size)
    -> result<std::string> {
    if (buffer_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "digest buffer size must be positive"}};
    }

    sha256_stream stream;
    std::vector<std::byte> buffer(buffer_size);

    uint64_t offset = 0;
    const uint64_t total = source.size();
    while (offset < total) {
        auto read_result = source.read(offset, buffer);
        if (!read_result) {
            return unexpected{read_result.error()};
        }
        auto got = read_result.value();
        if (got == 0) {
            return unexpected{error{error_code::file_read_error,
                                    "unexpected end of source at offset " +
                                        std::to_string(offset)}};
        }

        auto update_result = stream.update(std::span<const std::byte>(buffer.data(), got));
        if (!update_result) {
            return unexpected{update_result.error()};
        }
        offset += got;
    }

    return stream.finalize();
}

auto digest::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    auto source = file_byte_source::open(path);
    if (!source) {
        return unexpected{source.error()};
    }
    return sha256_source(*source.value());
}

auto digest::equals(const std::string& lhs, const std::string& rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

auto digest::to_hex(std::span<const unsigned char> bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

}  // namespace chunked_upload
