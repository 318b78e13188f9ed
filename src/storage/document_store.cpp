/**
 * @file document_store.cpp
 * @brief Implementation of the managed documents directory
 */

#include <equipdb/storage/document_store.hpp>

#include <equipdb/compat/format.hpp>
#include <equipdb/integration/logger_adapter.hpp>
#include <equipdb/security/value_validators.hpp>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

namespace equipdb::storage {

using integration::logger_adapter;

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

constexpr std::size_t read_chunk_size = 64 * 1024;

[[nodiscard]] auto to_hex(const unsigned char* data, std::size_t size) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

}  // namespace

document_store::document_store(document_store_config config)
    : config_(std::move(config)) {}

auto document_store::root() const noexcept -> const std::filesystem::path& {
    return config_.documents_root;
}

auto document_store::import_document(std::string_view equipment_key,
                                     const std::filesystem::path& source) const
    -> Result<imported_document> {
    if (!security::is_valid_identifier(equipment_key)) {
        return equipdb_error<imported_document>(
            error_codes::document_import_failed,
            equipdb::compat::format("Invalid equipment key: '{}'", equipment_key));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return equipdb_error<imported_document>(
            error_codes::document_import_failed,
            "Source file does not exist or is not accessible", source.string());
    }

    auto directory = config_.documents_root / std::string(equipment_key);
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return equipdb_error<imported_document>(
            error_codes::document_import_failed,
            equipdb::compat::format("Failed to create {}: {}", directory.string(),
                                    ec.message()));
    }

    imported_document document;
    document.file_name = source.filename().string();
    document.stored_path = directory / document.file_name;

    std::filesystem::copy_file(source, document.stored_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return equipdb_error<imported_document>(
            error_codes::document_import_failed,
            equipdb::compat::format("Failed to copy {}: {}", source.string(),
                                    ec.message()));
    }

    document.size = std::filesystem::file_size(document.stored_path, ec);
    if (ec) {
        return equipdb_error<imported_document>(
            error_codes::document_import_failed,
            equipdb::compat::format("Failed to stat {}: {}",
                                    document.stored_path.string(), ec.message()));
    }

    auto digest = sha256_file(document.stored_path);
    if (digest.is_err()) {
        return equipdb_error<imported_document>(digest.error().code,
                                                digest.error().message);
    }
    document.sha256 = digest.value();

    logger_adapter::info("Imported document {} ({} bytes) for {}",
                         document.file_name, document.size, equipment_key);
    return document;
}

auto document_store::sha256_file(const std::filesystem::path& file)
    -> Result<std::string> {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return equipdb_error<std::string>(
            error_codes::document_hash_failed,
            equipdb::compat::format("Failed to open {}", file.string()));
    }

    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return equipdb_error<std::string>(error_codes::document_hash_failed,
                                          "Failed to initialize SHA-256 context");
    }

    std::array<char, read_chunk_size> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = in.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return equipdb_error<std::string>(error_codes::document_hash_failed,
                                              "SHA-256 update failed");
        }
    }
    if (in.bad()) {
        return equipdb_error<std::string>(
            error_codes::document_hash_failed,
            equipdb::compat::format("Failed to read {}", file.string()));
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        return equipdb_error<std::string>(error_codes::document_hash_failed,
                                          "SHA-256 finalization failed");
    }

    return to_hex(md.data(), md_len);
}

}  // namespace equipdb::storage
