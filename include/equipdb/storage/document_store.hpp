/**
 * @file document_store.hpp
 * @brief Managed documents directory for files attached to equipment
 */

#pragma once

#include <equipdb/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace equipdb::storage {

/**
 * @brief Location of the managed documents directory
 */
struct document_store_config {
    /// Root directory; one sub-directory per equipment key
    std::filesystem::path documents_root;
};

/**
 * @brief A file copied into the managed directory
 *
 * The fields map directly onto the documents.create arguments
 * (filePath, fileName, hash, size).
 */
struct imported_document {
    std::filesystem::path stored_path;
    std::string file_name;
    std::string sha256;  ///< Lowercase hex digest
    std::uintmax_t size{0};
};

/**
 * @brief Copies user files into the managed documents directory
 *
 * Stored paths always lie inside documents_root and therefore pass the
 * managed-path check of documents.create.
 */
class document_store {
public:
    explicit document_store(document_store_config config);

    /**
     * @brief Copy @p source to "<root>/<equipment_key>/<file name>"
     *
     * An existing file with the same name is overwritten.
     *
     * @param equipment_key Equipment identifier; must be a valid identifier
     * @param source Existing regular file
     * @return The stored document, document_import_failed or
     *         document_hash_failed
     */
    [[nodiscard]] auto import_document(std::string_view equipment_key,
                                       const std::filesystem::path& source) const
        -> Result<imported_document>;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path&;

    /**
     * @brief SHA-256 of a file's content as lowercase hex
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& file)
        -> Result<std::string>;

private:
    document_store_config config_;
};

}  // namespace equipdb::storage
