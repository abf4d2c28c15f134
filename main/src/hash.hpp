#pragma once

#include <filesystem>
#include <string>
#include <string_view>

enum class DigestAlgorithm { Md5, Sha1, Sha256 };

// File suffix used for a checksum side file, without the dot ("md5", "sha1", "sha256").
std::string_view digest_extension(DigestAlgorithm algorithm);

// Lowercase hex digest of an in-memory buffer.
std::string calculate_digest(DigestAlgorithm algorithm, std::string_view data);

// Lowercase hex digest of a file.
// Throws GhrelException if the file cannot be opened.
std::string calculate_file_digest(DigestAlgorithm algorithm, const std::filesystem::path& file_path);
