/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace dntkit::fs_utils {
std::filesystem::path executable_dir();
bool is_dnt_file(const std::filesystem::path& path);
bool is_json_file(const std::filesystem::path& path);
bool is_minimal_json(const std::filesystem::path& path);
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void ensure_dir(const std::filesystem::path& dir);
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);
}  // namespace dntkit::fs_utils
