/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nska::fs_utils {
std::filesystem::path executable_dir();
bool is_decoded_output(const std::filesystem::path& path);
std::filesystem::path decoded_output_path(
    const std::filesystem::path& out_dir,
    const std::filesystem::path& input
);
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace nska::fs_utils
