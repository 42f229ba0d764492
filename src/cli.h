/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed_archive_decoder.h"

#include <filesystem>
#include <optional>

namespace nska::cli {

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitBadArguments = 2,
    kExitInputFailed = 3,
};

struct Settings {
    std::filesystem::path input;
    bool compact = false;
    bool to_stdout = false;
    std::optional<std::filesystem::path> out_dir;
    ArchiveDecodeOptions decode{};
};

// Fills settings from argv. Returns kExitOk, or the exit code to stop with
// after the problem has been logged.
int parse_args(int argc, const char* const* argv, Settings& settings);

// Decodes every input and writes or prints the results. Inputs that fail are
// logged and skipped; any failure turns the result into kExitInputFailed.
int run(const Settings& settings);

int run(int argc, const char* const* argv);

}  // namespace nska::cli
