/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cli.h"

#include "utils/fs_utils.h"
#include "utils/log.h"

#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace nska::cli {

static void print_usage() {
    NSKA_LOG_INFO(
        "Usage:\n" \
        "    nska_decoder <file-or-dir> [--out <dir>] [--stdout] [--compact] [--set-last-element]\n" \
        "                 [--composite <ClassName>]... [--max-depth <n>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a .json keyed archive or a directory of them\n" \
        "    --out <dir>           output directory (default: <exe dir>/output/json)\n" \
        "    --stdout              print decoded archives instead of writing files\n" \
        "    --compact             write JSON without indentation\n" \
        "    --set-last-element    decode NSSet to its last member only\n" \
        "    --composite <name>    decode an extra archived class member-wise (repeatable)\n" \
        "    --max-depth <n>       maximum object nesting (default 1000, 0 = unlimited)\n" \
        "    --debug               enables extra logging on stderr\n"
    );
    NSKA_LOG_INFO("[INFO] References must use the {\"CF$UID\": n} form.");
}

static std::optional<int> parse_int(std::string_view s) {
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

static bool process_file(const fs::path& path, const fs::path& out_dir, const Settings& settings) {
    try {
        const auto decoded = KeyedArchiveDecoder::DecodeJsonFile(path, settings.decode);
        const auto text = decoded.dump(settings.compact ? -1 : 2);
        if (settings.to_stdout) {
            std::fputs(text.c_str(), stdout);
            std::fputc('\n', stdout);
            std::fflush(stdout);
            return true;
        }
        const fs::path out_path = fs_utils::decoded_output_path(out_dir, path);
        fs_utils::write_text_file(out_path, text);
        NSKA_LOG_INFO("Wrote: %s", out_path.string().c_str());
        return true;
    } catch (const std::exception& e) {
        NSKA_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
    return false;
}

int parse_args(int argc, const char* const* argv, Settings& settings) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg.empty() || first_arg[0] == '-') {
        NSKA_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return kExitBadArguments;
    }
    settings.input = fs::path(std::string(first_arg));

    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--stdout") {
            settings.to_stdout = true;
            continue;
        }
        if (arg == "--compact") {
            settings.compact = true;
            continue;
        }
        if (arg == "--set-last-element") {
            settings.decode.decode.set_mode = keyed::SetDecodeMode::LastElement;
            continue;
        }
        if (arg == "--debug") {
            settings.decode.decode.debug = true;
            continue;
        }
        if (arg == "--out" || arg == "--composite" || arg == "--max-depth") {
            if (i + 1 >= argc) {
                NSKA_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return kExitBadArguments;
            }
            const std::string_view value = argv[++i];
            if (arg == "--out") {
                settings.out_dir = fs::path(std::string(value));
            } else if (arg == "--composite") {
                if (value.empty()) {
                    NSKA_LOG_ERROR("Empty class name for --composite");
                    return kExitBadArguments;
                }
                settings.decode.extra_composite_classes.emplace_back(value);
            } else {
                const auto depth = parse_int(value);
                if (!depth.has_value() || *depth < 0) {
                    NSKA_LOG_ERROR("Invalid value for --max-depth: %s", std::string(value).c_str());
                    return kExitBadArguments;
                }
                settings.decode.decode.max_depth = *depth;
            }
            continue;
        }
        NSKA_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return kExitBadArguments;
    }
    return kExitOk;
}

int run(const Settings& settings) {
    if (!fs::exists(settings.input)) {
        NSKA_LOG_ERROR("Input does not exist: %s", settings.input.string().c_str());
        return kExitBadArguments;
    }

    fs::path out_dir;
    if (!settings.to_stdout) {
        out_dir = settings.out_dir.value_or(fs_utils::executable_dir() / "output" / "json");
        fs_utils::ensure_dir(out_dir);
    }

    std::vector<fs::path> inputs;
    if (fs::is_directory(settings.input)) {
        inputs = fs_utils::collect_inputs(settings.input);
    } else {
        inputs.push_back(settings.input);
    }

    int failures = 0;
    for (const auto& p : inputs) {
        if (!process_file(p, out_dir, settings)) {
            failures++;
        }
    }
    if (failures > 0) {
        NSKA_LOG_ERROR("%d of %zu inputs failed", failures, inputs.size());
        return kExitInputFailed;
    }
    return kExitOk;
}

int run(int argc, const char* const* argv) {
    Settings settings;
    const int rc = parse_args(argc, argv, settings);
    if (rc != kExitOk) {
        return rc;
    }
    return run(settings);
}

}  // namespace nska::cli
