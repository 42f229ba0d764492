/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed/keyed_class_table.h"
#include "keyed/keyed_object_decoder.h"
#include "keyed/keyed_value.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nska {

struct ArchiveDecodeOptions {
    keyed::DecodeOptions decode{};
    // Registered as composite records on top of the built-in class table.
    std::vector<std::string> extra_composite_classes;
};

class KeyedArchiveDecoder {
   public:
    static constexpr std::string_view kArchiver = "NSKeyedArchiver";
    static constexpr std::int64_t kVersion = 100000;

    // Returns the $top roots by name, each fully decoded. Throws
    // keyed::DecodeError; there is no partial result.
    static nlohmann::ordered_json DecodeArchive(
        const keyed::Value& archive,
        const ArchiveDecodeOptions& opt = {},
        std::string_view label = {}
    );
    static nlohmann::ordered_json DecodeArchive(
        const keyed::Value& archive,
        const keyed::ClassTable& classes,
        const keyed::DecodeOptions& opt,
        std::string_view label = {}
    );

    static nlohmann::ordered_json DecodeJsonText(
        std::string_view text,
        const ArchiveDecodeOptions& opt = {},
        std::string_view label = {}
    );
    static nlohmann::ordered_json
    DecodeJsonFile(const std::filesystem::path& path, const ArchiveDecodeOptions& opt = {});

    static keyed::ClassTable BuildClassTable(const ArchiveDecodeOptions& opt);
};

}  // namespace nska
