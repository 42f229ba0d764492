/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed_archive_decoder.h"

#include "keyed/keyed_error.h"
#include "keyed/keyed_value_json.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <span>

namespace nska {

static constexpr std::string_view kArchiverKey = "$archiver";
static constexpr std::string_view kVersionKey = "$version";
static constexpr std::string_view kObjectsKey = "$objects";
static constexpr std::string_view kTopKey = "$top";

// Archive root mapping plus the $objects array around each table entry.
static constexpr int kEnvelopeDepth = 2;

static std::string describe_header_value(const keyed::Value* v) {
    if (v == nullptr) {
        return "<missing>";
    }
    if (const auto* s = v->get_if<std::string>()) {
        return *s;
    }
    if (const auto* i = v->get_if<std::int64_t>()) {
        return std::to_string(*i);
    }
    if (const auto* u = v->get_if<std::uint64_t>()) {
        return std::to_string(*u);
    }
    return std::string("<") + v->type_name() + ">";
}

static bool is_supported_version(const keyed::Value* v) {
    if (v == nullptr) {
        return false;
    }
    if (const auto* i = v->get_if<std::int64_t>()) {
        return *i == KeyedArchiveDecoder::kVersion;
    }
    if (const auto* u = v->get_if<std::uint64_t>()) {
        return *u == static_cast<std::uint64_t>(KeyedArchiveDecoder::kVersion);
    }
    return false;
}

static void validate_header(const keyed::Dict& archive) {
    const keyed::Value* archiver = archive.find(kArchiverKey);
    const keyed::Value* version = archive.find(kVersionKey);

    const auto* archiver_name = archiver != nullptr ? archiver->get_if<std::string>() : nullptr;
    const bool archiver_ok =
        archiver_name != nullptr && *archiver_name == KeyedArchiveDecoder::kArchiver;
    if (!archiver_ok || !is_supported_version(version)) {
        throw keyed::DecodeError(
            keyed::ErrorKind::UnsupportedArchive,
            "archiver " + describe_header_value(archiver) + ", version "
                + describe_header_value(version)
        );
    }
}

static keyed::ObjectTable object_table_of(const keyed::Dict& archive) {
    const keyed::Value* objects = archive.find(kObjectsKey);
    if (objects == nullptr || objects->is_null()) {
        return {};
    }
    const auto* array = objects->get_if<keyed::Array>();
    if (array == nullptr) {
        throw keyed::DecodeError(
            keyed::ErrorKind::Malformed,
            std::string("$objects holds ") + objects->type_name() + ", expected an array"
        );
    }
    return keyed::ObjectTable(array->data(), array->size());
}

keyed::ClassTable KeyedArchiveDecoder::BuildClassTable(const ArchiveDecodeOptions& opt) {
    auto classes = keyed::ClassTable::with_defaults();
    for (const auto& name : opt.extra_composite_classes) {
        classes.register_class(name, keyed::ClassStrategy::Composite);
    }
    return classes;
}

nlohmann::ordered_json KeyedArchiveDecoder::DecodeArchive(
    const keyed::Value& archive,
    const ArchiveDecodeOptions& opt,
    std::string_view label
) {
    const auto classes = BuildClassTable(opt);
    return DecodeArchive(archive, classes, opt.decode, label);
}

nlohmann::ordered_json KeyedArchiveDecoder::DecodeArchive(
    const keyed::Value& archive,
    const keyed::ClassTable& classes,
    const keyed::DecodeOptions& opt,
    std::string_view label
) {
    const auto* root = archive.get_if<keyed::Dict>();
    if (root == nullptr) {
        throw keyed::DecodeError(
            keyed::ErrorKind::Malformed,
            std::string("archive root holds ") + archive.type_name() + ", expected a dict"
        );
    }
    validate_header(*root);

    const auto objects = object_table_of(*root);
    auto out = nlohmann::ordered_json::object();

    const keyed::Value* top = root->find(kTopKey);
    if (top == nullptr || top->is_null()) {
        return out;
    }
    const auto* roots = top->get_if<keyed::Dict>();
    if (roots == nullptr) {
        throw keyed::DecodeError(
            keyed::ErrorKind::Malformed,
            std::string("$top holds ") + top->type_name() + ", expected a dict"
        );
    }

    keyed::ObjectDecoder decoder(objects, classes, opt);
    for (const auto& entry : *roots) {
        if (opt.debug) {
            NSKA_LOG_DEBUG(
                "%s: decoding root '%s'", std::string(label).c_str(), entry.key.c_str()
            );
        }
        out[entry.key] = decoder.decode(entry.value);
    }

    if (opt.debug) {
        NSKA_LOG_DEBUG(
            "%s: objects=%zu decoded=%zu roots=%zu",
            std::string(label).c_str(),
            objects.size(),
            decoder.entries_decoded(),
            roots->size()
        );
    }
    return out;
}

nlohmann::ordered_json KeyedArchiveDecoder::DecodeJsonText(
    std::string_view text,
    const ArchiveDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto document = nlohmann::ordered_json::parse(text.begin(), text.end());
    const int max_depth = opt.decode.max_depth > 0 ? opt.decode.max_depth + kEnvelopeDepth : 0;
    const auto archive = keyed::value_from_json(document, max_depth);
    const auto t1 = std::chrono::steady_clock::now();
    auto out = DecodeArchive(archive, opt, label);
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.decode.debug) {
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto decode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        NSKA_LOG_DEBUG(
            "%s: bytes=%zu parse=%lldms decode=%lldms",
            std::string(label).c_str(),
            text.size(),
            static_cast<long long>(parse_ms),
            static_cast<long long>(decode_ms)
        );
    }
    return out;
}

nlohmann::ordered_json
KeyedArchiveDecoder::DecodeJsonFile(const std::filesystem::path& path, const ArchiveDecodeOptions& opt) {
    const auto text = fs_utils::read_text_file(path);
    const auto label = path.filename().string();
    return DecodeJsonText(text, opt, label);
}

}  // namespace nska
