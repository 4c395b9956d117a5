/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt_parser.h"

#include "dnt/dnt_json.h"
#include "dnt/dnt_table_decoder.h"
#include "dnt/dnt_table_encoder.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace dntkit::dnt {

static std::size_t count_wire_columns(const Table& table) {
    return table.head.empty() ? 0 : table.head.size() - 1;
}

DecodeResult
DntParser::DecodeDntFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = dntkit::fs_utils::read_file(path);
    return DecodeDntBytes(bytes, opt, path.filename().string());
}

DecodeResult DntParser::DecodeDntBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    DecodeOptions decode_opt{};
    decode_opt.validate_sentinel = opt.validate_sentinel;

    DecodeResult result{};
    result.table = decode_table(bytes, decode_opt);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.minimal_json) {
        for (const auto& name : duplicate_column_names(result.table)) {
            DNTKIT_LOG_WARN(
                "%s: column '%s' appears more than once; minimal JSON keeps the last one.",
                std::string(label).c_str(), name.c_str()
            );
        }
    }
    result.json =
        opt.minimal_json ? table_to_minimal_json(result.table) : table_to_json(result.table);
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto decode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto json_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        DNTKIT_LOG_INFO(
            "Decode %s: bytes=%zu columns=%zu rows=%zu decode=%lldms json=%lldms",
            std::string(label).c_str(), bytes.size(), count_wire_columns(result.table),
            result.table.body.size(), static_cast<long long>(decode_ms),
            static_cast<long long>(json_ms)
        );
    }
    return result;
}

EncodeResult
DntParser::EncodeTable(const Table& table, const ParserEncodeOptions& opt, std::string_view label) {
    const auto t0 = std::chrono::steady_clock::now();
    EncodeResult result{};
    result.dnt_bytes = encode_table(table);
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto encode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        DNTKIT_LOG_INFO(
            "Encode %s: columns=%zu rows=%zu bytes=%zu encode=%lldms",
            std::string(label).c_str(), count_wire_columns(table), table.body.size(),
            result.dnt_bytes.size(), static_cast<long long>(encode_ms)
        );
    }
    return result;
}

EncodeResult DntParser::EncodeJsonToDnt(
    const nlohmann::ordered_json& doc,
    const ParserEncodeOptions& opt,
    std::string_view label
) {
    if (doc.is_array()) {
        throw std::runtime_error(
            "Minimal JSON carries no column tags and cannot be encoded: " + std::string(label)
        );
    }
    const auto t0 = std::chrono::steady_clock::now();
    const Table table = table_from_json(doc);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        const auto json_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        DNTKIT_LOG_INFO(
            "JSON %s: columns=%zu rows=%zu parse=%lldms", std::string(label).c_str(),
            count_wire_columns(table), table.body.size(), static_cast<long long>(json_ms)
        );
    }
    return EncodeTable(table, opt, label);
}

void DntParser::WriteDntFile(
    const std::filesystem::path& path,
    const Table& table,
    const ParserEncodeOptions& opt
) {
    const auto res = EncodeTable(table, opt, path.filename().string());
    dntkit::fs_utils::write_file(path, res.dnt_bytes);
}

}  // namespace dntkit::dnt
