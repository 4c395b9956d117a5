/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool minimal = false;
    bool strict = false;
    bool debug = false;
    std::optional<fs::path> out_root;
};

static void print_usage() {
    DNTKIT_LOG_INFO(
        "Usage:\n" \
        "    dnt_parser <file-or-dir> [--minimal] [--strict] [--out <dir>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory\n" \
        "    .dnt inputs are written to <out>/json, .json inputs to <out>/dnt\n" \
        "    --minimal     writes rows as objects keyed by column name (no tags, not re-encodable)\n" \
        "                  a repeated column name keeps only its last value\n" \
        "    --strict      requires the THEND sentinel when decoding\n" \
        "    --out <dir>   output root, defaults to ./output next to the executable\n" \
        "    --debug       enables extra logging\n"
    );
    DNTKIT_LOG_INFO("[INFO] *_minimal.json inputs are skipped.");
}

static nlohmann::ordered_json read_json_file(const fs::path& path, bool debug) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = dntkit::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto text = std::string(bytes.begin(), bytes.end());
    auto json = nlohmann::ordered_json::parse(text);
    const auto t1 = std::chrono::steady_clock::now();
    if (debug) {
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        DNTKIT_LOG_INFO(
            "JSON read %s: bytes=%zu parse=%lldms", path.string().c_str(), bytes.size(),
            static_cast<long long>(parse_ms)
        );
    }
    return json;
}

// Returns false when the file failed.
static bool process_file(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    const bool is_dnt = dntkit::fs_utils::is_dnt_file(path);
    const bool is_json = dntkit::fs_utils::is_json_file(path);
    if ((!is_dnt && !is_json) || dntkit::fs_utils::is_minimal_json(path)) {
        DNTKIT_LOG_WARN("Skipped: %s", path.string().c_str());
        return true;
    }

    const std::string base = path.stem().string();
    const fs::path cwd = fs::current_path();
    try {
        if (is_dnt) {
            dntkit::dnt::ParserDecodeOptions opt{};
            opt.validate_sentinel = settings.strict;
            opt.minimal_json = settings.minimal;
            opt.debug = settings.debug;
            const auto res = dntkit::dnt::DntParser::DecodeDntFile(path, opt);
            const std::string suffix = settings.minimal ? "_minimal" : "";
            const fs::path json_path = out_root / "json" / (base + suffix + ".json");
            dntkit::fs_utils::write_text_file(json_path, res.json.dump(2));
            DNTKIT_LOG_INFO("Wrote: %s", dntkit::fs_utils::display_path(json_path, cwd).c_str());
        } else {
            const auto doc = read_json_file(path, settings.debug);
            dntkit::dnt::ParserEncodeOptions opt{};
            opt.debug = settings.debug;
            const auto res = dntkit::dnt::DntParser::EncodeJsonToDnt(doc, opt, base);
            const fs::path dnt_path = out_root / "dnt" / (base + ".dnt");
            dntkit::fs_utils::write_file(dnt_path, res.dnt_bytes);
            DNTKIT_LOG_INFO("Wrote: %s", dntkit::fs_utils::display_path(dnt_path, cwd).c_str());
        }
    } catch (const std::exception& e) {
        DNTKIT_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        DNTKIT_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--minimal") {
            settings.minimal = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                DNTKIT_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_root = fs::path(argv[++i]);
            continue;
        }
        DNTKIT_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        DNTKIT_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = settings.out_root.has_value()
                                  ? *settings.out_root
                                  : dntkit::fs_utils::executable_dir() / "output";

    std::vector<fs::path> inputs;
    if (fs::is_directory(input)) {
        inputs = dntkit::fs_utils::collect_inputs(input);
    } else {
        inputs.push_back(input);
    }

    int failures = 0;
    for (const auto& p : inputs) {
        if (!process_file(p, out_root, settings)) {
            failures++;
        }
    }
    if (failures > 0) {
        DNTKIT_LOG_ERROR("%d of %zu file(s) failed.", failures, inputs.size());
        return 3;
    }
    return 0;
}
