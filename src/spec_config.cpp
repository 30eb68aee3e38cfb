#include "spec_config.hpp"

// import fsprov
#include "fsprov/file_utils.hpp"

#include <algorithm>    // for find
#include <array>        // for array
#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string_view>  // for string_view
#include <utility>      // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

static constexpr std::array KNOWN_KEYS{
    "name"sv,
    "label"sv,
    "device"sv,
    "vg"sv,
    "file"sv,
    "uuid"sv,
    "fstype"sv,
    "mkfs_options"sv,
    "package"sv,
    "sparse"sv,
    "size"sv,
    "stripes"sv,
    "mirrors"sv,
    "mount"sv,
    "options"sv,
    "user"sv,
    "group"sv,
    "mode"sv,
    "pass"sv,
    "dump"sv,
    "force"sv,
    "ignore_existing"sv,
    "device_defer"sv,
};

using ParseResult = std::expected<void, std::string>;

auto read_string(const rapidjson::Document& doc, const char* key, std::optional<std::string>& out) noexcept -> ParseResult {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = doc[key].GetString();
    return {};
}

auto read_string(const rapidjson::Document& doc, const char* key, std::string& out) noexcept -> ParseResult {
    std::optional<std::string> value{};
    if (auto parsed = read_string(doc, key, value); !parsed) {
        return parsed;
    }
    if (value) {
        out = std::move(*value);
    }
    return {};
}

auto read_bool(const rapidjson::Document& doc, const char* key, bool& out) noexcept -> ParseResult {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsBool()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a boolean"), key));
    }
    out = doc[key].GetBool();
    return {};
}

auto read_int(const rapidjson::Document& doc, const char* key, std::optional<std::int32_t>& out) noexcept -> ParseResult {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsInt()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be an integer"), key));
    }
    out = doc[key].GetInt();
    return {};
}

}  // namespace

namespace cli {

auto parse_spec_config(std::string_view json_content) noexcept
    -> std::expected<fsprov::FilesystemSpec, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    for (const auto& member : doc.GetObject()) {
        const std::string_view key{member.name.GetString(), member.name.GetStringLength()};
        if (std::ranges::find(KNOWN_KEYS, key) == KNOWN_KEYS.end()) {
            return std::unexpected(fmt::format(FMT_COMPILE("unknown field '{}'"), key));
        }
    }

    fsprov::FilesystemSpec spec{};

    // Parse name (required)
    if (!doc.HasMember("name") || !doc["name"].IsString() || doc["name"].GetStringLength() == 0) {
        return std::unexpected("'name' field is required and must be a non-empty string");
    }
    spec.name = doc["name"].GetString();

    std::optional<std::int32_t> pass{};
    std::optional<std::int32_t> dump{};

    for (auto&& parsed : {
             read_string(doc, "label", spec.label),
             read_string(doc, "device", spec.device),
             read_string(doc, "vg", spec.vg),
             read_string(doc, "file", spec.file),
             read_string(doc, "uuid", spec.uuid),
             read_string(doc, "fstype", spec.fstype),
             read_string(doc, "mkfs_options", spec.mkfs_options),
             read_string(doc, "package", spec.package),
             read_bool(doc, "sparse", spec.sparse),
             read_string(doc, "size", spec.size),
             read_int(doc, "stripes", spec.stripes),
             read_int(doc, "mirrors", spec.mirrors),
             read_string(doc, "mount", spec.mount),
             read_string(doc, "options", spec.options),
             read_string(doc, "user", spec.user),
             read_string(doc, "group", spec.group),
             read_string(doc, "mode", spec.mode),
             read_int(doc, "pass", pass),
             read_int(doc, "dump", dump),
             read_bool(doc, "force", spec.force),
             read_bool(doc, "ignore_existing", spec.ignore_existing),
             read_bool(doc, "device_defer", spec.device_defer),
         }) {
        if (!parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
    }

    if (spec.label && spec.label->empty()) {
        return std::unexpected("'label' must not be empty");
    }
    if (spec.fstype.empty()) {
        return std::unexpected("'fstype' must not be empty");
    }

    // fstab only knows 0, 1 and 2 for both fields
    if (pass) {
        auto fsck_pass = fsprov::fsck_pass_from_int(*pass);
        if (!fsck_pass) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid pass '{}'. Valid values: 0, 1, 2"), *pass));
        }
        spec.pass = *fsck_pass;
    }
    if (dump) {
        auto dump_freq = fsprov::dump_frequency_from_int(*dump);
        if (!dump_freq) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid dump '{}'. Valid values: 0, 1, 2"), *dump));
        }
        spec.dump = *dump_freq;
    }
    if (spec.stripes && *spec.stripes < 1) {
        return std::unexpected("'stripes' must be positive");
    }
    if (spec.mirrors && *spec.mirrors < 0) {
        return std::unexpected("'mirrors' must not be negative");
    }

    return spec;
}

auto load_spec_config(std::string_view filepath) noexcept
    -> std::expected<fsprov::FilesystemSpec, std::string> {
    auto json_content = fsprov::file_utils::read_whole_file(filepath);
    if (!json_content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read config '{}'"), filepath));
    }
    return parse_spec_config(*json_content);
}

}  // namespace cli
