#include "cactisynth/core/OtoEntry.h"

#include "TextUtil.h"
#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"

#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <optional>
#include <vector>

namespace cactisynth::core {
namespace {

using detail::parseDouble;
using detail::trim;

constexpr std::size_t kFieldCount = 6;

// Splits into at most maxFields pieces; the last piece keeps any further separators.
std::vector<std::string> splitFields(const std::string& text, char separator, std::size_t maxFields) {
    std::vector<std::string> fields;
    std::size_t begin = 0;
    while (fields.size() + 1 < maxFields) {
        const auto end = text.find(separator, begin);
        if (end == std::string::npos) {
            break;
        }
        fields.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    fields.push_back(text.substr(begin));
    return fields;
}

// Optional leading '-', digits, at most one '.'.
bool isNumericToken(const std::string& token) {
    std::size_t i = token.starts_with('-') ? 1 : 0;
    bool sawDigit = false;
    bool sawPoint = false;
    for (; i < token.size(); ++i) {
        const auto ch = static_cast<unsigned char>(token[i]);
        if (std::isdigit(ch)) {
            sawDigit = true;
        } else if (ch == '.' && !sawPoint) {
            sawPoint = true;
        } else {
            return false;
        }
    }
    return sawDigit;
}

std::optional<double> parseMs(const std::string& raw) {
    const auto token = trim(raw);
    if (token.empty()) {
        return 0.0;
    }
    if (!isNumericToken(token)) {
        return std::nullopt;
    }
    return parseDouble(token);
}

// Shortest fixed-point form; fromLine does not accept exponents.
std::string formatMs(double value) {
    std::array<char, 512> buffer{};
    const auto [end, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        return "0.0";
    }

    std::string text(buffer.data(), end);
    if (text.find_first_of(".ni") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace

OtoEntry OtoEntry::fromLine(const std::string& line) {
    OtoEntry entry;

    const auto eq = line.find('=');
    entry.file = trim(line.substr(0, eq));
    const auto fields = splitFields(eq == std::string::npos ? std::string{} : line.substr(eq + 1), ',', kFieldCount);

    entry.alias = trim(fields.front());
    if (entry.alias.empty()) {
        entry.alias = std::filesystem::path(entry.file).stem().string();
    }

    std::array<double, kFieldCount - 1> values{};
    bool valid = eq != std::string::npos;
    for (std::size_t i = 0; valid && i < values.size(); ++i) {
        const auto parsed = parseMs(i + 1 < fields.size() ? fields[i + 1] : std::string{});
        if (!parsed) {
            valid = false;
            break;
        }
        values[i] = *parsed;
    }

    if (!valid) {
        qCWarning(lcOto).noquote() << "Malformed OTO line" << qs(line)
                                   << "- using offset=0.0, fixed=0.0, blank=0.0, preutter=0.0, overlap=0.0";
        return entry;
    }

    entry.offset = values[0];
    entry.fixed = values[1];
    entry.blank = values[2];
    entry.preutter = values[3];
    entry.overlap = values[4];
    return entry;
}

std::string OtoEntry::toLine() const {
    return file + "=" + alias + "," + formatMs(offset) + "," + formatMs(fixed) + "," + formatMs(blank) + ","
           + formatMs(preutter) + "," + formatMs(overlap);
}

OtoField otoFieldFromName(std::string_view name) {
    constexpr std::array<OtoField, 7> kFields{
        OtoField::File,
        OtoField::Alias,
        OtoField::Offset,
        OtoField::Fixed,
        OtoField::Blank,
        OtoField::Preutter,
        OtoField::Overlap,
    };

    for (const auto field : kFields) {
        if (name == otoFieldName(field)) {
            return field;
        }
    }
    throw PreconditionError("Unknown OTO field: " + std::string(name));
}

const char* otoFieldName(OtoField field) noexcept {
    switch (field) {
    case OtoField::File:
        return "file";
    case OtoField::Alias:
        return "alias";
    case OtoField::Offset:
        return "offset";
    case OtoField::Fixed:
        return "fixed";
    case OtoField::Blank:
        return "blank";
    case OtoField::Preutter:
        return "preutter";
    case OtoField::Overlap:
        return "overlap";
    }
    return "";
}

OtoValue otoFieldValue(const OtoEntry& entry, OtoField field) {
    switch (field) {
    case OtoField::File:
        return entry.file;
    case OtoField::Alias:
        return entry.alias;
    case OtoField::Offset:
        return entry.offset;
    case OtoField::Fixed:
        return entry.fixed;
    case OtoField::Blank:
        return entry.blank;
    case OtoField::Preutter:
        return entry.preutter;
    case OtoField::Overlap:
        return entry.overlap;
    }
    throw PreconditionError("Unknown OTO field");
}

void requireOtoValueType(OtoField field, const OtoValue& value) {
    const bool textField = field == OtoField::File || field == OtoField::Alias;
    if (textField != std::holds_alternative<std::string>(value)) {
        throw PreconditionError(std::string("OTO field ") + otoFieldName(field) + " expects a "
                                + (textField ? "string" : "number"));
    }
}

bool otoFieldEquals(const OtoEntry& entry, OtoField field, const OtoValue& value) {
    requireOtoValueType(field, value);
    return otoFieldValue(entry, field) == value;
}

} // namespace cactisynth::core
