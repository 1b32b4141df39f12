#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace cactisynth::core {

// One line of oto.ini: file=alias,offset,fixed,blank,preutter,overlap (milliseconds).
struct OtoEntry {
    std::string file;
    std::string alias;
    double offset = 0.0;
    double fixed = 0.0;
    double blank = 0.0;
    double preutter = 0.0;
    double overlap = 0.0;

    // Never rejects a line. An unparsable numeric group becomes all zeros and is logged.
    [[nodiscard]] static OtoEntry fromLine(const std::string& line);
    [[nodiscard]] std::string toLine() const;

    bool operator==(const OtoEntry&) const = default;
};

enum class OtoField {
    File,
    Alias,
    Offset,
    Fixed,
    Blank,
    Preutter,
    Overlap,
};

using OtoValue = std::variant<std::string, double>;

// Accepts "file", "alias", "offset", "fixed", "blank", "preutter", "overlap".
// Throws PreconditionError for anything else.
[[nodiscard]] OtoField otoFieldFromName(std::string_view name);
[[nodiscard]] const char* otoFieldName(OtoField field) noexcept;
[[nodiscard]] OtoValue otoFieldValue(const OtoEntry& entry, OtoField field);

// Both throw PreconditionError when value holds the wrong alternative for field.
void requireOtoValueType(OtoField field, const OtoValue& value);
[[nodiscard]] bool otoFieldEquals(const OtoEntry& entry, OtoField field, const OtoValue& value);

} // namespace cactisynth::core
