#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/view.hpp>
#include <tabula/state/controls.hpp>
#include <tabula/store/lookup_store.hpp>

#include <json/json.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace tabula::runtime {

inline constexpr std::string_view kDefaultLanguage = "DE-DE";

/// Table read when a dropdown config names none.
inline constexpr std::string_view kDropdownTable = "sys_dropdowndaten";

struct DropdownOption {
    std::string key;
    std::string value;

    auto operator==(const DropdownOption&) const -> bool = default;
};

/// Options of one list, plus key → label for rendering stored keys.
struct DropdownList {
    std::map<std::string, std::string> labels;
    std::vector<DropdownOption> options;
};

/// One dataset parsed for one language. Lists are keyed by lower-case name.
struct DropdownDataset {
    std::string default_language{kDefaultLanguage};
    std::map<std::string, DropdownList> lists;
};

/// Where a dropdown control takes its options from: `configs.dropdown` of
/// the control's origin attributes.
struct DropdownSource {
    std::string table;
    std::string key;
    std::string field;

    auto operator==(const DropdownSource&) const -> bool = default;
};

struct ResolvedDropdown {
    DropdownSource source;
    DropdownList list;
    /// Language the list was taken from.
    std::string language;
    std::string default_language;
};

/// Resolved dropdowns keyed by control id.
using Dropdowns = std::map<std::string, ResolvedDropdown>;

/// Upper-case, trimmed language tag; kDefaultLanguage when blank.
[[nodiscard]] auto normalize_language(std::string_view language) -> std::string;

/// Parse a dataset body:
///
/// ```json
/// {"ROOT": {"DEFAULT_LANGUAGE": "DE-DE"},
///  "DE-DE": {"<item>": {"name": "salutation",
///                       "edit_list": [{"key": "1", "value": "Mr"}, ...]}}}
/// ```
///
/// The section for `language` is read, or the default language's when there
/// is none. `list_name` wins over `name`. Options without key or value and
/// lists without options are skipped.
[[nodiscard]] auto parse_dropdown_dataset(const Json::Value& dataset, std::string_view language)
    -> DropdownDataset;

/// Dropdown source of a control, or nothing when the control is not a
/// dropdown or its config lacks `key` or `feld`.
[[nodiscard]] auto dropdown_source(const Control& control) -> std::optional<DropdownSource>;

/// Parsed lookup datasets of one session, keyed by (table, key, language).
///
/// A cached dataset that lacks the requested list is reloaded once. A list
/// missing in the requested language is looked up in the dataset's default
/// language.
class DropdownCache {
   public:
    explicit DropdownCache(store::LookupStore& lookups) : lookups_(lookups) {}

    DropdownCache(const DropdownCache&) = delete;
    DropdownCache& operator=(const DropdownCache&) = delete;

    /// Resolve every dropdown control. Store failures skip the control and
    /// add a warning.
    [[nodiscard]] auto resolve(std::span<const state::EffectiveControl> controls,
                               std::string_view language, std::vector<std::string>& warnings)
        -> Dropdowns;

    [[nodiscard]] auto lookup(const DropdownSource& source, std::string_view language)
        -> Result<ResolvedDropdown>;

   private:
    using Key = std::tuple<std::string, std::string, std::string>;
    using DatasetPtr = std::shared_ptr<const DropdownDataset>;

    [[nodiscard]] auto cached(const Key& key) const -> DatasetPtr;
    [[nodiscard]] auto load(const Key& key) -> Result<DatasetPtr>;

    store::LookupStore& lookups_;
    mutable std::mutex mutex_;
    std::map<Key, DatasetPtr> entries_;
};

}  // namespace tabula::runtime
