//! # JSON Name Resolution
//!
//! Maps between element indices and the keys found in JSON input.
//!
//! An element is known in JSON by its serial name, unless a naming strategy
//! renames it (Class descriptors only). With `use_alternative_names` its
//! alternative names are accepted as well. With
//! `decode_enums_case_insensitive`, Enum entries match in lowercase.
//!
//! ## Fast and Slow Paths
//!
//! When no strategy or case folding applies, a lookup first tries the
//! descriptor's own `get_element_index` (fast path) and consults the
//! *deserialization names map* only on a miss (slow path). The names map
//! holds every accepted name that is not a plain serial name; building it
//! detects two elements claiming the same name.

#pragma once

#include "weft/core/serial_error.hpp"
#include "weft/descriptor/serial_descriptor.hpp"
#include "weft/json/json_configuration.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace weft::json {

/// Accepted JSON name to element index.
using NamesMap = std::unordered_map<std::string, size_t>;

/// Shared empty names map, for descriptors that never need one.
[[nodiscard]] auto empty_names_map() -> const Rc<const NamesMap>&;

/// The naming strategy applied to `descriptor`, or nullptr.
[[nodiscard]] auto naming_strategy_for(const JsonConfiguration& config,
                                       const SerialDescriptor& descriptor)
    -> const JsonNamingStrategy*;

/// True if `descriptor` is an Enum matched case-insensitively.
[[nodiscard]] auto decode_case_insensitive(const JsonConfiguration& config,
                                           const SerialDescriptor& descriptor) -> bool;

/// True if name lookups for `descriptor` can reach the slow path.
[[nodiscard]] auto needs_names_map(const JsonConfiguration& config,
                                   const SerialDescriptor& descriptor) -> bool;

/// Builds the deserialization names map of `descriptor`.
///
/// Fails with `InvalidDescriptor` if two elements claim the same name.
[[nodiscard]] auto build_deserialization_names_map(const JsonConfiguration& config,
                                                   const SerialDescriptor& descriptor)
    -> Result<NamesMap, SerialError>;

/// Names maps of one `Json` instance, keyed by descriptor.
///
/// Each entry keeps its descriptor alive, so a key address is never reused.
/// A cache answers only for configurations that agree with the one it was
/// created for on the options shaping a names map. Thread safe.
class NamesMapCache {
public:
    explicit NamesMapCache(const JsonConfiguration& config);

    /// The names map of `descriptor`, built on first use. Descriptors not
    /// owned by a `DescriptorPtr` and foreign configurations bypass the cache.
    auto get(const JsonConfiguration& config, const SerialDescriptor& descriptor)
        -> Result<Rc<const NamesMap>, SerialError>;

    [[nodiscard]] auto size() const -> size_t;

private:
    struct Entry {
        DescriptorPtr descriptor;
        Rc<const NamesMap> names;
    };

    [[nodiscard]] auto serves(const JsonConfiguration& config) const -> bool;

    bool use_alternative_names_;
    bool case_insensitive_;
    const JsonNamingStrategy* strategy_;
    mutable std::mutex mutex_;
    std::unordered_map<const SerialDescriptor*, Entry> entries_;
};

/// The names map of `descriptor`, through `config.names_cache` if set.
[[nodiscard]] auto names_map_for(const JsonConfiguration& config,
                                 const SerialDescriptor& descriptor)
    -> Result<Rc<const NamesMap>, SerialError>;

/// Index of the element known in JSON as `name`, or nullopt.
[[nodiscard]] auto get_json_name_index(const JsonConfiguration& config,
                                       const SerialDescriptor& descriptor, std::string_view name,
                                       const NamesMap& names) -> std::optional<size_t>;

/// Like the overload above. The names map is fetched with `names_map_for`
/// only if the slow path is reached.
[[nodiscard]] auto get_json_name_index(const JsonConfiguration& config,
                                       const SerialDescriptor& descriptor, std::string_view name)
    -> Result<std::optional<size_t>, SerialError>;

/// Index of the enum entry named `name`.
///
/// Fails with `UnknownEnumValue` if no entry matches.
[[nodiscard]] auto get_enum_index(const JsonConfiguration& config,
                                  const SerialDescriptor& enum_descriptor, std::string_view name)
    -> Result<size_t, SerialError>;

/// Name written to JSON for element `index`.
[[nodiscard]] auto serial_name_for_json(const JsonConfiguration& config,
                                        const SerialDescriptor& descriptor, size_t index)
    -> std::string;

/// Finds the key under which element `index` appears in a JSON object.
///
/// Tries the element's serial name first; then, if a strategy applies or
/// alternative names are enabled, scans `keys` for one mapped to `index`.
/// Without a match, returns the name the element would be written under, so
/// that "missing" errors mention the name the user expects.
///
/// # Arguments
///
/// * `names` - The names map of `descriptor`
/// * `keys` - Keys of the source object, in source order
/// * `has_key` - Tests whether the source object contains a key
[[nodiscard]] auto resolve_element_name(const JsonConfiguration& config,
                                        const SerialDescriptor& descriptor, size_t index,
                                        const NamesMap& names, const std::vector<std::string>& keys,
                                        const std::function<bool(const std::string&)>& has_key)
    -> std::string;

} // namespace weft::json
