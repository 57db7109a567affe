#include "weft/json/json_names.hpp"

#include "weft/log/log.hpp"

#include <algorithm>
#include <cctype>

namespace weft::json {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto lookup(const NamesMap& names, const std::string& name) -> std::optional<size_t> {
    auto it = names.find(name);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

auto naming_strategy_for(const JsonConfiguration& config, const SerialDescriptor& descriptor)
    -> const JsonNamingStrategy* {
    if (descriptor.kind() != SerialKind::Class) {
        return nullptr;
    }
    return config.naming_strategy.get();
}

auto decode_case_insensitive(const JsonConfiguration& config, const SerialDescriptor& descriptor)
    -> bool {
    return config.decode_enums_case_insensitive && descriptor.kind() == SerialKind::Enum;
}

auto needs_names_map(const JsonConfiguration& config, const SerialDescriptor& descriptor) -> bool {
    if (decode_case_insensitive(config, descriptor) || naming_strategy_for(config, descriptor)) {
        return true;
    }
    if (!config.use_alternative_names) {
        return false;
    }
    for (size_t i = 0; i < descriptor.elements_count(); ++i) {
        if (!descriptor.get_element_alternative_names(i).empty()) {
            return true;
        }
    }
    return false;
}

auto build_deserialization_names_map(const JsonConfiguration& config,
                                     const SerialDescriptor& descriptor)
    -> Result<NamesMap, SerialError> {
    const bool lowercase = decode_case_insensitive(config, descriptor);
    const JsonNamingStrategy* strategy = naming_strategy_for(config, descriptor);
    const char* entity = descriptor.kind() == SerialKind::Enum ? "enum value" : "property";

    NamesMap names;
    auto put = [&](std::string name, size_t index) -> std::optional<SerialError> {
        auto [it, inserted] = names.emplace(name, index);
        if (!inserted && it->second != index) {
            WEFT_LOG_ERROR("json", "Name collision '" << name << "' in "
                                                       << descriptor.serial_name());
            return SerialError::make(ErrorKind::InvalidDescriptor,
                                     "The suggested name '" + name + "' for " + entity + " " +
                                         descriptor.get_element_name(index) +
                                         " is already one of the names for " + entity + " " +
                                         descriptor.get_element_name(it->second) + " in " +
                                         descriptor.to_string());
        }
        return std::nullopt;
    };

    for (size_t i = 0; i < descriptor.elements_count(); ++i) {
        if (config.use_alternative_names) {
            for (const auto& alternative : descriptor.get_element_alternative_names(i)) {
                if (auto error = put(lowercase ? to_lower(alternative) : alternative, i)) {
                    return *error;
                }
            }
        }

        std::optional<std::string> name;
        if (lowercase) {
            name = to_lower(descriptor.get_element_name(i));
        } else if (strategy) {
            name = strategy->serial_name_for_json(descriptor, i, descriptor.get_element_name(i));
        }
        if (name) {
            if (auto error = put(std::move(*name), i)) {
                return *error;
            }
        }
    }

    WEFT_LOG_TRACE("json", "Built names map of " << descriptor.serial_name() << " with "
                                                 << names.size() << " entries");
    return names;
}

// ============================================================================
// NamesMapCache
// ============================================================================

auto empty_names_map() -> const Rc<const NamesMap>& {
    static const Rc<const NamesMap> empty = make_rc<NamesMap>();
    return empty;
}

NamesMapCache::NamesMapCache(const JsonConfiguration& config)
    : use_alternative_names_(config.use_alternative_names),
      case_insensitive_(config.decode_enums_case_insensitive),
      strategy_(config.naming_strategy.get()) {}

auto NamesMapCache::serves(const JsonConfiguration& config) const -> bool {
    return config.use_alternative_names == use_alternative_names_ &&
           config.decode_enums_case_insensitive == case_insensitive_ &&
           config.naming_strategy.get() == strategy_;
}

auto NamesMapCache::get(const JsonConfiguration& config, const SerialDescriptor& descriptor)
    -> Result<Rc<const NamesMap>, SerialError> {
    DescriptorPtr owner = descriptor.weak_from_this().lock();
    const bool cacheable = owner && serves(config);
    if (cacheable) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(&descriptor);
        if (it != entries_.end()) {
            return it->second.names;
        }
    }

    auto built = build_deserialization_names_map(config, descriptor);
    if (is_err(built)) {
        return unwrap_err(built);
    }
    auto names = make_rc<NamesMap>(std::move(unwrap(built)));
    if (!cacheable) {
        return names;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Another thread may have built the same map meanwhile; keep the first.
    auto [it, _] = entries_.emplace(&descriptor, Entry{std::move(owner), std::move(names)});
    return it->second.names;
}

auto NamesMapCache::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto names_map_for(const JsonConfiguration& config, const SerialDescriptor& descriptor)
    -> Result<Rc<const NamesMap>, SerialError> {
    if (config.names_cache) {
        return config.names_cache->get(config, descriptor);
    }
    auto built = build_deserialization_names_map(config, descriptor);
    if (is_err(built)) {
        return unwrap_err(built);
    }
    return make_rc<NamesMap>(std::move(unwrap(built)));
}

// ============================================================================
// Lookups
// ============================================================================

auto get_json_name_index(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                         std::string_view name, const NamesMap& names) -> std::optional<size_t> {
    if (decode_case_insensitive(config, descriptor)) {
        return lookup(names, to_lower(name));
    }
    if (naming_strategy_for(config, descriptor)) {
        return lookup(names, std::string(name));
    }
    // Fast path: the plain serial name
    if (auto index = descriptor.get_element_index(name)) {
        return index;
    }
    if (!config.use_alternative_names) {
        return std::nullopt;
    }
    return lookup(names, std::string(name));
}

auto get_json_name_index(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                         std::string_view name) -> Result<std::optional<size_t>, SerialError> {
    if (!needs_names_map(config, descriptor)) {
        return descriptor.get_element_index(name);
    }
    if (!decode_case_insensitive(config, descriptor) && !naming_strategy_for(config, descriptor)) {
        if (auto index = descriptor.get_element_index(name)) {
            return index;
        }
    }
    auto names = names_map_for(config, descriptor);
    if (is_err(names)) {
        return unwrap_err(names);
    }
    return get_json_name_index(config, descriptor, name, *unwrap(names));
}

auto get_enum_index(const JsonConfiguration& config, const SerialDescriptor& enum_descriptor,
                    std::string_view name) -> Result<size_t, SerialError> {
    auto index = get_json_name_index(config, enum_descriptor, name);
    if (is_err(index)) {
        return unwrap_err(index);
    }
    if (!unwrap(index)) {
        return SerialError::make(ErrorKind::UnknownEnumValue,
                                 enum_descriptor.serial_name() +
                                     " does not contain element with name '" + std::string(name) +
                                     "'");
    }
    return *unwrap(index);
}

auto serial_name_for_json(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                          size_t index) -> std::string {
    if (const auto* strategy = naming_strategy_for(config, descriptor)) {
        return strategy->serial_name_for_json(descriptor, index,
                                              descriptor.get_element_name(index));
    }
    return descriptor.get_element_name(index);
}

auto resolve_element_name(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                          size_t index, const NamesMap& names,
                          const std::vector<std::string>& keys,
                          const std::function<bool(const std::string&)>& has_key) -> std::string {
    const JsonNamingStrategy* strategy = naming_strategy_for(config, descriptor);
    const std::string& main_name = descriptor.get_element_name(index);
    if (!strategy) {
        if (!config.use_alternative_names) {
            return main_name;
        }
        // Fast path: the plain serial name
        if (has_key(main_name)) {
            return main_name;
        }
    }

    // Slow path
    for (const auto& key : keys) {
        auto it = names.find(key);
        if (it != names.end() && it->second == index) {
            return key;
        }
    }
    if (strategy) {
        return strategy->serial_name_for_json(descriptor, index, main_name);
    }
    return main_name;
}

} // namespace weft::json
