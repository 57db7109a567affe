#include "weft/json/json.hpp"

#include "weft/json/json_names.hpp"
#include "weft/log/log.hpp"

namespace weft::json {

auto Json::make(JsonConfiguration config) -> Result<Json, SerialError> {
    auto valid = validate_configuration(config);
    if (is_err(valid)) {
        WEFT_LOG_WARN("json", "Rejected configuration: " << unwrap_err(valid).message);
        return unwrap_err(valid);
    }
    WEFT_LOG_DEBUG("json", "Created Json instance (lenient=" << config.is_lenient
                                                             << ", explicit_nulls="
                                                             << config.explicit_nulls
                                                             << ", discriminator='"
                                                             << config.class_discriminator << "')");
    // A copied configuration must not share the names maps of its source.
    config.names_cache = make_rc<NamesMapCache>(config);
    return Json(make_rc<const JsonConfiguration>(std::move(config)));
}

auto Json::default_instance() -> const Json& {
    static const Json instance = [] {
        JsonConfiguration config;
        config.names_cache = make_rc<NamesMapCache>(config);
        return Json(make_rc<const JsonConfiguration>(std::move(config)));
    }();
    return instance;
}

auto Json::parse_to_json_element(std::string_view text) const -> Result<JsonValue, SerialError> {
    return parse_json(text, *config_);
}

} // namespace weft::json
