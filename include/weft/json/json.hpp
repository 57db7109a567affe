//! # JSON Format
//!
//! `Json` binds a validated `JsonConfiguration` to the JSON codecs. It is the
//! entry point for text, tree and (through `weft::dynamic`) native input.
//!
//! | Operation | Codec |
//! |-----------|-------|
//! | `decode_from_string` | `StreamingJsonDecoder` |
//! | `encode_to_string` | `StreamingJsonEncoder` |
//! | `parse_to_json_element` | `JsonParser` |
//! | `decode_from_json_element` | `JsonTreeDecoder` |
//! | `encode_to_json_element` | `JsonTreeEncoder` |
//!
//! ## Example
//!
//! ```cpp
//! JsonConfiguration config;
//! config.ignore_unknown_keys = false;
//! auto json = Json::make(config);
//! if (is_err(json)) {
//!     std::cerr << unwrap_err(json).to_string() << std::endl;
//!     return;
//! }
//! auto point = unwrap(json).decode_from_string(PointSerializer{}, R"({"x": 1, "y": 2})");
//! ```
//!
//! A `Json` is immutable; copies share the configuration and can be used
//! from several threads at once.

#pragma once

#include "weft/json/json_configuration.hpp"
#include "weft/json/json_parser.hpp"
#include "weft/json/json_tree_decoder.hpp"
#include "weft/json/json_tree_encoder.hpp"
#include "weft/json/streaming_json_decoder.hpp"
#include "weft/json/streaming_json_encoder.hpp"

#include <string>
#include <string_view>

namespace weft::json {

class Json {
public:
    /// Validates `config` and creates an instance using it.
    ///
    /// # Returns
    ///
    /// `InvalidConfiguration` if the configuration is rejected by
    /// `validate_configuration`.
    [[nodiscard]] static auto make(JsonConfiguration config) -> Result<Json, SerialError>;

    /// The instance with the default configuration.
    [[nodiscard]] static auto default_instance() -> const Json&;

    [[nodiscard]] auto configuration() const -> const JsonConfiguration& {
        return *config_;
    }

    template <typename T>
    [[nodiscard]] auto decode_from_string(const Serializer<T>& serializer,
                                          std::string_view text) const -> Result<T, SerialError> {
        return decode_json_text(*config_, serializer, text);
    }

    template <typename T>
    [[nodiscard]] auto encode_to_string(const Serializer<T>& serializer, const T& value) const
        -> Result<std::string, SerialError> {
        return encode_json_text(*config_, serializer, value);
    }

    /// Parses `text` into a tree without decoding it.
    [[nodiscard]] auto parse_to_json_element(std::string_view text) const
        -> Result<JsonValue, SerialError>;

    template <typename T>
    [[nodiscard]] auto decode_from_json_element(const Serializer<T>& serializer,
                                                const JsonValue& element) const
        -> Result<T, SerialError> {
        return decode_json_tree(*config_, serializer, element);
    }

    template <typename T>
    [[nodiscard]] auto encode_to_json_element(const Serializer<T>& serializer,
                                              const T& value) const
        -> Result<JsonValue, SerialError> {
        return encode_json_tree(*config_, serializer, value);
    }

private:
    explicit Json(Rc<const JsonConfiguration> config) : config_(std::move(config)) {}

    Rc<const JsonConfiguration> config_;
};

} // namespace weft::json
