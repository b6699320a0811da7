/**
 * @file json_view.hpp
 * @brief Rendering of decoded value graphs as nlohmann::json.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/value/value.hpp"
#include <nlohmann/json.hpp>

namespace packgraph {

    /**
     * @brief Convert a value graph to JSON for display.
     *
     * Binary becomes an array of byte values, a Character a one-character
     * string and a Record an object of its assigned fields. Map keys that are
     * not strings are rendered with Value::toDebugString(). Objects render as
     * the string "<object>".
     */
    nlohmann::json toJson(const Value& value);

}
