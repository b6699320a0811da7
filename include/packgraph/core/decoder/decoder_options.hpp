/**
 * @file decoder_options.hpp
 * @brief Configuration of a decode run.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>

namespace packgraph {

    /**
     * @struct DecoderOptions
     * @brief Options controlling a single parse call.
     *
     * Passed by value into MsgPackParser; a parser never changes its options.
     */
    struct DecoderOptions {
        bool     trimStrings{ false };  ///< Trim ASCII whitespace from decoded strings and map keys
        bool     strict{ false };       ///< Reject bytes after the top-level value
        bool     validateUtf8{ false }; ///< Reject strings that are not well-formed UTF-8
        uint32_t maxDepth{ 512 };       ///< Maximum nesting of aggregates
    };

}
