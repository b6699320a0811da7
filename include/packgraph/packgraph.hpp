// This is the single entry point for the packgraph library.
// Include this file to get access to the core public API.

#pragma once

// Parsing entry point and options
#include "packgraph/core/parser/msgpack_parser.hpp"
#include "packgraph/core/decoder/decoder_options.hpp"

// Value graph
#include "packgraph/core/value/value.hpp"

// Type descriptors and the default resolver
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/types/type_registry.hpp"
#include "packgraph/core/types/function_swap.hpp"

// Public interfaces for extension
#include "packgraph/core/interfaces/itype_resolver.hpp"
#include "packgraph/core/interfaces/iswap.hpp"
#include "packgraph/core/interfaces/ibyte_source.hpp"

// Lower-level building blocks
#include "packgraph/core/io/memory_source.hpp"
#include "packgraph/core/io/stream_source.hpp"
#include "packgraph/core/io/stream_reader.hpp"
#include "packgraph/core/decoder/decoder.hpp"

// Encoding
#include "packgraph/core/serializer/msgpack_serializer.hpp"

// Utilities
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/util/logger.hpp"
#include "packgraph/core/util/json_view.hpp"
