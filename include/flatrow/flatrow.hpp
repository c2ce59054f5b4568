#pragma once

/// Convenience umbrella header for the flatrow library.

#include <flatrow/core/error.hpp>
#include <flatrow/core/metadata.hpp>
#include <flatrow/core/options.hpp>
#include <flatrow/core/value.hpp>
#include <flatrow/io/byte_source.hpp>
#include <flatrow/io/record_parser.hpp>
#include <flatrow/io/record_stream.hpp>
#include <flatrow/reader/reader.hpp>
#include <flatrow/schema/column.hpp>
#include <flatrow/schema/schema.hpp>
#include <flatrow/schema/selector.hpp>
