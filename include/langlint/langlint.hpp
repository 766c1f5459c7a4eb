#pragma once

/**
 * langlint
 *
 * Finds natural-language comments and docstrings in source files,
 * translates them and writes the files back unchanged everywhere else.
 */

#define LANGLINT_VERSION "0.1.0"

#include <langlint/types.hpp>
#include <langlint/result.hpp>
#include <langlint/config.hpp>
#include <langlint/cache.hpp>
#include <langlint/language_detector.hpp>
#include <langlint/parsers/parser_registry.hpp>
#include <langlint/translate/factory.hpp>
#include <langlint/pipeline.hpp>
