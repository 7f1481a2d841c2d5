#pragma once

// Define RYML_SINGLE_HDR_DEFINE_NOW in exactly one translation unit before including this header.

#include "value.hpp"
#include "options.hpp"
#include "variant.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "error_formatting.hpp"
