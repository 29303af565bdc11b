#pragma once

// This header file includes all implementations of IBinaryReader for ease of use.

#include "binary_reader_file.hpp"
#include "binary_reader_mem.hpp"
#include "binary_reader_subview.hpp"
