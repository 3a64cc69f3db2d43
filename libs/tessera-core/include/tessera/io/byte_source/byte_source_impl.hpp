#pragma once

// This header file includes all implementations of IByteSource for ease of use.

#include "byte_source_file.hpp"
#include "byte_source_mem.hpp"
#include "byte_source_mmap.hpp"
#include "byte_source_url.hpp"
