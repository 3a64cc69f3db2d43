#pragma once

/**
@file
@brief The entrypoint of the Tessera core library. Includes all functionality needed to stream and decode cell planes.
*/

#include <tessera/version.hpp>

#include <tessera/core/configuration.hpp>

#include <tessera/io/handle_registry.hpp>
#include <tessera/io/stream_handle.hpp>

#include <tessera/cell/array_loader.hpp>
#include <tessera/cell/convert.hpp>
