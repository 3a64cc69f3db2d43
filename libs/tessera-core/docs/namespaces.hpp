/**
@file
@brief Namespaces documentation.
*/

/**
@namespace bit
@brief Bitwise operations and bit twiddling tricks.

@namespace devlog
@brief Development logging utilities.

@namespace devlog::level
@brief Dev log levels.

@namespace util
@brief Utility functions, types, constants and concepts.

@namespace util::detail
@brief Internal implementation details for utilities.

@namespace tessera
@brief Tessera core namespace.

@namespace tessera::core
@brief Core library components.

@namespace tessera::io
@brief Seekable byte streams over local and remote resources.

@namespace tessera::io::grp
@brief Stream development logging groups.

@namespace tessera::cell
@brief Typed cell arrays and plane conversion.

@namespace tessera::cell::grp
@brief Cell loader development logging groups.

@namespace tessera::version
@brief Library version constants.
*/
