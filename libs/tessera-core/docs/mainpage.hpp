/**
@file
@brief Main page documentation.
*/

/**
@mainpage Tessera

Tessera streams cell planes of tiled multidimensional datasets from local files and HTTP servers and decodes them into
typed element arrays. It is written in C++20.



@section usage Usage

@subsection opening Opening resources

Build a `tessera::io::HandleRegistry` with `tessera::io::MakeDefaultRegistry`, passing a `tessera::core::Configuration`
with the desired transport and file options. The default registry understands `http:` and `file:` locators. Additional
schemes can be added with `tessera::io::HandleRegistry::Register`.

```cpp
tessera::core::Configuration config{};
auto registry = tessera::io::MakeDefaultRegistry(config);

std::error_code error{};
auto handle = registry.Open("http://example.com/cells/0.raw", error);
if (error) {
    // error == tessera::io::StreamError::UnsupportedLocator, TransportError, ...
}
```

`tessera::io::HandleRegistry::Open` returns an opened `tessera::io::StreamHandle` positioned at offset 0.



@subsection seeking Reading and seeking

`tessera::io::StreamHandle` provides random access on top of forward-only transports. The most recently streamed bytes
(up to `tessera::io::kMaxOverhead`) are kept in a rewind buffer. Seeking back to any offset still held in that buffer
is free; seeking further back reconnects the transport and skips forward from the start.

Use `tessera::io::StreamHandle::ConnectionCount` to observe reconnections.



@subsection decoding Decoding planes

`tessera::cell::ArrayLoader` decodes raw planes into `tessera::cell::TypedArray` destinations. The plane format (bits
per pixel and byte order) is supplied by a `tessera::cell::IMetadataProvider` and queried on every load.

```cpp
tessera::cell::FixedPlaneFormat format{{.bitsPerPixel = 16, .littleEndian = true}};
tessera::cell::ArrayLoader loader{tessera::cell::ElementType::Int32, format};

const std::array<uint32, 3> dims{256, 256, 4};
tessera::cell::TypedArray cell = loader.EmptyArray(dims);
loader.Load(cell, planeBytes, 2, error);
```

Conversions validate everything before writing. A failed load leaves the destination untouched.



@subsection thread_safety Thread safety

Handles and loaders are not thread-safe. Independent handles share no state and may be used from different threads.
*/
