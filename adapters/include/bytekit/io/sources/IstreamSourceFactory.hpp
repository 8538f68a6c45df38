#ifndef INCLUDE_BYTEKIT_IO_SOURCES_ISTREAMSOURCEFACTORY_HPP
#define INCLUDE_BYTEKIT_IO_SOURCES_ISTREAMSOURCEFACTORY_HPP

#include "bytekit/io/IByteSource.hpp"
#include <istream>
#include <memory>

namespace bytekit::io::sources
{

// Takes ownership of `in`; close() destroys the stream.
[[nodiscard]] std::unique_ptr<bytekit::io::IByteSource> makeIstreamSource(std::unique_ptr<std::istream> in);

} // namespace bytekit::io::sources

#endif // INCLUDE_BYTEKIT_IO_SOURCES_ISTREAMSOURCEFACTORY_HPP
