#ifndef INCLUDE_BYTEKIT_IO_SOURCES_FILESOURCEFACTORY_HPP
#define INCLUDE_BYTEKIT_IO_SOURCES_FILESOURCEFACTORY_HPP

#include "bytekit/io/IByteSource.hpp"
#include <filesystem>
#include <memory>

namespace bytekit::io::sources
{

// Opens `path` read-only. Throws std::system_error if the file cannot be opened.
[[nodiscard]] std::unique_ptr<bytekit::io::IByteSource> openFileSource(const std::filesystem::path& path);

} // namespace bytekit::io::sources

#endif // INCLUDE_BYTEKIT_IO_SOURCES_FILESOURCEFACTORY_HPP
