#include "chunkvault/core/ByteSource.hpp"
#include <algorithm>
#include <limits>
#include <system_error>

namespace chunkvault::core
{

void MemoryByteSource::read(std::uint64_t offset, std::span<std::uint8_t> out)
{
    if (offset > m_bytes.size() || out.size() > m_bytes.size() - offset)
    {
        throw SourceReadError("MemoryByteSource: read past end");
    }
    const auto first{ m_bytes.subspan(static_cast<std::size_t>(offset), out.size()) };
    std::copy(first.begin(), first.end(), out.begin());
}

FileByteSource::FileByteSource(const std::filesystem::path& path) : m_in(path, std::ios::binary)
{
    if (!m_in)
    {
        throw SourceReadError("FileByteSource: cannot open " + path.string());
    }
    std::error_code ec{};
    const auto size{ std::filesystem::file_size(path, ec) };
    if (ec)
    {
        throw SourceReadError("FileByteSource: cannot stat " + path.string());
    }
    m_size = static_cast<std::uint64_t>(size);
}

void FileByteSource::read(std::uint64_t offset, std::span<std::uint8_t> out)
{
    if (offset > m_size || out.size() > m_size - offset)
    {
        throw SourceReadError("FileByteSource: read past end");
    }
    if (out.empty())
    {
        return;
    }
    if (offset > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max()))
    {
        throw SourceReadError("FileByteSource: offset out of range");
    }

    m_in.clear();
    m_in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    m_in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (m_in.gcount() != static_cast<std::streamsize>(out.size()))
    {
        throw SourceReadError("FileByteSource: short read");
    }
}

} // namespace chunkvault::core
