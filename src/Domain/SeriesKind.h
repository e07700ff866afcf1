#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace Domain
{

/// Selects which history series a query targets.
/// FileSystemUsedSpace carries the filesystem name it is keyed on; the other kinds ignore it.
class SeriesKind
{
  public:
    enum class Tag
    {
        IoRead,
        IoWrite,
        FileSystemUsedSpace,
    };

    [[nodiscard]] static SeriesKind ioRead()
    {
        return SeriesKind(Tag::IoRead, {});
    }

    [[nodiscard]] static SeriesKind ioWrite()
    {
        return SeriesKind(Tag::IoWrite, {});
    }

    [[nodiscard]] static SeriesKind fileSystemUsedSpace(std::string name)
    {
        return SeriesKind(Tag::FileSystemUsedSpace, std::move(name));
    }

    [[nodiscard]] Tag tag() const noexcept
    {
        return m_Tag;
    }

    [[nodiscard]] const std::string& key() const noexcept
    {
        return m_Key;
    }

    [[nodiscard]] bool operator==(const SeriesKind& other) const = default;

  private:
    SeriesKind(Tag tag, std::string key) : m_Tag(tag), m_Key(std::move(key))
    {
    }

    Tag m_Tag;
    std::string m_Key;
};

[[nodiscard]] inline const char* toString(SeriesKind::Tag tag) noexcept
{
    switch (tag)
    {
    case SeriesKind::Tag::IoRead:
        return "IoRead";
    case SeriesKind::Tag::IoWrite:
        return "IoWrite";
    case SeriesKind::Tag::FileSystemUsedSpace:
        return "FileSystemUsedSpace";
    }
    return "Unknown";
}

} // namespace Domain

template<> struct std::hash<Domain::SeriesKind>
{
    [[nodiscard]] std::size_t operator()(const Domain::SeriesKind& kind) const noexcept
    {
        const std::size_t tagHash = std::hash<int>{}(static_cast<int>(kind.tag()));
        const std::size_t keyHash = std::hash<std::string>{}(kind.key());
        return tagHash ^ (keyHash + 0x9e3779b97f4a7c15ULL + (tagHash << 6) + (tagHash >> 2));
    }
};
