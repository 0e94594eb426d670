#ifndef pandaprint_ZipperArchive_hpp_
#define pandaprint_ZipperArchive_hpp_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace PandaPrint {

// Read-only view of a zip archive held in memory. The archive bytes are
// referenced, not copied: they must outlive the ZipperArchive.
class ZipperArchive
{
public:
    struct Entry
    {
        uint32_t    index;
        std::string name;
        bool        is_directory;
        uint64_t    uncompressed_size;
    };

    // Throws MalformedArchiveError when the bytes are not a zip archive.
    explicit ZipperArchive(const std::string& data);
    ~ZipperArchive();

    ZipperArchive(const ZipperArchive&) = delete;
    ZipperArchive& operator=(const ZipperArchive&) = delete;

    // Entries in central directory order.
    const std::vector<Entry>& entries() const { return m_entries; }

    std::vector<std::string> names() const;

    // Decompressed content of an entry. Throws MalformedArchiveError on CRC or inflate errors.
    std::string read(const Entry& entry) const;
    std::string read(const std::string& name) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
    std::vector<Entry>    m_entries;
};

} // namespace PandaPrint

#endif // pandaprint_ZipperArchive_hpp_
