#include "ZipperArchive.hpp"

#include "Exception.hpp"
#include "miniz_extension.hpp"

#include <boost/log/trivial.hpp>

namespace PandaPrint {

class ZipperArchive::Impl : public MZ_Archive
{
public:
    [[noreturn]] void blow_up(const std::string& what) const
    {
        throw MalformedArchiveError(what + ": " + get_errorstr());
    }
};

ZipperArchive::ZipperArchive(const std::string& data) : m_impl(new Impl())
{
    if (!mz_zip_reader_init_mem(&m_impl->arch, data.data(), data.size(), 0))
        m_impl->blow_up("Cannot open zip archive");

    const mz_uint num_entries = mz_zip_reader_get_num_files(&m_impl->arch);
    m_entries.reserve(num_entries);

    mz_zip_archive_file_stat stat;
    for (mz_uint i = 0; i < num_entries; ++i) {
        if (!mz_zip_reader_file_stat(&m_impl->arch, i, &stat)) {
            mz_zip_reader_end(&m_impl->arch);
            m_impl->blow_up("Cannot read zip directory entry " + std::to_string(i));
        }
        m_entries.push_back({i, stat.m_filename, bool(stat.m_is_directory), stat.m_uncomp_size});
    }
}

ZipperArchive::~ZipperArchive()
{
    if (!mz_zip_reader_end(&m_impl->arch))
        BOOST_LOG_TRIVIAL(error) << "Error closing zip archive: " << m_impl->get_errorstr();
}

std::vector<std::string> ZipperArchive::names() const
{
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const Entry& entry : m_entries)
        out.push_back(entry.name);
    return out;
}

std::string ZipperArchive::read(const Entry& entry) const
{
    if (entry.is_directory || entry.uncompressed_size == 0)
        return {};

    size_t size = 0;
    void*  buf  = mz_zip_reader_extract_to_heap(&m_impl->arch, entry.index, &size, 0);
    if (buf == nullptr)
        m_impl->blow_up("Cannot extract \"" + entry.name + "\"");

    std::string out(static_cast<const char*>(buf), size);
    mz_free(buf);
    return out;
}

std::string ZipperArchive::read(const std::string& name) const
{
    for (const Entry& entry : m_entries)
        if (entry.name == name)
            return read(entry);
    throw MalformedArchiveError("No entry \"" + name + "\" in zip archive");
}

} // namespace PandaPrint
