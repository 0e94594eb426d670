#include "Zipper.hpp"

#include "Exception.hpp"
#include "miniz_extension.hpp"

#include <boost/log/trivial.hpp>

namespace PandaPrint {

class Zipper::Impl : public MZ_Archive {
public:
    bool finalized{false};

    std::string formatted_errorstr() const
    {
        return "Error with in-memory zip archive: " + get_errorstr();
    }

    [[noreturn]] void blow_up() const
    {
        throw RuntimeError(formatted_errorstr());
    }
};

Zipper::Zipper(e_compression compression) : m_impl(new Impl()), m_compression(compression)
{
    if (!mz_zip_writer_init_heap(&m_impl->arch, 0, 0))
        m_impl->blow_up();
}

Zipper::~Zipper()
{
    // The heap buffer is released no matter what...
    if (!mz_zip_writer_end(&m_impl->arch))
        BOOST_LOG_TRIVIAL(error) << m_impl->formatted_errorstr();
}

void Zipper::add_entry(const std::string& name, const void* data, size_t bytes)
{
    if (m_impl->finalized)
        throw LogicError("Zipper: entry \"" + name + "\" added after finalize()");

    mz_uint cmpr = MZ_NO_COMPRESSION;
    switch (m_compression) {
    case NO_COMPRESSION: cmpr = MZ_NO_COMPRESSION; break;
    case FAST_COMPRESSION: cmpr = MZ_BEST_SPEED; break;
    case TIGHT_COMPRESSION: cmpr = MZ_BEST_COMPRESSION; break;
    }

    if (!mz_zip_writer_add_mem(&m_impl->arch, name.c_str(), data, bytes, cmpr))
        m_impl->blow_up();

    ++m_entries;
}

std::string Zipper::finalize()
{
    if (m_impl->finalized)
        throw LogicError("Zipper: archive already finalized");

    void*  buf  = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&m_impl->arch, &buf, &size))
        m_impl->blow_up();
    m_impl->finalized = true;

    std::string out(static_cast<const char*>(buf), size);
    mz_free(buf);
    return out;
}

} // namespace PandaPrint
