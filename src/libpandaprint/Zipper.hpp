#ifndef pandaprint_Zipper_hpp_
#define pandaprint_Zipper_hpp_

#include <cstddef>
#include <memory>
#include <string>

namespace PandaPrint {

// Builds a zip archive in memory.
class Zipper {
public:
    enum e_compression {
        NO_COMPRESSION,
        FAST_COMPRESSION,
        TIGHT_COMPRESSION
    };

    // Throws RuntimeError when miniz cannot set up the heap writer.
    explicit Zipper(e_compression level = FAST_COMPRESSION);
    ~Zipper();

    Zipper(const Zipper&) = delete;
    Zipper& operator=(const Zipper&) = delete;

    /// Add a new entry with the given content. Names ending with a slash
    /// create directory entries and must come with no data.
    void add_entry(const std::string& name, const void* data, size_t bytes);
    void add_entry(const std::string& name, const std::string& data) { add_entry(name, data.data(), data.size()); }

    /// Writes the central directory and hands out the archive bytes.
    /// No entry can be added afterwards.
    std::string finalize();

    size_t entries_count() const { return m_entries; }

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
    e_compression m_compression;
    size_t m_entries{0};
};

} // namespace PandaPrint

#endif // pandaprint_Zipper_hpp_
