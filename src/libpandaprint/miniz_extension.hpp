#ifndef pandaprint_miniz_extension_hpp_
#define pandaprint_miniz_extension_hpp_

#include <string>
#include <miniz.h>

namespace PandaPrint {

class MZ_Archive {
public:
    mz_zip_archive arch;

    MZ_Archive();

    static std::string get_errorstr(mz_zip_error mz_err);

    std::string get_errorstr() const
    {
        return get_errorstr(arch.m_last_error) + "!";
    }
};

} // namespace PandaPrint

#endif // pandaprint_miniz_extension_hpp_
