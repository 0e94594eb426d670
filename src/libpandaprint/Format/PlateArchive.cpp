#include "PlateArchive.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"
#include "libpandaprint/Zipper.hpp"
#include "libpandaprint/ZipperArchive.hpp"

#include <boost/algorithm/string.hpp>

namespace PandaPrint {

const char* const PLATE_METADATA_PREFIX = "Metadata/";
const char* const PLATE_GCODE_EXTENSION = ".gcode";
const char* const CANONICAL_PLATE_GCODE = "Metadata/plate_1.gcode";

namespace {

bool is_metadata(const std::string& name) { return boost::starts_with(name, PLATE_METADATA_PREFIX); }

bool is_plate_gcode(const std::string& name) { return is_metadata(name) && boost::ends_with(name, PLATE_GCODE_EXTENSION); }

std::vector<std::string> plate_gcodes(const ZipperArchive& zip)
{
    std::vector<std::string> gcodes;
    for (const auto& entry : zip.entries())
        if (is_plate_gcode(entry.name))
            gcodes.push_back(entry.name);
    return gcodes;
}

// Position of the dot that starts the extension chain, npos if none.
size_t extension_pos(const std::string& name)
{
    const size_t slash = name.rfind('/');
    return name.find('.', slash == std::string::npos ? 0 : slash + 1);
}

std::string make_plate(const ZipperArchive& zip, int plate_no)
{
    const std::string plate_token = std::to_string(plate_no);

    Zipper zipper;
    for (const auto& entry : zip.entries()) {
        if (!is_metadata(entry.name)) {
            // Not plate specific, goes to every plate.
            zipper.add_entry(entry.name, zip.read(entry));
        } else if (plate_entry_base(entry.name).find(plate_token) != std::string::npos) {
            auto renamed = rename_plate_entry(entry.name, plate_no);
            BOOST_LOG_TRIVIAL(trace) << boost::format("PlateArchive - plate %1%: %2% -> %3%") % plate_no % entry.name % renamed;
            zipper.add_entry(renamed, zip.read(entry));
        }
    }
    return zipper.finalize();
}

} // namespace

std::string plate_entry_base(const std::string& name)
{
    return name.substr(0, extension_pos(name));
}

std::string rename_plate_entry(const std::string& name, int plate_no)
{
    const size_t dot  = extension_pos(name);
    std::string  base = name.substr(0, dot);
    boost::replace_all(base, std::to_string(plate_no), "1");
    return dot == std::string::npos ? base : base + name.substr(dot);
}

std::vector<std::string> list_plate_gcodes(const std::string& archive)
{
    ZipperArchive zip(archive);
    return plate_gcodes(zip);
}

std::vector<PlateFile> split_plates(const std::string& archive, const std::string& filename)
{
    ZipperArchive zip(archive);
    const auto    gcodes = plate_gcodes(zip);

    std::vector<PlateFile> plates;
    if (gcodes.size() == 1) {
        // Only one plate, send the upload as is.
        BOOST_LOG_TRIVIAL(debug) << boost::format("PlateArchive - %1% has a single plate, passing it through") % filename;
        plates.push_back({filename, archive});
        return plates;
    }

    auto [base, ext] = split_filename(filename);
    if (ext.empty())
        ext = "3mf";

    BOOST_LOG_TRIVIAL(info) << boost::format("PlateArchive - splitting %1% into %2% plates") % filename % gcodes.size();
    for (int plate_no = 1; plate_no <= int(gcodes.size()); ++plate_no) {
        auto name = (boost::format("%1%-%2%.%3%") % base % plate_no % ext).str();
        plates.push_back({name, make_plate(zip, plate_no)});
    }
    return plates;
}

} // namespace PandaPrint
