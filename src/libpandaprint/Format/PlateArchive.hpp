#pragma once

#include <string>
#include <vector>

namespace PandaPrint {

// Prefix and extension of the per-plate machine code inside a 3mf package.
extern const char* const PLATE_METADATA_PREFIX;  // "Metadata/"
extern const char* const PLATE_GCODE_EXTENSION;  // ".gcode"
// Where the printer looks for the machine code of a single plate package.
extern const char* const CANONICAL_PLATE_GCODE;  // "Metadata/plate_1.gcode"

struct PlateFile
{
    std::string filename;
    std::string content;
};

// Splits a packaged print archive into single plate archives.
//
// A package with exactly one plate is returned untouched under its uploaded
// filename. A package with N > 1 plates yields N archives named
// "<base>-<i>.<ext>", each holding the shared members of the package plus the
// Metadata/ members of plate i renamed to plate 1. A package without plates
// yields nothing.
//
// Plates are matched by substring: plate 1 also picks the members of plate 10,
// 11...
//
// Throws MalformedArchiveError if the archive cannot be read.
std::vector<PlateFile> split_plates(const std::string& archive, const std::string& filename);

// Names of the Metadata/*.gcode members, in archive order.
std::vector<std::string> list_plate_gcodes(const std::string& archive);

// Part of an entry name before the first dot of its last path component:
// "Metadata/plate_2.gcode.md5" -> "Metadata/plate_2".
std::string plate_entry_base(const std::string& name);

// Replaces the plate number with 1 in the base of the entry name, leaving the
// extension chain alone: ("Metadata/plate_2.gcode.md5", 2) -> "Metadata/plate_1.gcode.md5".
std::string rename_plate_entry(const std::string& name, int plate_no);

} // namespace PandaPrint
