#include "miniz_extension.hpp"

namespace PandaPrint {

MZ_Archive::MZ_Archive()
{
    mz_zip_zero_struct(&arch);
}

std::string MZ_Archive::get_errorstr(mz_zip_error mz_err)
{
    switch (mz_err)
    {
    case MZ_ZIP_NO_ERROR:
        return "no error";
    case MZ_ZIP_UNDEFINED_ERROR:
        return "undefined error";
    case MZ_ZIP_TOO_MANY_FILES:
        return "too many files";
    case MZ_ZIP_FILE_TOO_LARGE:
        return "file too large";
    case MZ_ZIP_UNSUPPORTED_METHOD:
        return "unsupported method";
    case MZ_ZIP_UNSUPPORTED_ENCRYPTION:
        return "unsupported encryption";
    case MZ_ZIP_UNSUPPORTED_FEATURE:
        return "unsupported feature";
    case MZ_ZIP_FAILED_FINDING_CENTRAL_DIR:
        return "failed finding central directory";
    case MZ_ZIP_NOT_AN_ARCHIVE:
        return "not a ZIP archive";
    case MZ_ZIP_INVALID_HEADER_OR_CORRUPTED:
        return "invalid header or archive is corrupted";
    case MZ_ZIP_UNSUPPORTED_MULTIDISK:
        return "unsupported multidisk archive";
    case MZ_ZIP_DECOMPRESSION_FAILED:
        return "decompression failed or archive is corrupted";
    case MZ_ZIP_COMPRESSION_FAILED:
        return "compression failed";
    case MZ_ZIP_UNEXPECTED_DECOMPRESSED_SIZE:
        return "unexpected decompressed size";
    case MZ_ZIP_CRC_CHECK_FAILED:
        return "CRC-32 check failed";
    case MZ_ZIP_UNSUPPORTED_CDIR_SIZE:
        return "unsupported central directory size";
    case MZ_ZIP_ALLOC_FAILED:
        return "allocation failed";
    case MZ_ZIP_INVALID_PARAMETER:
        return "invalid parameter";
    case MZ_ZIP_INVALID_FILENAME:
        return "invalid filename";
    case MZ_ZIP_BUF_TOO_SMALL:
        return "buffer too small";
    case MZ_ZIP_INTERNAL_ERROR:
        return "internal error";
    case MZ_ZIP_FILE_NOT_FOUND:
        return "file not found";
    case MZ_ZIP_ARCHIVE_TOO_LARGE:
        return "archive is too large";
    case MZ_ZIP_VALIDATION_FAILED:
        return "validation failed";
    case MZ_ZIP_WRITE_CALLBACK_FAILED:
        return "write callback failed";
    default:
        break;
    }

    return "unknown error";
}

} // namespace PandaPrint
