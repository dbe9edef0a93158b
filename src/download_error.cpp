#include "download_error.hpp"

const char *kindName(DownloadError::Kind kind)
{
    switch (kind)
    {
    case DownloadError::Kind::InvalidUrl:
        return "InvalidURL";
    case DownloadError::Kind::TooManyRedirects:
        return "TooManyRedirects";
    case DownloadError::Kind::DownloadFailed:
        return "DownloadFailed";
    case DownloadError::Kind::Transport:
        return "TransportError";
    case DownloadError::Kind::Filesystem:
        return "FilesystemError";
    }
    return "Unknown";
}
