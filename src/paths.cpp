// ============================================================================
// paths.cpp - implementation for paths.hpp
// ============================================================================

#include "beacon/paths.hpp"
#include "beacon/log.hpp"

#include <cstdlib>            // getenv for XDG/HOME lookups
#include <fstream>
#include <iterator>
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace beacon {

/*
 * home_or_empty()
 * ---------------
 * If $HOME is not set, fs::path("") yields a relative path; callers still
 * try to create directories and report the failure through their return.
 */
static fs::path home_or_empty() {
    const char* h = std::getenv("HOME");
    return fs::path(h ? h : "");
}

fs::path config_dir() {
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
        return fs::path(x) / "beacon";
    return home_or_empty() / ".config" / "beacon";
}

fs::path data_dir() {
    if (const char* x = std::getenv("XDG_DATA_HOME"); x && *x)
        return fs::path(x) / "beacon";
    return home_or_empty() / ".local" / "share" / "beacon";
}

bool write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);       // non-throwing; check ec
        if (ec) {
            log::Line(log::Level::Error, "fs").kv("status", "error").kv("reason", "mkdir")
                .kv("path", path.parent_path().string()).kv("detail", ec.message());
            return false;
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            log::Line(log::Level::Error, "fs").kv("status", "error").kv("reason", "open")
                .kv("path", tmp.string());
            return false;
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            log::Line(log::Level::Error, "fs").kv("status", "error").kv("reason", "write")
                .kv("path", tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path, ec);                                 // atomic on one filesystem
    if (ec) {
        log::Line(log::Level::Error, "fs").kv("status", "error").kv("reason", "rename")
            .kv("path", path.string()).kv("detail", ec.message());
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return false;
    }
    return true;
}

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

} // namespace beacon
