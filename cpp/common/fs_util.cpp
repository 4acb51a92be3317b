// cpp/common/fs_util.cpp
#include "fs_util.h"

#include <fstream>
#include <system_error>

#if defined(__linux__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "pipeline_error.h"

namespace {

#if defined(__linux__)
void fsync_path_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

void fsync_dir(const fs::path& dir) {
    const fs::path d = dir.empty() ? fs::path(".") : dir;
    int dfd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd >= 0) {
        ::fsync(dfd);
        ::close(dfd);
    }
}
#endif

} // namespace

void atomic_replace_file(const fs::path& tmp, const fs::path& dst, bool durable) {
#if defined(__linux__)
    if (durable) {
        fsync_path_file(tmp);
    }
#endif

    // rename(2) replaces dst atomically on the same filesystem
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw IoFailure("rename failed", dst.string());
    }

#if defined(__linux__)
    if (durable) {
        fsync_dir(dst.parent_path());
    }
#else
    (void)durable;
#endif
}

void write_file_bytes(const fs::path& path, std::string_view bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoFailure("cannot open for write", path.string());
    out.write(bytes.data(), (std::streamsize)bytes.size());
    out.close();
    if (!out) throw IoFailure("write failed", path.string());
}

void write_file_atomic(const fs::path& dst, std::string_view bytes, bool durable) {
    fs::path tmp = dst;
    tmp += ".tmp";
    write_file_bytes(tmp, bytes);
    atomic_replace_file(tmp, dst, durable);
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoFailure("cannot open", path.string());

    std::string data;
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    if (size > 0) {
        data.resize((std::size_t)size);
        in.seekg(0, std::ios::beg);
        in.read(data.data(), size);
        if ((std::streamoff)in.gcount() != size) throw IoFailure("short read", path.string());
    }
    return data;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw IoFailure("cannot open", path.string());

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        line.clear();
    }
    if (in.bad()) throw IoFailure("read failed", path.string());
    return lines;
}

void clear_complete_marker(const fs::path& out_dir) {
    std::error_code ec;
    fs::remove(out_dir / COMPLETE_MARKER, ec);
    if (ec) throw IoFailure("cannot remove completion marker", (out_dir / COMPLETE_MARKER).string());
}

void write_complete_marker(const fs::path& out_dir, std::string_view body) {
    write_file_atomic(out_dir / COMPLETE_MARKER, body);
}

bool has_complete_marker(const fs::path& out_dir) {
    std::error_code ec;
    return fs::is_regular_file(out_dir / COMPLETE_MARKER, ec);
}
