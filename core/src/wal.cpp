#include "evogate/wal.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace evogate {

Wal::Wal(std::filesystem::path path) : path_(std::move(path)) {}

Wal::~Wal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Wal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string Wal::open_locked() {
    if (fd_ >= 0) return "";

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return std::string("open: ") + std::strerror(errno);
    }
    return "";
}

std::string Wal::open() {
    std::lock_guard<std::mutex> lk(mu_);
    return open_locked();
}

bool Wal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

std::string Wal::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    const char* p = line.data();
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, p + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string werr = std::string("write: ") + std::strerror(errno);
            // Drop the descriptor; the next append reopens.
            ::close(fd_);
            fd_ = -1;
            return werr;
        }
        off += (size_t)w;
    }

    if (fsync_) {
        if (::fsync(fd_) != 0) {
            return std::string("fsync: ") + std::strerror(errno);
        }
    }
    return "";
}

long long Wal::size_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return 0;
        return (long long)std::filesystem::file_size(path_, ec);
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return -1;
    return (long long)st.st_size;
}

std::string Wal::read_lines(const std::filesystem::path& path,
                            std::vector<std::string>* out,
                            bool* torn_tail,
                            uintmax_t* complete_bytes) {
    if (!out) return "null output";
    out->clear();
    if (torn_tail) *torn_tail = false;
    if (complete_bytes) *complete_bytes = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return "";

    std::ifstream f(path, std::ios::binary);
    if (!f) return "cannot open " + path.string();
    std::ostringstream ss;
    ss << f.rdbuf();
    const std::string body = ss.str();

    size_t start = 0;
    while (start < body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) {
            if (torn_tail) *torn_tail = true;
            break;
        }
        if (nl > start) out->push_back(body.substr(start, nl - start));
        start = nl + 1;
    }
    if (complete_bytes) *complete_bytes = start;
    return "";
}

} // namespace evogate
