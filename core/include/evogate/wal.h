#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace evogate {

// Wal: append-only JSONL file.
//
// Each append writes a single line: <json>\n
// The file is (re)opened lazily, so an append that failed because the
// parent directory was unusable succeeds once the directory is fixed.
//
// Thread-safe, with optional fsync per append.
class Wal {
public:
    explicit Wal(std::filesystem::path path);
    ~Wal();

    Wal(const Wal&) = delete;
    Wal& operator=(const Wal&) = delete;

    void set_fsync(bool enable);

    // Opens the file (creates parent dirs if needed).
    // Returns empty string on success.
    std::string open();

    bool is_open() const;

    // Appends one JSON record line (json + '\n').
    // Returns empty string on success.
    std::string append_json_line(const std::string& json);

    long long size_bytes() const;

    const std::filesystem::path& path() const { return path_; }

    // Reads all complete, non-blank lines of a JSONL file. A trailing partial
    // line (torn write) is dropped and reported through *torn_tail;
    // *complete_bytes is the length of the file up to and including the last
    // newline, i.e. where a repair should truncate.
    // Missing file is not an error (empty result).
    static std::string read_lines(const std::filesystem::path& path,
                                  std::vector<std::string>* out,
                                  bool* torn_tail = nullptr,
                                  uintmax_t* complete_bytes = nullptr);

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    mutable std::mutex mu_;

    std::string open_locked();
};

} // namespace evogate
