#pragma once
#include <string>
#include <filesystem>

namespace evalbox {

// In-memory ustar writer. Used to stream files into a sandbox through
// `docker cp -` or `tar xmf -` without touching the host disk.
class TarArchive {
public:
    static constexpr size_t BLOCK_SIZE = 512;

    void add_file(const std::string& name, const std::string& data, unsigned mode = 0644);
    void add_directory(const std::string& name, unsigned mode = 0755);
    void add_symlink(const std::string& name, const std::string& target);

    // Adds `src` under `arcname`, recursing into directories.
    void add_path(const std::filesystem::path& src, const std::string& arcname);

    // Archive bytes terminated by two zero blocks.
    std::string finish() const;

    static std::string pack(const std::filesystem::path& src, const std::string& arcname);

private:
    void add_entry(const std::string& name, char typeflag, unsigned mode,
                   const std::string& data, const std::string& linkname);

    std::string buffer_;
};

}
