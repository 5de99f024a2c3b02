#include "utils/TarArchive.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <algorithm>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

// Octal field, NUL terminated, right aligned with leading zeros.
void write_octal(char* field, size_t width, unsigned long long value) {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), value);
}

void write_string(char* field, size_t width, const std::string& value) {
    std::memcpy(field, value.data(), std::min(width, value.size()));
}

// ustar stores long names as prefix (155) + '/' + name (100).
std::pair<std::string, std::string> split_name(const std::string& name) {
    if (name.size() <= 100) return {"", name};
    size_t pos = name.find('/', name.size() > 101 ? name.size() - 101 : 0);
    while (pos != std::string::npos) {
        std::string prefix = name.substr(0, pos);
        std::string rest = name.substr(pos + 1);
        if (prefix.size() <= 155 && rest.size() <= 100 && !rest.empty()) return {prefix, rest};
        pos = name.find('/', pos + 1);
    }
    throw std::runtime_error("tar: path too long for ustar: " + name);
}

std::string read_binary(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("tar: cannot read " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

void TarArchive::add_entry(const std::string& name, char typeflag, unsigned mode,
                           const std::string& data, const std::string& linkname) {
    std::array<char, BLOCK_SIZE> header{};
    auto [prefix, short_name] = split_name(name);

    long long mtime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    write_string(&header[0], 100, short_name);
    write_octal(&header[100], 8, mode & 07777);
    write_octal(&header[108], 8, 0);
    write_octal(&header[116], 8, 0);
    write_octal(&header[124], 12, data.size());
    write_octal(&header[136], 12, static_cast<unsigned long long>(mtime));
    std::memset(&header[148], ' ', 8);
    header[156] = typeflag;
    write_string(&header[157], 100, linkname);
    std::memcpy(&header[257], "ustar", 6);  // magic incl. NUL
    std::memcpy(&header[263], "00", 2);
    write_string(&header[265], 32, "root");
    write_string(&header[297], 32, "root");
    write_string(&header[345], 155, prefix);

    unsigned checksum = 0;
    for (char c : header) checksum += static_cast<unsigned char>(c);
    std::snprintf(&header[148], 8, "%06o", checksum);
    header[155] = ' ';

    buffer_.append(header.data(), header.size());
    buffer_ += data;
    size_t remainder = data.size() % BLOCK_SIZE;
    if (remainder != 0) buffer_.append(BLOCK_SIZE - remainder, '\0');
}

void TarArchive::add_file(const std::string& name, const std::string& data, unsigned mode) {
    add_entry(name, '0', mode, data, "");
}

void TarArchive::add_directory(const std::string& name, unsigned mode) {
    std::string dir_name = name;
    if (dir_name.empty() || dir_name.back() != '/') dir_name += '/';
    add_entry(dir_name, '5', mode, "", "");
}

void TarArchive::add_symlink(const std::string& name, const std::string& target) {
    if (target.size() > 100) throw std::runtime_error("tar: symlink target too long: " + target);
    add_entry(name, '2', 0777, "", target);
}

void TarArchive::add_path(const fs::path& src, const std::string& arcname) {
    auto status = fs::symlink_status(src);
    auto perms = static_cast<unsigned>(status.permissions()) & 07777;

    if (fs::is_symlink(status)) {
        add_symlink(arcname, fs::read_symlink(src).string());
        return;
    }
    if (fs::is_directory(status)) {
        add_directory(arcname, perms);
        std::vector<fs::path> children;
        for (const auto& entry : fs::directory_iterator(src)) children.push_back(entry.path());
        std::sort(children.begin(), children.end());
        for (const auto& child : children) {
            add_path(child, arcname + "/" + child.filename().string());
        }
        return;
    }
    if (fs::is_regular_file(status)) {
        add_file(arcname, read_binary(src), perms);
        return;
    }
    throw std::runtime_error("tar: unsupported file type: " + src.string());
}

std::string TarArchive::finish() const {
    std::string out = buffer_;
    out.append(2 * BLOCK_SIZE, '\0');
    return out;
}

std::string TarArchive::pack(const fs::path& src, const std::string& arcname) {
    TarArchive archive;
    archive.add_path(src, arcname);
    return archive.finish();
}

}
