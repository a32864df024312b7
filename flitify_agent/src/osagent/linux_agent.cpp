#include "linux_agent.hpp"

#include "../errors.hpp"

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace flitify::osagent {

namespace {

auto& logger() {
    static auto logger = log4cplus::Logger::getInstance("flitify_agent.osagent");
    return logger;
}

// Value of a "Key:   1234 kB" line in /proc/meminfo, in bytes
int64_t read_meminfo_bytes(const std::string& key) {
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.compare(0, key.size(), key) != 0 || line.size() <= key.size() || line[key.size()] != ':') {
            continue;
        }
        std::istringstream fields(line.substr(key.size() + 1));
        int64_t kib = 0;
        fields >> kib;
        return kib * 1024;
    }
    return 0;
}

const char* entry_type(mode_t mode) {
    if (S_ISREG(mode)) return "file";
    if (S_ISDIR(mode)) return "dir";
    if (S_ISLNK(mode)) return "symlink";
    return "other";
}

} // namespace

StatusMap LinuxAgent::get_status() {
    StatusMap status;

    char hostname[256] = {0};
    if (::gethostname(hostname, sizeof(hostname) - 1) == 0) {
        status["hostname"] = std::string(hostname);
    }

    struct utsname uts {};
    if (::uname(&uts) == 0) {
        status["os"] = std::string(uts.sysname);
        status["os_release"] = std::string(uts.release);
        status["os_version"] = std::string(uts.version);
        status["machine"] = std::string(uts.machine);
    } else {
        status["os"] = std::string("Linux");
    }

    status["cpu_count"] = static_cast<int64_t>(::sysconf(_SC_NPROCESSORS_ONLN));
    status["pid"] = static_cast<int64_t>(::getpid());

    struct sysinfo info {};
    if (::sysinfo(&info) == 0) {
        constexpr double kLoadScale = 1 << SI_LOAD_SHIFT;
        status["uptime_seconds"] = static_cast<int64_t>(info.uptime);
        status["load_1"] = info.loads[0] / kLoadScale;
        status["load_5"] = info.loads[1] / kLoadScale;
        status["load_15"] = info.loads[2] / kLoadScale;
        status["memory_total"] = static_cast<int64_t>(info.totalram) * info.mem_unit;
    } else {
        LOG4CPLUS_WARN(logger(), "sysinfo failed: " << std::strerror(errno));
    }
    status["memory_available"] = read_meminfo_bytes("MemAvailable");

    struct statvfs fs {};
    if (::statvfs("/", &fs) == 0) {
        status["disk_total"] = static_cast<int64_t>(fs.f_blocks) * static_cast<int64_t>(fs.f_frsize);
        status["disk_free"] = static_cast<int64_t>(fs.f_bavail) * static_cast<int64_t>(fs.f_frsize);
    }

    return status;
}

std::vector<DirEntry> LinuxAgent::list_directory(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw NotFoundError(path + ": no such file or directory");
        }
        throw std::system_error(errno, std::generic_category(), path);
    }
    if (!S_ISDIR(st.st_mode)) {
        throw std::system_error(ENOTDIR, std::generic_category(), path);
    }

    std::vector<DirEntry> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry_path = it->path();
        struct stat entry_st {};
        if (::lstat(entry_path.c_str(), &entry_st) != 0) {
            // removed while listing
            LOG4CPLUS_DEBUG(logger(), "skipping " << entry_path.string() << ": " << std::strerror(errno));
            continue;
        }

        DirEntry entry;
        entry.name = entry_path.filename().string();
        entry.type = entry_type(entry_st.st_mode);
        entry.size = S_ISREG(entry_st.st_mode) ? static_cast<uint64_t>(entry_st.st_size) : 0;
        entry.modified = static_cast<int64_t>(entry_st.st_mtime);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        throw std::filesystem::filesystem_error("list_directory", path, ec);
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return entries;
}

} // namespace flitify::osagent
