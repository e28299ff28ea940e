#include "utils.h"
#include "errors.h"
#include <fstream>
#include <sstream>
#include <dirent.h>
#include <sys/stat.h>
#include "glog/logging.h"

bool IsDirectory(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool IsFile(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string JoinPath(const std::string &dir, const std::string &name) {
    if (dir.empty() || dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

static bool MatchName(const std::string &name, const std::string &infix,
                      const std::string &suffix) {
    if (name.size() < infix.size() + suffix.size())
        return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
        return false;
    auto stem = name.substr(0, name.size() - suffix.size());
    return stem.find(infix) != std::string::npos;
}

std::vector<std::string> ListFiles(const std::string &dir,
                                   const std::string &infix,
                                   const std::string &suffix) {
    DIR *dir_ptr = opendir(dir.c_str());
    if (dir_ptr == nullptr) {
        LOG(ERROR) << "Cannot open directory " << dir;
        throw MissingResource("Directory " + dir + " does not exist!");
    }

    std::vector<std::string> files;
    struct dirent *entry;
    while ((entry = readdir(dir_ptr)) != nullptr) {
        std::string name(entry->d_name);
        if (name == "." || name == "..")
            continue;
        if (!MatchName(name, infix, suffix))
            continue;
        auto path = JoinPath(dir, name);
        if (!IsDirectory(path))
            files.push_back(path);
    }
    closedir(dir_ptr);
    return files;
}

std::string ReadFile(const std::string &path) {
    std::ifstream fin(path, std::ios::in | std::ios::binary);
    if (!fin || IsDirectory(path)) {
        LOG(ERROR) << "Cannot read " << path;
        throw MissingResource("File " + path + " does not exist!");
    }

    std::ostringstream sout;
    sout << fin.rdbuf();
    if (fin.bad()) {
        LOG(ERROR) << "Cannot read " << path;
        throw MissingResource("Fail reading file " + path);
    }
    return sout.str();
}
